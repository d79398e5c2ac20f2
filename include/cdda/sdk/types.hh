/**
 * @file types.hh
 * @brief Redbook audio constants and sector arithmetic
 * @ingroup sdk_types
 */

#ifndef CDDA_SDK_TYPES_H
#define CDDA_SDK_TYPES_H

#include <cstdint>
#include <cstddef>

namespace cdda {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Physical format of Redbook (CD-DA) audio
 *
 * Every audio CD carries the same PCM format: 44.1 kHz, 16-bit signed
 * samples, two interleaved channels. The disc is addressed in sectors of
 * 1/75th of a second. None of these values are configurable; they describe
 * the medium, not the program.
 *
 * ## Terminology
 *
 * A *sector* here is the same thing as a Redbook timecode *frame* (the FF in
 * MM:SS:FF). It is distinct from the 33-byte channel data frame, which this
 * library never sees.
 *
 * @code
 * // byte offset of the start of sector 150 (2 seconds into the disc)
 * int64_t pos = cdda::sector_to_bytes(150);
 *
 * // sector holding an arbitrary byte
 * lsn_t s = cdda::sector_of(pos + 17);  // 150
 * @endcode
 *
 * @{
 */

/**
 * @typedef lsn_t
 * @brief Logical sector number
 *
 * Signed because drivers report invalid addresses with negative sentinels.
 */
using lsn_t = int32_t;

/**
 * @typedef track_num_t
 * @brief Track number, 1-based. 0 means "no track".
 */
using track_num_t = int;

/// Samples per second per channel
constexpr int sample_rate = 44100;

/// Samples are signed 16-bit
constexpr int bits_per_sample = 16;
constexpr int bytes_per_sample = bits_per_sample / 8;

/**
 * Number of audio channels. All Redbook audio is stereo; the four-channel
 * flag of the TOC was specified but never deployed.
 */
constexpr int channels = 2;

/// Sectors (timecode frames) per second of audio
constexpr int sectors_per_second = 75;

/// Stereo sample frames in one sector (588)
constexpr int samples_per_sector = sample_rate / sectors_per_second;

/// Bytes of PCM in one sector (2352). The unit of every device read.
constexpr int bytes_per_sector = sample_rate * channels * bytes_per_sample / sectors_per_second;

/// The CD-DA format allows at most 99 tracks
constexpr int max_tracks = 99;

/// Speed multiplier meaning "as fast as the drive can go"
constexpr int full_speed = -1;

static_assert(bytes_per_sector == 2352, "Redbook sector size");

/**
 * @brief Largest sector boundary not after the given byte offset
 * @param byte_offset Non-negative byte offset
 */
constexpr int64_t sector_floor(int64_t byte_offset) noexcept {
    return byte_offset - (byte_offset % bytes_per_sector);
}

/**
 * @brief Sector containing the given byte offset
 */
constexpr lsn_t sector_of(int64_t byte_offset) noexcept {
    return static_cast<lsn_t>(byte_offset / bytes_per_sector);
}

/**
 * @brief Byte offset of the first byte of a sector
 */
constexpr int64_t sector_to_bytes(int64_t sector) noexcept {
    return sector * bytes_per_sector;
}

/**
 * @brief Number of whole sectors fetched to serve a request of @p bytes
 *
 * Always one more than the number of complete sectors in the request.
 */
constexpr std::size_t sectors_covering(std::size_t bytes) noexcept {
    return bytes / bytes_per_sector + 1;
}

constexpr bool is_sector_aligned(std::size_t bytes) noexcept {
    return bytes % bytes_per_sector == 0;
}

/** @} */ // end of sdk_types group

} // namespace cdda

#endif // CDDA_SDK_TYPES_H
