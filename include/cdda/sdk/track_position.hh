/**
 * @file track_position.hh
 * @brief Table of contents model
 * @ingroup sdk_toc
 */

#ifndef CDDA_SDK_TRACK_POSITION_HH
#define CDDA_SDK_TRACK_POSITION_HH

#include <cdda/sdk/types.hh>
#include <cdda/sdk/export_cdda_sdk.h>
#include <cstdint>
#include <ostream>
#include <vector>

namespace cdda {

/**
 * @defgroup sdk_toc Table of Contents
 * @ingroup sdk
 * @brief Track layout of an audio disc
 * @{
 */

/**
 * @brief Track control flags, as stored in the Q sub-channel control nibble
 */
enum track_flag : uint8_t {
    track_flag_preemphasis = 0x01,    ///< audio was mastered with 50/15 us pre-emphasis
    track_flag_copy_permitted = 0x02, ///< digital copy permitted
    track_flag_data = 0x04,           ///< data track (not audio)
    track_flag_four_channel = 0x08    ///< quadraphonic audio, never used in practice
};

/**
 * @struct track_position
 * @brief One entry of a disc's table of contents
 *
 * Track lengths include any pregap of the following track, so consecutive
 * tracks of a well-formed TOC are contiguous:
 *
 * @code
 * toc[i].end_sector() == toc[i + 1].start_sector
 * @endcode
 */
struct track_position {
    uint8_t flags = 0;          ///< bitwise OR of track_flag values
    track_num_t track_num = 0;  ///< 1-based track number
    lsn_t start_sector = 0;     ///< first sector of the track
    lsn_t length_sectors = 0;   ///< number of sectors, pregap included
    int num_channels = channels;///< 2 or 4, -1 if the driver cannot tell

    [[nodiscard]] bool is_audio() const noexcept {
        return (flags & track_flag_data) == 0;
    }

    [[nodiscard]] bool is_copy_permitted() const noexcept {
        return (flags & track_flag_copy_permitted) != 0;
    }

    [[nodiscard]] bool is_preemphasis_enabled() const noexcept {
        return (flags & track_flag_preemphasis) != 0;
    }

    /// One past the last sector of the track
    [[nodiscard]] lsn_t end_sector() const noexcept {
        return start_sector + length_sectors;
    }

    /**
     * @brief Whether @p sector falls within the track bounds
     */
    [[nodiscard]] bool contains_sector(lsn_t sector) const noexcept {
        return sector >= start_sector && sector < end_sector();
    }
};

/**
 * @typedef toc_t
 * @brief Ordered sequence of tracks, one per track on the disc
 */
using toc_t = std::vector<track_position>;

/**
 * @brief Total addressable sectors: the end of the last track
 * @return 0 for an empty TOC
 */
CDDA_SDK_EXPORT lsn_t toc_length_sectors(const toc_t& toc) noexcept;

/**
 * @brief Number of the track containing @p sector
 * @return Track number, or 0 if no track contains the sector
 */
CDDA_SDK_EXPORT track_num_t toc_track_at_sector(const toc_t& toc, lsn_t sector) noexcept;

/**
 * @brief Check ordering, contiguity and lengths of a TOC
 * @throws toc_error describing the first problem found
 */
CDDA_SDK_EXPORT void validate_toc(const toc_t& toc);

/**
 * @brief Stream output operator for track_position
 *
 * Formats the entry for debugging output.
 */
CDDA_SDK_EXPORT std::ostream& operator<<(std::ostream& os, const track_position& track);

/** @} */ // end of sdk_toc group

} // namespace cdda

#endif // CDDA_SDK_TRACK_POSITION_HH
