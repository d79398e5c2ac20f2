/**
 * @file sector_stream.hh
 * @brief Seekable PCM stream over an audio CD
 * @ingroup streams
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef CDDA_SECTOR_STREAM_HH
#define CDDA_SECTOR_STREAM_HH

#include <cdda/sdk/types.hh>
#include <cdda/sdk/buffer.hh>
#include <cdda/sdk/io_stream.hh>
#include <cdda/sdk/drive_backend.hh>
#include <cdda/sdk/track_position.hh>
#include <cdda/export_cdda.h>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace cdda {

/**
 * @struct stream_options
 * @brief Settings applied when a sector_stream opens its drive
 * @ingroup streams
 */
struct stream_options {
    std::string device;               ///< device path, e.g. "/dev/cdrom"; empty for the first drive found
    int max_retries = 0;              ///< re-reads per failing sector; 0 = default_max_retries, negative disables
    int correction = correction_full; ///< correction_flags for correcting backends
    int speed = full_speed;           ///< read speed multiplier
};

/**
 * @class sector_stream
 * @brief Byte-addressed, seekable reader of CD-DA audio
 * @ingroup streams
 *
 * The stream presents the disc as one contiguous run of PCM bytes: signed
 * 16-bit samples in host byte order, two interleaved channels, 44.1 kHz.
 * Byte 0 is the first byte of sector 0.
 *
 * Drives only read whole sectors. The stream turns arbitrary reads and
 * seeks into sector reads and keeps the unconsumed tail of the last
 * sectors read in a read-ahead buffer, so sub-sector reads and short
 * forward seeks are served without touching the drive.
 *
 * ## Usage
 *
 * @code
 * cdda::sector_stream cd(cdda::create_default_drive_backend());
 * cd.open();
 * auto toc = cd.toc();
 * cd.seek_to_sector(toc[1].start_sector);      // start of track 2
 * std::vector<uint8_t> pcm(cdda::bytes_per_sector);
 * for (lsn_t i = 0; i < toc[1].length_sectors; ++i) {
 *     cd.read(pcm.data(), pcm.size());
 *     // ...
 * }
 * cd.close();
 * @endcode
 *
 * ## Position bookkeeping
 *
 * - tell() is the logical cursor exposed to the caller.
 * - buffered_offset() is how far the drive has been read.
 * - buffered_offset() - tell() == buffered_bytes() at all times.
 *
 * ## Thread Safety
 *
 * None. Every call runs on the caller's thread and may block for as long
 * as the drive takes to respond. Serialize access externally, or open one
 * stream per drive.
 *
 * @note "Open" and "close" refer to the drive session, never the tray.
 */
class CDDA_EXPORT sector_stream : public io_stream {
public:
    /**
     * @param backend Driver used to reach the drive; initialized on open()
     *        if the caller has not done so
     * @param options Device selection and read settings
     */
    explicit sector_stream(std::shared_ptr<drive_backend> backend, stream_options options = {});
    ~sector_stream() override;

    sector_stream(const sector_stream&) = delete;
    sector_stream& operator=(const sector_stream&) = delete;
    sector_stream(sector_stream&&) noexcept;
    sector_stream& operator=(sector_stream&&) noexcept;

    /**
     * @brief Open the drive and prepare for reading
     *
     * Does nothing if already open. Sets the configured speed and correction
     * options and positions the stream at byte 0.
     *
     * @throws no_drive_error if no drive or disc was found
     * @throws driver_error if the drive rejects the configured speed
     */
    void open();

    /**
     * @brief Release the drive and drop buffered data. Safe on a closed stream.
     */
    void close() override;

    [[nodiscard]] bool is_open() const override;

    /**
     * @brief Read PCM bytes
     *
     * Fills @p ptr completely unless the end of the disc is reached. Bytes
     * already buffered are used first; the drive is then asked for whole
     * sectors covering the rest of the request, and the unused tail of the
     * last sector stays buffered for the next call.
     *
     * If the drive fails after part of the request was copied, the partial
     * count is returned and the failure is thrown by the next call, unless
     * a seek moves the cursor first.
     *
     * @return Bytes copied; 0 at the end of the disc
     * @throws not_open_error if the stream is not open
     * @throws driver_error if the drive fails before any byte was copied
     */
    size_t read(void* ptr, size_t size_bytes) override;

    /**
     * @brief Not supported; always returns 0
     */
    size_t write(const void* ptr, size_t size_bytes) override;

    /**
     * @brief Move the cursor to an arbitrary byte offset
     *
     * Forward moves within the buffered data cost nothing. Anything else
     * drops the buffer and reads the one sector that holds the target byte.
     * Seeking past the end of the disc is allowed; reads there return 0.
     *
     * @return New absolute offset
     * @throws not_open_error if the stream is not open
     * @throws std::invalid_argument if the target is before byte 0 or
     *         does not fit in 64 bits
     * @throws driver_error if the target sector cannot be read; the cursor
     *         is then left on the sector boundary with nothing buffered
     */
    int64_t seek(int64_t offset, seek_origin whence) override;

    /**
     * @brief Seek to the first byte of a sector, e.g. a track start
     */
    int64_t seek_to_sector(lsn_t sector);

    /**
     * @return Current byte offset, -1 if not open
     */
    int64_t tell() override;

    /**
     * @return Disc length in bytes, -1 if not open
     */
    int64_t get_size() override;

    /**
     * @brief Read the table of contents from the drive
     *
     * Asks the drive on every call.
     * @throws not_open_error, toc_error, driver_error
     */
    toc_t toc();

    /**
     * @brief Sectors on the disc: the end of the last track
     */
    lsn_t length_sectors();

    /**
     * @brief Number of the track containing @p sector
     * @return -1 if not open, 0 if no track contains the sector
     */
    track_num_t track_at_sector(lsn_t sector);

    /**
     * @return Number of tracks (at most 99), -1 if not open
     */
    int track_count();

    /**
     * @return Start sector of the first track, -1 if not open
     */
    lsn_t first_audio_sector();

    /**
     * @return Drive vendor and model, empty if not open or unknown
     */
    std::string model();

    /**
     * @return Kernel driver family of the drive (see drive_session::drive_type()),
     *         -1 if not open or unknown
     */
    int drive_type() const;

    /**
     * @return Driver interface code (see drive_session::interface_type()),
     *         -1 if not open or unknown
     */
    int interface_type() const;

    /**
     * @brief Change the read speed multiplier
     * @param multiplier 1 for real-time, full_speed for the drive's maximum
     */
    void set_speed(int multiplier);

    /**
     * @brief Select error correction features (correction_flags)
     *
     * Applies immediately if open, otherwise on the next open().
     */
    void set_correction_mode(int flags);

    /**
     * @brief Minimum sectors searched when verifying overlaps
     * @throws std::invalid_argument unless 0 <= sectors <= 75
     */
    void force_search_overlap(int sectors);

    /**
     * @brief Eject the disc and close the stream
     *
     * The stream is closed even if the drive refuses to eject; the refusal
     * is still reported.
     */
    void eject_media();

    /**
     * @brief Close the tray of the configured drive. Works on a closed stream.
     */
    void close_tray();

    /// Unread bytes held in the read-ahead buffer
    [[nodiscard]] std::size_t buffered_bytes() const noexcept;

    /// Byte offset up to which the drive has been read
    [[nodiscard]] int64_t buffered_offset() const noexcept { return m_buffered_offset; }

    [[nodiscard]] const stream_options& options() const noexcept { return m_options; }

private:
    void require_open() const;
    lsn_t disc_end();
    void buffer_sectors(std::size_t sector_count);
    void append_buffered(const uint8_t* data, std::size_t size);
    void discard_buffered(std::size_t size);
    void drop_buffered() noexcept;
    void reset_positions() noexcept;

    std::shared_ptr<drive_backend> m_backend;
    stream_options m_options;
    std::unique_ptr<drive_session> m_session;

    std::vector<uint8_t> m_pending;   // read-ahead, consumed from m_pending_pos
    std::size_t m_pending_pos = 0;
    buffer<uint8_t> m_scratch;        // device transfer area, grows only

    int64_t m_buffered_offset = 0;
    int64_t m_true_offset = 0;
    lsn_t m_disc_sectors = -1;        // cached from the first TOC read of a session

    std::exception_ptr m_deferred_error;
};

/**
 * @brief Create the best drive backend this build provides
 *
 * Prefers the error-correcting paranoia backend, then plain libcdio, then
 * the null backend with no disc.
 */
CDDA_EXPORT std::shared_ptr<drive_backend> create_default_drive_backend();

/**
 * @brief Library version, e.g. "1.0.0"
 */
CDDA_EXPORT const char* version() noexcept;

} // namespace cdda

#endif // CDDA_SECTOR_STREAM_HH

/*
 * Copyright (C) 2025
 *
 * This file is part of cdda.
 *
 * cdda is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * cdda is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with cdda.  If not, see <http://www.gnu.org/licenses/>.
 */
