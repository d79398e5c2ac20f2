/**
 * @file drive_backend.hh
 * @brief Optical drive backend interface
 * @ingroup backends
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef CDDA_SDK_DRIVE_BACKEND_HH
#define CDDA_SDK_DRIVE_BACKEND_HH

#include <cdda/sdk/types.hh>
#include <cdda/sdk/track_position.hh>
#include <cdda/sdk/export_cdda_sdk.h>
#include <cstddef>
#include <memory>
#include <string>

namespace cdda {

/**
 * @brief Error detection and correction features of correcting backends
 *
 * The values match cdparanoia's PARANOIA_MODE_* bits. Flags combine with
 * bitwise OR:
 *
 * @code
 * session->set_correction_mode(correction_repair | correction_never_skip);
 * @endcode
 */
enum correction_flags : int {
    correction_disable = 0x00,    ///< no verification at all
    correction_verify = 1 << 0,
    correction_fragment = 1 << 1,
    correction_overlap = 1 << 2,
    correction_scratch = 1 << 3,
    correction_repair = 1 << 4,
    correction_never_skip = 1 << 5,
    correction_full = 0xFF        ///< every feature enabled
};

/**
 * @brief Read interfaces reported by drive_session::interface_type()
 *
 * The values match cdparanoia's interface codes.
 */
enum drive_interface : int {
    interface_generic_scsi = 0,
    interface_cooked_ioctl = 1,
    interface_test = 2,           ///< simulated drive
    interface_sgio_scsi = 3,
    interface_sgio_scsi_buggy = 4
};

/// Retries per sector used by correcting backends when none is configured
constexpr int default_max_retries = 20;

/// Upper bound for set_search_overlap()
constexpr int max_search_overlap = 75;

/**
 * @class drive_session
 * @brief An open handle to one drive holding one disc
 * @ingroup backends
 *
 * Sessions are created by drive_backend::open_session() and own the
 * underlying driver handle exclusively. Destroying a session releases the
 * hardware. A session is not copyable.
 *
 * All calls block until the drive responds. Sessions are not thread-safe.
 *
 * ## Implementing a Session
 *
 * Backends implement the do_read_sectors() hook; the public
 * read_sectors() validates the request first:
 *
 * @code
 * class my_session : public drive_session {
 * protected:
 *     void do_read_sectors(lsn_t start, uint32_t count, void* out) override {
 *         if (my_driver_read(m_handle, start, count, out) != 0) {
 *             throw driver_error(driver_status::failed, "read failed");
 *         }
 *     }
 *     // ... other methods
 * };
 * @endcode
 */
class CDDA_SDK_EXPORT drive_session {
public:
    drive_session(const drive_session&) = delete;
    drive_session& operator=(const drive_session&) = delete;

    virtual ~drive_session() = default;

    /**
     * @brief Vendor, model and revision of the drive
     * @return Best-effort description, empty if the drive does not say
     */
    virtual std::string model() = 0;

    /**
     * @brief Kernel driver family of the drive
     *
     * The Linux block device major number, e.g. 11 for SCSI CD-ROMs or 3
     * for the first IDE controller. 0 for drives with no device node.
     * @return The major number, -1 if unknown
     */
    [[nodiscard]] virtual int drive_type() const { return -1; }

    /**
     * @brief How the driver talks to the drive
     *
     * cdparanoia sessions report a drive_interface value. libcdio sessions
     * report the libcdio driver_id_t in use.
     * @return Backend specific code, -1 if unknown
     */
    [[nodiscard]] virtual int interface_type() const { return -1; }

    /**
     * @brief Number of tracks on the disc
     */
    virtual int track_count() = 0;

    /**
     * @brief Start sector of the first track
     */
    virtual lsn_t first_audio_sector() = 0;

    /**
     * @brief Read the table of contents
     * @param track_count Number of tracks to report, normally track_count()
     * @return One entry per track, ordered by start sector
     * @throws toc_error if the driver reports an invalid first track,
     *         start address or length
     * @throws driver_error on driver failure
     */
    virtual toc_t read_toc(int track_count) = 0;

    /**
     * @brief Set the read speed multiplier
     * @param multiplier 1 reads at real-time speed (75 sectors/s),
     *        full_speed as fast as possible
     * @throws driver_error if the drive refuses
     */
    virtual void set_speed(int multiplier) = 0;

    /**
     * @brief Read whole audio sectors
     *
     * @param start First sector to read
     * @param count Number of sectors, at least 1
     * @param out Destination buffer
     * @param out_size Size of @p out in bytes; must be count * bytes_per_sector
     *
     * @throws alignment_error if out_size is not exactly count sectors,
     *         before the drive is touched
     * @throws not_open_error if the session was closed
     * @throws driver_error if the drive fails to deliver every sector
     */
    void read_sectors(lsn_t start, uint32_t count, void* out, std::size_t out_size);

    /**
     * @brief Eject the disc
     *
     * The session is closed afterwards whether or not the drive complied.
     * @throws driver_error if the eject command failed
     */
    virtual void eject_media() = 0;

    /**
     * @brief Release the driver handle. Safe to call repeatedly.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /**
     * @brief Whether this session verifies and repairs what it reads
     */
    [[nodiscard]] virtual bool supports_correction() const { return false; }

    /**
     * @brief Select correction features (correction_flags)
     *
     * Ignored by sessions without correction support.
     */
    virtual void set_correction_mode(int flags) { (void)flags; }

    /**
     * @brief Minimum number of sectors searched when verifying overlap
     */
    virtual void set_search_overlap(int sectors) { (void)sectors; }

    /**
     * @brief Bound on re-reads of a failing sector
     * @param retries 0 selects default_max_retries, negative disables retries
     */
    virtual void set_max_retries(int retries) { (void)retries; }

protected:
    drive_session() = default;

    /**
     * @brief Read @p count sectors into @p out
     *
     * Called by read_sectors() once the request is known to be well
     * formed; @p out always holds count * bytes_per_sector bytes.
     */
    virtual void do_read_sectors(lsn_t start, uint32_t count, void* out) = 0;
};

/**
 * @class drive_backend
 * @brief Abstract interface for optical drive drivers
 * @ingroup backends
 *
 * A backend wraps one driver family (libcdio, cdparanoia, an in-process
 * simulation) and hands out drive_session objects.
 *
 * ## Lifecycle
 *
 * @code
 * auto backend = cdda::create_cdio_backend();
 * backend->init();
 * auto session = backend->open_session("/dev/cdrom");
 * auto toc = session->read_toc(session->track_count());
 * session.reset();          // releases the drive
 * backend->shutdown();
 * @endcode
 *
 * Only init(), get_name() and is_initialized() may be called before
 * init(); everything else throws state_error.
 */
class CDDA_SDK_EXPORT drive_backend {
public:
    virtual ~drive_backend() = default;

    /**
     * @brief Initialize the driver
     * @throws state_error if already initialized
     */
    virtual void init() = 0;

    /**
     * @brief Shut the driver down. Sessions must be released first.
     */
    virtual void shutdown() = 0;

    /**
     * @brief Backend name, e.g. "cdio", "paranoia", "null"
     */
    virtual std::string get_name() const = 0;

    virtual bool is_initialized() const = 0;

    /**
     * @brief Version of the underlying driver library
     */
    virtual std::string version() const = 0;

    /**
     * @brief Open a drive
     * @param device_hint Device path, e.g. "/dev/cdrom"; empty for the
     *        first drive found
     * @return The open session
     * @throws no_drive_error if no usable drive or disc was found
     */
    virtual std::unique_ptr<drive_session> open_session(const std::string& device_hint) = 0;

    /**
     * @brief Close the tray of a drive
     * @param device_hint Device path; empty for the default drive
     * @throws driver_error if the drive refuses
     */
    virtual void close_tray(const std::string& device_hint) = 0;
};

} // namespace cdda

#endif // CDDA_SDK_DRIVE_BACKEND_HH

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
