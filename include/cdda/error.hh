// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace cdda {

/**
 * @brief Base exception class for all cdda errors
 * @ingroup errors
 *
 * All cdda-specific exceptions derive from this class, making it easy
 * to catch all cdda errors with a single catch block.
 */
class cdda_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Drive related errors
 *
 * Base class for failures that originate in the drive or its driver.
 */
class device_error : public cdda_error {
public:
    using cdda_error::cdda_error;
};

/**
 * @brief No usable drive or medium
 *
 * Thrown by drive_backend::open_session() when no drive could be opened at
 * the requested location, or the drive holds no readable disc.
 */
class no_drive_error : public device_error {
public:
    using device_error::device_error;
};

/**
 * @brief Status codes reported by a drive driver
 *
 * The numeric values match libcdio's driver_return_code_t so backends can
 * pass them through unchanged.
 */
enum class driver_status : int {
    failed = -1,
    unsupported = -2,
    uninitialized = -3,
    not_permitted = -4,
    bad_parameter = -5,
    bad_pointer = -6,
    no_driver = -7,
    mmc_sense_data = -8
};

/**
 * @brief Name of a driver status, e.g. "bad_parameter"
 */
inline const char* to_string(driver_status status) noexcept {
    switch (status) {
        case driver_status::failed: return "failed";
        case driver_status::unsupported: return "unsupported";
        case driver_status::uninitialized: return "uninitialized";
        case driver_status::not_permitted: return "not_permitted";
        case driver_status::bad_parameter: return "bad_parameter";
        case driver_status::bad_pointer: return "bad_pointer";
        case driver_status::no_driver: return "no_driver";
        case driver_status::mmc_sense_data: return "mmc_sense_data";
    }
    return "unknown";
}

/**
 * @brief Hardware or driver failure
 *
 * Carries the driver's status code and its human-readable message verbatim.
 * The core never retries these; retry policy belongs to the backend.
 */
class driver_error : public device_error {
public:
    driver_error(driver_status status, const std::string& message)
        : device_error("driver: " + message),
          m_status(status) {}

    [[nodiscard]] driver_status status() const noexcept { return m_status; }

private:
    driver_status m_status;
};

/**
 * @brief State related errors
 *
 * Thrown when operations are attempted in invalid states, such as:
 * - Using a backend before init()
 * - Initializing a backend twice
 */
class state_error : public cdda_error {
public:
    using cdda_error::cdda_error;
};

/**
 * @brief Operation on a stream or session that is not open
 *
 * Raised locally, before any device round-trip.
 */
class not_open_error : public state_error {
public:
    not_open_error()
        : state_error("cdda: stream is not open") {}
    using state_error::state_error;
};

/**
 * @brief Kinds of malformed table of contents
 */
enum class toc_fault {
    invalid_first_track,    ///< driver reported no valid first track number
    invalid_sector_address, ///< a track start address is invalid
    zero_length_track,      ///< a track has no sectors
    unordered_tracks        ///< tracks overlap or are out of order
};

/**
 * @brief Malformed table of contents
 *
 * Invalid data is reported, never replaced with a guessed value.
 */
class toc_error : public cdda_error {
public:
    toc_error(toc_fault fault, const std::string& message)
        : cdda_error("toc: " + message),
          m_fault(fault) {}

    [[nodiscard]] toc_fault fault() const noexcept { return m_fault; }

private:
    toc_fault m_fault;
};

/**
 * @brief I/O stream related errors
 */
class io_error : public cdda_error {
public:
    using cdda_error::cdda_error;
};

/**
 * @brief Device read request not sized in whole sectors
 *
 * Rejected before any device call. Not reachable through sector_stream,
 * which aligns every request itself.
 */
class alignment_error : public io_error {
public:
    using io_error::io_error;
};

} // namespace cdda

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
