/**
 * @file cdio_drive_session.cc
 * @brief libcdio drive session implementation
 * @ingroup cdio_backend
 */

#include "cdio_drive_session.hh"
#include <cdda/error.hh>
#include <cdda/sdk/endian.hh>
#include <failsafe/failsafe.hh>
#include <cstring>

#if defined(__linux__)
#include <sys/stat.h>
#include <sys/sysmacros.h>
#endif

namespace cdda {
    namespace {
        std::string trimmed(const char* text) {
            std::string s(text);
            const auto last = s.find_last_not_of(" \t");
            return last == std::string::npos ? std::string() : s.substr(0, last + 1);
        }

        std::string drive_label(const std::string& device_hint) {
            return device_hint.empty() ? std::string("(default)") : device_hint;
        }
    }

    CdIo_t* cdio_drive_session::open_handle(const std::string& device_hint) {
        CdIo_t* cdio = cdio_open(device_hint.empty() ? nullptr : device_hint.c_str(), DRIVER_DEVICE);
        if (!cdio) {
            throw no_drive_error("Cannot open CD drive " + drive_label(device_hint));
        }
        if (cdio_get_num_tracks(cdio) == CDIO_INVALID_TRACK) {
            cdio_destroy(cdio);
            throw no_drive_error("No readable disc in drive " + drive_label(device_hint));
        }
        return cdio;
    }

    void cdio_drive_session::check(driver_return_code_t rc, const std::string& context) {
        if (rc != DRIVER_OP_SUCCESS) {
            const char* message = cdio_driver_errmsg(rc);
            throw driver_error(static_cast<driver_status>(rc),
                               context + ": " + (message ? message : "unknown driver error"));
        }
    }

    cdio_drive_session::cdio_drive_session(CdIo_t* cdio)
        : m_cdio(cdio) {
    }

    cdio_drive_session::~cdio_drive_session() {
        close();
    }

    void cdio_drive_session::require_open() const {
        if (!m_cdio) {
            throw not_open_error();
        }
    }

    std::string cdio_drive_session::model() {
        if (!m_cdio) {
            return "";
        }
        cdio_hwinfo_t hwinfo;
        std::memset(&hwinfo, 0, sizeof(hwinfo));
        if (!cdio_get_hwinfo(m_cdio, &hwinfo)) {
            return "";
        }

        std::string result;
        for (const char* part : {hwinfo.psz_vendor, hwinfo.psz_model, hwinfo.psz_revision}) {
            auto text = trimmed(part);
            if (text.empty()) {
                continue;
            }
            if (!result.empty()) {
                result += ' ';
            }
            result += text;
        }
        return result;
    }

    int cdio_drive_session::drive_type() const {
#if defined(__linux__)
        if (!m_cdio) {
            return -1;
        }
        const char* source = cdio_get_arg(m_cdio, "source");
        struct stat st;
        if (!source || ::stat(source, &st) != 0 || !S_ISBLK(st.st_mode)) {
            return -1;
        }
        return static_cast<int>(major(st.st_rdev));
#else
        return -1;
#endif
    }

    int cdio_drive_session::interface_type() const {
        if (!m_cdio) {
            return -1;
        }
        return static_cast<int>(cdio_get_driver_id(m_cdio));
    }

    int cdio_drive_session::track_count() {
        require_open();
        const track_t count = cdio_get_num_tracks(m_cdio);
        if (count == CDIO_INVALID_TRACK) {
            throw driver_error(driver_status::failed, "Cannot read number of tracks");
        }
        return static_cast<int>(count);
    }

    track_t cdio_drive_session::first_track() const {
        const track_t first = cdio_get_first_track_num(m_cdio);
        if (first == CDIO_INVALID_TRACK) {
            throw toc_error(toc_fault::invalid_first_track, "libcdio reports no first track");
        }
        return first;
    }

    lsn_t cdio_drive_session::first_audio_sector() {
        require_open();
        const track_t first = first_track();
        const track_t count = static_cast<track_t>(track_count());
        for (track_t i = 0; i < count; ++i) {
            const auto track = static_cast<track_t>(first + i);
            if (cdio_get_track_format(m_cdio, track) == TRACK_FORMAT_AUDIO) {
                const lsn_t start = cdio_get_track_lsn(m_cdio, track);
                if (start == CDIO_INVALID_LSN) {
                    throw toc_error(toc_fault::invalid_sector_address,
                                    "Invalid start of track " + std::to_string(track));
                }
                return start;
            }
        }
        throw cdda_error("Disc has no audio track");
    }

    toc_t cdio_drive_session::read_toc(int track_count) {
        require_open();
        const track_t first = first_track();

        toc_t toc;
        toc.reserve(static_cast<size_t>(track_count));
        for (int i = 0; i < track_count; ++i) {
            const auto track = static_cast<track_t>(first + i);
            track_position position;
            position.track_num = static_cast<int>(track);

            const int track_channels = cdio_get_track_channels(m_cdio, track);
            position.num_channels = track_channels > 0 ? track_channels : -1;
            if (track_channels == 4) {
                position.flags |= track_flag_four_channel;
            }
            if (cdio_get_track_copy_permit(m_cdio, track) == CDIO_TRACK_FLAG_TRUE) {
                position.flags |= track_flag_copy_permitted;
            }
            if (cdio_get_track_preemphasis(m_cdio, track) == CDIO_TRACK_FLAG_TRUE) {
                position.flags |= track_flag_preemphasis;
            }
            if (cdio_get_track_format(m_cdio, track) != TRACK_FORMAT_AUDIO) {
                position.flags |= track_flag_data;
            }

            position.start_sector = cdio_get_track_lsn(m_cdio, track);
            if (position.start_sector == CDIO_INVALID_LSN) {
                throw toc_error(toc_fault::invalid_sector_address,
                                "Invalid start of track " + std::to_string(position.track_num));
            }
            // includes the pregap of the following track
            position.length_sectors = static_cast<lsn_t>(cdio_get_track_sec_count(m_cdio, track));
            if (position.length_sectors == 0) {
                throw toc_error(toc_fault::zero_length_track,
                                "Track " + std::to_string(position.track_num) + " has no sectors");
            }
            toc.push_back(position);
        }
        validate_toc(toc);
        return toc;
    }

    void cdio_drive_session::set_speed(int multiplier) {
        require_open();
        check(cdio_set_speed(m_cdio, multiplier), "Cannot set speed " + std::to_string(multiplier));
    }

    void cdio_drive_session::do_read_sectors(lsn_t start, uint32_t count, void* out) {
        check(cdio_read_audio_sectors(m_cdio, out, start, count),
              "Cannot read " + std::to_string(count) + " sectors at " + std::to_string(start));

        // READ CD delivers little-endian samples
        if (is_big_endian) {
            auto* samples = static_cast<uint16_t*>(out);
            const size_t n = static_cast<size_t>(count) * bytes_per_sector / sizeof(uint16_t);
            for (size_t i = 0; i < n; ++i) {
                samples[i] = swap16le(samples[i]);
            }
        }
    }

    void cdio_drive_session::eject_media() {
        require_open();
        release_reader();
        // libcdio frees the handle once the tray opened
        CdIo_t* cdio = m_cdio;
        const driver_return_code_t rc = cdio_eject_media(&cdio);
        if (!cdio) {
            m_cdio = nullptr;
        }
        if (rc == DRIVER_OP_SUCCESS) {
            LOG_INFO("cdio_backend", "Disc ejected");
            return;
        }
        close();
        check(rc, "Cannot eject disc");
    }

    void cdio_drive_session::close() {
        if (m_cdio) {
            release_reader();
            cdio_destroy(m_cdio);
            m_cdio = nullptr;
        }
    }

    bool cdio_drive_session::is_open() const {
        return m_cdio != nullptr;
    }

} // namespace cdda
