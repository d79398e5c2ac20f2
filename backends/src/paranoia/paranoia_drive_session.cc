#include "paranoia_drive_session.hh"
#include <cdda/error.hh>
#include <failsafe/failsafe.hh>
#include <cstdio>
#include <cstring>
#include <string>

namespace cdda {

paranoia_drive_session::paranoia_drive_session(CdIo_t* cdio)
    : cdio_drive_session(cdio) {
    m_drive = cdio_cddap_identify_cdio(cdio, CDDA_MESSAGE_FORGETIT, nullptr);
    if (!m_drive) {
        throw no_drive_error("cdparanoia does not support this drive");
    }
    if (cdio_cddap_open(m_drive) != 0) {
        release_reader();
        throw no_drive_error("cdparanoia cannot read the disc");
    }
    m_paranoia = cdio_paranoia_init(m_drive);
    if (!m_paranoia) {
        release_reader();
        THROW_RUNTIME("Failed to initialize cdparanoia");
    }
    LOG_DEBUG("paranoia_backend", "Drive model:", m_drive->drive_model ? m_drive->drive_model : "unknown");
}

paranoia_drive_session::~paranoia_drive_session() {
    release_reader();
}

void paranoia_drive_session::release_reader() {
    if (m_paranoia) {
        cdio_paranoia_free(m_paranoia);
        m_paranoia = nullptr;
    }
    if (m_drive) {
        // the CdIo_t handle stays with the base session
        cdio_cddap_close_no_free_cdio(m_drive);
        m_drive = nullptr;
    }
    m_cursor = -1;
}

void paranoia_drive_session::set_correction_mode(int flags) {
    if (!m_paranoia) {
        throw not_open_error();
    }
    cdio_paranoia_modeset(m_paranoia, flags);
}

void paranoia_drive_session::set_search_overlap(int sectors) {
    if (!m_paranoia) {
        throw not_open_error();
    }
    cdio_paranoia_overlapset(m_paranoia, sectors);
}

int paranoia_drive_session::drive_type() const {
    return m_drive ? m_drive->drive_type : -1;
}

int paranoia_drive_session::interface_type() const {
    return m_drive ? m_drive->interface : -1;
}

int paranoia_drive_session::retry_limit(int retries) noexcept {
    if (retries == 0) {
        return default_max_retries;
    }
    // paranoia gives up on the first failed read
    return retries < 0 ? 0 : retries;
}

void paranoia_drive_session::set_max_retries(int retries) {
    m_max_retries = retry_limit(retries);
}

void paranoia_drive_session::do_read_sectors(lsn_t start, uint32_t count, void* out) {
    if (!m_paranoia) {
        throw not_open_error();
    }
    if (m_cursor != start) {
        cdio_paranoia_seek(m_paranoia, start, SEEK_SET);
        m_cursor = start;
    }

    auto* bytes = static_cast<uint8_t*>(out);
    for (uint32_t i = 0; i < count; ++i) {
        const int16_t* sector = cdio_paranoia_read_limited(m_paranoia, nullptr, m_max_retries);
        if (!sector) {
            const lsn_t failed = m_cursor;
            m_cursor = -1;
            throw driver_error(driver_status::failed,
                               "cdparanoia gave up on sector " + std::to_string(failed));
        }
        std::memcpy(bytes + static_cast<size_t>(i) * bytes_per_sector, sector, bytes_per_sector);
        ++m_cursor;
    }
}

} // namespace cdda
