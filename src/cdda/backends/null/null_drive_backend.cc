#include "null_drive_backend.hh"
#include <cdda/error.hh>
#include <cdda/sdk/cdda_sdk_config.h>
#include <failsafe/failsafe.hh>
#include <string>

namespace cdda {

disc_layout make_disc_layout(std::initializer_list<lsn_t> track_lengths) {
    disc_layout layout;
    for (lsn_t length : track_lengths) {
        layout.tracks.push_back(null_track{length, track_flag_copy_permitted});
    }
    return layout;
}

uint8_t null_backend_sample_byte(int64_t offset) noexcept {
    // splitmix64 finalizer: white noise that is a pure function of the offset
    auto x = static_cast<uint64_t>(offset) + 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    x ^= x >> 31;
    return static_cast<uint8_t>(x);
}

std::unique_ptr<drive_backend> create_null_backend(disc_layout layout) {
    return std::make_unique<null_drive_backend>(std::move(layout));
}

// ---------------------------------------------------------------------------
// null_drive_session
// ---------------------------------------------------------------------------

null_drive_session::null_drive_session(const disc_layout& layout)
    : m_layout(layout) {
    m_end_sector = m_layout.first_sector;
    for (const auto& track : m_layout.tracks) {
        m_end_sector += track.length_sectors;
    }
}

null_drive_session::~null_drive_session() {
    close();
}

void null_drive_session::require_open() const {
    if (!m_open) {
        throw not_open_error();
    }
}

std::string null_drive_session::model() {
    return m_open ? m_layout.model : std::string();
}

int null_drive_session::drive_type() const {
    return m_open ? m_layout.drive_type : -1;
}

int null_drive_session::interface_type() const {
    return m_open ? m_layout.interface_type : -1;
}

int null_drive_session::track_count() {
    require_open();
    return static_cast<int>(m_layout.tracks.size());
}

lsn_t null_drive_session::first_audio_sector() {
    require_open();
    return m_layout.first_sector;
}

toc_t null_drive_session::read_toc(int track_count) {
    require_open();
    if (track_count < 0 || track_count > static_cast<int>(m_layout.tracks.size())) {
        throw driver_error(driver_status::bad_parameter,
                           "track count " + std::to_string(track_count) + " exceeds disc");
    }

    toc_t toc;
    toc.reserve(static_cast<size_t>(track_count));
    lsn_t start = m_layout.first_sector;
    for (int i = 0; i < track_count; ++i) {
        const auto& layout_track = m_layout.tracks[static_cast<size_t>(i)];
        track_position track;
        track.track_num = i + 1;
        track.flags = layout_track.flags;
        track.start_sector = start;
        track.length_sectors = layout_track.length_sectors;
        track.num_channels = channels;
        toc.push_back(track);
        start += layout_track.length_sectors;
    }
    validate_toc(toc);
    return toc;
}

void null_drive_session::set_speed(int multiplier) {
    require_open();
    if (multiplier == 0 || multiplier < full_speed) {
        throw driver_error(driver_status::bad_parameter, "invalid speed " + std::to_string(multiplier));
    }
}

void null_drive_session::do_read_sectors(lsn_t start, uint32_t count, void* out) {
    if (start < 0 || static_cast<int64_t>(start) + count > m_end_sector) {
        throw driver_error(driver_status::bad_parameter,
                           "sectors " + std::to_string(start) + "+" + std::to_string(count)
                           + " outside disc of " + std::to_string(m_end_sector) + " sectors");
    }

    auto* bytes = static_cast<uint8_t*>(out);
    const int64_t base = sector_to_bytes(start);
    const int64_t size = sector_to_bytes(count);
    for (int64_t i = 0; i < size; ++i) {
        bytes[i] = null_backend_sample_byte(base + i);
    }
}

void null_drive_session::eject_media() {
    require_open();
    LOG_INFO("null_backend", "Ejecting simulated disc");
    close();
}

void null_drive_session::close() {
    m_open = false;
}

bool null_drive_session::is_open() const {
    return m_open;
}

// ---------------------------------------------------------------------------
// null_drive_backend
// ---------------------------------------------------------------------------

null_drive_backend::null_drive_backend(disc_layout layout)
    : m_layout(std::move(layout)) {
}

void null_drive_backend::init() {
    if (m_initialized) {
        throw state_error("Null backend already initialized");
    }
    m_initialized = true;
}

void null_drive_backend::shutdown() {
    m_initialized = false;
}

std::string null_drive_backend::version() const {
    return CDDA_VERSION_STRING;
}

std::unique_ptr<drive_session> null_drive_backend::open_session(const std::string& device_hint) {
    if (!m_initialized) {
        throw state_error("Backend not initialized");
    }
    if (m_layout.tracks.empty()) {
        throw no_drive_error("No disc in simulated drive " + (device_hint.empty() ? std::string("(default)") : device_hint));
    }
    return std::make_unique<null_drive_session>(m_layout);
}

void null_drive_backend::close_tray(const std::string&) {
    if (!m_initialized) {
        throw state_error("Backend not initialized");
    }
}

} // namespace cdda
