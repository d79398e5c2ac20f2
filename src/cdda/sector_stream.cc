//
// Sector-addressed buffered reader over a drive_session.
//

#include <cdda/sector_stream.hh>
#include <cdda/error.hh>
#include <cdda/sdk/cdda_sdk_config.h>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace cdda {

sector_stream::sector_stream(std::shared_ptr<drive_backend> backend, stream_options options)
    : m_backend(std::move(backend)),
      m_options(std::move(options)) {
}

sector_stream::~sector_stream() {
    close();
}

sector_stream::sector_stream(sector_stream&&) noexcept = default;
sector_stream& sector_stream::operator=(sector_stream&&) noexcept = default;

void sector_stream::open() {
    if (is_open()) {
        return;
    }
    if (!m_backend) {
        THROW_RUNTIME("No drive backend provided to sector_stream");
    }
    if (!m_backend->is_initialized()) {
        m_backend->init();
    }

    // the session releases the drive by itself if configuring it fails
    auto session = m_backend->open_session(m_options.device);
    session->set_max_retries(m_options.max_retries);
    session->set_correction_mode(m_options.correction);
    session->set_speed(m_options.speed);

    m_session = std::move(session);
    drop_buffered();
    reset_positions();
    m_disc_sectors = -1;
    m_deferred_error = nullptr;

    LOG_INFO("sector_stream", "Opened drive", m_options.device.empty() ? "(default)" : m_options.device,
             "via", m_backend->get_name(), "model:", m_session->model());
}

void sector_stream::close() {
    if (m_session) {
        m_session->close();
        m_session.reset();
        LOG_INFO("sector_stream", "Closed drive");
    }
    drop_buffered();
    reset_positions();
    m_disc_sectors = -1;
    m_deferred_error = nullptr;
}

bool sector_stream::is_open() const {
    return m_session && m_session->is_open();
}

void sector_stream::require_open() const {
    if (!is_open()) {
        throw not_open_error();
    }
}

lsn_t sector_stream::disc_end() {
    if (m_disc_sectors < 0) {
        m_disc_sectors = toc_length_sectors(toc());
    }
    return m_disc_sectors;
}

size_t sector_stream::read(void* ptr, size_t size_bytes) {
    require_open();
    if (m_deferred_error) {
        auto error = std::exchange(m_deferred_error, nullptr);
        std::rethrow_exception(error);
    }
    if (size_bytes == 0) {
        return 0;
    }

    auto* out = static_cast<uint8_t*>(ptr);
    size_t copied = 0;
    while (copied < size_bytes) {
        const size_t available = buffered_bytes();
        if (available > 0) {
            const size_t chunk = std::min(size_bytes - copied, available);
            std::memcpy(out + copied, m_pending.data() + m_pending_pos, chunk);
            discard_buffered(chunk);
            m_true_offset += static_cast<int64_t>(chunk);
            copied += chunk;
            continue;
        }

        const lsn_t end = disc_end();
        if (m_buffered_offset >= sector_to_bytes(end)) {
            break;
        }
        const lsn_t next_sector = sector_of(m_buffered_offset);
        const size_t wanted = sectors_covering(size_bytes - copied);
        const size_t sectors = std::min(wanted, static_cast<size_t>(end - next_sector));
        try {
            buffer_sectors(sectors);
        } catch (const std::exception& e) {
            if (copied == 0) {
                throw;
            }
            LOG_ERROR("sector_stream", "Read failed at sector", next_sector, "after", copied, "bytes:", e.what());
            m_deferred_error = std::current_exception();
            break;
        }
    }
    return copied;
}

size_t sector_stream::write(const void*, size_t) {
    return 0;
}

int64_t sector_stream::seek(int64_t offset, seek_origin whence) {
    require_open();

    int64_t base = 0;
    switch (whence) {
        case seek_origin::set:
            base = 0;
            break;
        case seek_origin::cur:
            base = m_true_offset;
            break;
        case seek_origin::end:
            base = sector_to_bytes(length_sectors());
            break;
    }
    if (offset > 0 && base > std::numeric_limits<int64_t>::max() - offset) {
        throw std::invalid_argument("cdda: seek offset overflows");
    }
    const int64_t new_offset = base + offset;

    if (new_offset < 0) {
        throw std::invalid_argument("cdda: seek to negative offset " + std::to_string(new_offset));
    }
    if (new_offset == m_true_offset) {
        return m_true_offset;
    }
    // a failure deferred by a partial read belongs to the old position
    m_deferred_error = nullptr;

    if (new_offset > m_true_offset && new_offset < m_buffered_offset) {
        discard_buffered(static_cast<size_t>(new_offset - m_true_offset));
        m_true_offset = new_offset;
        return m_true_offset;
    }

    // wipe the buffer and reposition on the sector holding the target
    drop_buffered();
    m_true_offset = m_buffered_offset;
    const int64_t sector_offset = sector_floor(new_offset);
    LOG_DEBUG("sector_stream", "Seek to", new_offset, "repositions to sector", sector_of(sector_offset));

    if (sector_offset >= sector_to_bytes(disc_end())) {
        m_buffered_offset = new_offset;
        m_true_offset = new_offset;
        return m_true_offset;
    }

    m_buffered_offset = sector_offset;
    m_true_offset = sector_offset;
    buffer_sectors(1);

    // advance to the sub-sector offset
    discard_buffered(static_cast<size_t>(new_offset - sector_offset));
    m_true_offset = new_offset;
    return m_true_offset;
}

int64_t sector_stream::seek_to_sector(lsn_t sector) {
    return seek(sector_to_bytes(sector), seek_origin::set);
}

int64_t sector_stream::tell() {
    return is_open() ? m_true_offset : -1;
}

int64_t sector_stream::get_size() {
    if (!is_open()) {
        return -1;
    }
    return sector_to_bytes(disc_end());
}

toc_t sector_stream::toc() {
    require_open();
    auto result = m_session->read_toc(m_session->track_count());
    m_disc_sectors = toc_length_sectors(result);
    return result;
}

lsn_t sector_stream::length_sectors() {
    return toc_length_sectors(toc());
}

track_num_t sector_stream::track_at_sector(lsn_t sector) {
    if (!is_open()) {
        return -1;
    }
    return toc_track_at_sector(toc(), sector);
}

int sector_stream::track_count() {
    if (!is_open()) {
        return -1;
    }
    return m_session->track_count();
}

lsn_t sector_stream::first_audio_sector() {
    if (!is_open()) {
        return -1;
    }
    return m_session->first_audio_sector();
}

std::string sector_stream::model() {
    if (!is_open()) {
        return "";
    }
    return m_session->model();
}

int sector_stream::drive_type() const {
    return is_open() ? m_session->drive_type() : -1;
}

int sector_stream::interface_type() const {
    return is_open() ? m_session->interface_type() : -1;
}

void sector_stream::set_speed(int multiplier) {
    require_open();
    m_session->set_speed(multiplier);
    m_options.speed = multiplier;
    LOG_INFO("sector_stream", "Read speed set to", multiplier == full_speed ? std::string("full") : std::to_string(multiplier) + "x");
}

void sector_stream::set_correction_mode(int flags) {
    m_options.correction = flags;
    if (is_open()) {
        m_session->set_correction_mode(flags);
    }
}

void sector_stream::force_search_overlap(int sectors) {
    require_open();
    if (sectors < 0 || sectors > max_search_overlap) {
        throw std::invalid_argument("cdda: search overlap sectors must be 0 <= n <= 75");
    }
    m_session->set_search_overlap(sectors);
}

void sector_stream::eject_media() {
    require_open();
    std::exception_ptr failure;
    try {
        m_session->eject_media();
    } catch (const std::exception& e) {
        LOG_WARN("sector_stream", "Eject failed:", e.what());
        failure = std::current_exception();
    }
    close();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

void sector_stream::close_tray() {
    if (!m_backend) {
        THROW_RUNTIME("No drive backend provided to sector_stream");
    }
    if (!m_backend->is_initialized()) {
        m_backend->init();
    }
    m_backend->close_tray(m_options.device);
}

std::size_t sector_stream::buffered_bytes() const noexcept {
    return m_pending.size() - m_pending_pos;
}

void sector_stream::buffer_sectors(std::size_t sector_count) {
    const std::size_t bytes = sector_count * bytes_per_sector;
    if (m_scratch.size() < bytes) {
        m_scratch.reset(bytes);
    }
    m_session->read_sectors(sector_of(m_buffered_offset), static_cast<uint32_t>(sector_count),
                            m_scratch.data(), bytes);
    m_buffered_offset += static_cast<int64_t>(bytes);
    append_buffered(m_scratch.data(), bytes);
}

void sector_stream::append_buffered(const uint8_t* data, std::size_t size) {
    if (m_pending_pos > 0) {
        m_pending.erase(m_pending.begin(), m_pending.begin() + static_cast<std::ptrdiff_t>(m_pending_pos));
        m_pending_pos = 0;
    }
    m_pending.insert(m_pending.end(), data, data + size);
}

void sector_stream::discard_buffered(std::size_t size) {
    m_pending_pos += std::min(size, buffered_bytes());
    if (m_pending_pos == m_pending.size()) {
        drop_buffered();
    }
}

void sector_stream::drop_buffered() noexcept {
    m_pending.clear();
    m_pending_pos = 0;
}

void sector_stream::reset_positions() noexcept {
    m_buffered_offset = 0;
    m_true_offset = 0;
}

const char* version() noexcept {
    return CDDA_VERSION_STRING;
}

} // namespace cdda
