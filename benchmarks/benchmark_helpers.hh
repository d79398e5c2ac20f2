#ifndef CDDA_BENCHMARK_HELPERS_HH
#define CDDA_BENCHMARK_HELPERS_HH

#include <cdda/sector_stream.hh>
#include <cdda/sdk/drive_backend.hh>
#include <cstring>
#include <memory>
#include <string>

namespace cdda::benchmark {

// Drive that answers instantly with silence, so only stream overhead is measured
class benchmark_session : public drive_session {
    lsn_t m_sectors;
    bool m_open = true;

public:
    explicit benchmark_session(lsn_t sectors) : m_sectors(sectors) {}

    std::string model() override { return "BENCHMARK"; }
    int track_count() override { return 1; }
    lsn_t first_audio_sector() override { return 0; }
    toc_t read_toc(int /*track_count*/) override {
        track_position track;
        track.track_num = 1;
        track.length_sectors = m_sectors;
        return {track};
    }
    void set_speed(int /*multiplier*/) override {}
    void eject_media() override { m_open = false; }
    void close() override { m_open = false; }
    bool is_open() const override { return m_open; }

protected:
    void do_read_sectors(lsn_t /*start*/, uint32_t count, void* out) override {
        std::memset(out, 0, static_cast<size_t>(count) * bytes_per_sector);
    }
};

class benchmark_backend : public drive_backend {
    lsn_t m_sectors;
    bool m_initialized = false;

public:
    explicit benchmark_backend(lsn_t sectors) : m_sectors(sectors) {}

    void init() override { m_initialized = true; }
    void shutdown() override { m_initialized = false; }
    std::string get_name() const override { return "benchmark"; }
    bool is_initialized() const override { return m_initialized; }
    std::string version() const override { return "0"; }
    std::unique_ptr<drive_session> open_session(const std::string& /*hint*/) override {
        return std::make_unique<benchmark_session>(m_sectors);
    }
    void close_tray(const std::string& /*hint*/) override {}
};

// An open stream over an instant drive holding the given number of sectors
inline std::unique_ptr<sector_stream> open_benchmark_stream(lsn_t sectors) {
    auto cd = std::make_unique<sector_stream>(std::make_shared<benchmark_backend>(sectors));
    cd->open();
    return cd;
}

} // namespace cdda::benchmark

#endif // CDDA_BENCHMARK_HELPERS_HH
