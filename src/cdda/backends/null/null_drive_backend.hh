#ifndef CDDA_NULL_DRIVE_BACKEND_HH
#define CDDA_NULL_DRIVE_BACKEND_HH

#include <cdda/sdk/drive_backend.hh>
#include <cdda/backends/null/null_backend.hh>

namespace cdda {

/**
 * Simulated drive session over a disc_layout.
 * Every operation succeeds unless the request is outside the disc.
 */
class null_drive_session : public drive_session {
public:
    explicit null_drive_session(const disc_layout& layout);
    ~null_drive_session() override;

    std::string model() override;
    int drive_type() const override;
    int interface_type() const override;
    int track_count() override;
    lsn_t first_audio_sector() override;
    toc_t read_toc(int track_count) override;
    void set_speed(int multiplier) override;
    void eject_media() override;
    void close() override;
    bool is_open() const override;

protected:
    void do_read_sectors(lsn_t start, uint32_t count, void* out) override;

private:
    void require_open() const;

    disc_layout m_layout;
    lsn_t m_end_sector = 0;
    bool m_open = true;
};

/**
 * Null drive backend for testing and headless environments.
 */
class null_drive_backend : public drive_backend {
public:
    explicit null_drive_backend(disc_layout layout);
    ~null_drive_backend() override = default;

    void init() override;
    void shutdown() override;
    std::string get_name() const override { return "null"; }
    bool is_initialized() const override { return m_initialized; }
    std::string version() const override;

    std::unique_ptr<drive_session> open_session(const std::string& device_hint) override;
    void close_tray(const std::string& device_hint) override;

private:
    disc_layout m_layout;
    bool m_initialized = false;
};

} // namespace cdda

#endif // CDDA_NULL_DRIVE_BACKEND_HH
