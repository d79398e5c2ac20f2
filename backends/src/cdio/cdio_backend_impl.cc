#include "cdio_backend_impl.hh"
#include "cdio_drive_session.hh"
#include <cdda/error.hh>
#include <failsafe/failsafe.hh>

namespace cdda {

    cdio_backend::~cdio_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void cdio_backend::init() {
        if (m_initialized) {
            throw state_error("libcdio backend already initialized");
        }
        if (!cdio_init()) {
            THROW_RUNTIME("Failed to initialize libcdio");
        }
        m_initialized = true;
        LOG_INFO("cdio_backend", "libcdio", CDIO_VERSION, "initialized");
    }

    void cdio_backend::shutdown() {
        m_initialized = false;
    }

    std::string cdio_backend::get_name() const {
        return "cdio";
    }

    bool cdio_backend::is_initialized() const {
        return m_initialized;
    }

    std::string cdio_backend::version() const {
        return CDIO_VERSION;
    }

    void cdio_backend::require_initialized() const {
        if (!m_initialized) {
            throw state_error("Backend not initialized");
        }
    }

    std::unique_ptr<drive_session> cdio_backend::open_session(const std::string& device_hint) {
        require_initialized();
        return std::make_unique<cdio_drive_session>(cdio_drive_session::open_handle(device_hint));
    }

    void cdio_backend::close_tray(const std::string& device_hint) {
        require_initialized();
        driver_id_t driver = DRIVER_DEVICE;
        cdio_drive_session::check(cdio_close_tray(device_hint.empty() ? nullptr : device_hint.c_str(), &driver),
                                  "Cannot close tray");
    }

} // namespace cdda
