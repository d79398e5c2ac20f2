#include "paranoia_backend_impl.hh"
#include "paranoia_drive_session.hh"
#include <cdda/error.hh>
#include <failsafe/failsafe.hh>

namespace cdda {

paranoia_backend::~paranoia_backend() {
    if (m_initialized) {
        shutdown();
    }
}

void paranoia_backend::init() {
    if (m_initialized) {
        throw state_error("cdparanoia backend already initialized");
    }
    if (!cdio_init()) {
        THROW_RUNTIME("Failed to initialize libcdio");
    }
    m_initialized = true;
    LOG_INFO("paranoia_backend", "cdparanoia on libcdio", CDIO_VERSION, "initialized");
}

void paranoia_backend::shutdown() {
    m_initialized = false;
}

std::string paranoia_backend::get_name() const {
    return "paranoia";
}

bool paranoia_backend::is_initialized() const {
    return m_initialized;
}

std::string paranoia_backend::version() const {
    const char* version = cdio_cddap_version();
    return version ? version : "";
}

std::unique_ptr<drive_session> paranoia_backend::open_session(const std::string& device_hint) {
    if (!m_initialized) {
        throw state_error("Backend not initialized");
    }
    return std::make_unique<paranoia_drive_session>(cdio_drive_session::open_handle(device_hint));
}

void paranoia_backend::close_tray(const std::string& device_hint) {
    if (!m_initialized) {
        throw state_error("Backend not initialized");
    }
    driver_id_t driver = DRIVER_DEVICE;
    cdio_drive_session::check(cdio_close_tray(device_hint.empty() ? nullptr : device_hint.c_str(), &driver),
                              "Cannot close tray");
}

} // namespace cdda
