#ifndef CDDA_PARANOIA_BACKEND_IMPL_HH
#define CDDA_PARANOIA_BACKEND_IMPL_HH

#include <cdda/sdk/drive_backend.hh>
#include <memory>
#include <string>

namespace cdda {

/**
 * @class paranoia_backend
 * @brief cdparanoia implementation of the drive backend interface
 * @ingroup paranoia_backend
 *
 * @note Internal class. Use create_paranoia_backend().
 */
class paranoia_backend : public drive_backend {
public:
    paranoia_backend() = default;
    ~paranoia_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;
    std::string version() const override;

    std::unique_ptr<drive_session> open_session(const std::string& device_hint) override;
    void close_tray(const std::string& device_hint) override;

private:
    bool m_initialized = false;
};

} // namespace cdda

#endif // CDDA_PARANOIA_BACKEND_IMPL_HH
