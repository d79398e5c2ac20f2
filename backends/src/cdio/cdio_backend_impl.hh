/**
 * @file cdio_backend_impl.hh
 * @brief libcdio backend implementation
 * @ingroup cdio_backend
 */

#ifndef CDDA_CDIO_BACKEND_IMPL_HH
#define CDDA_CDIO_BACKEND_IMPL_HH

#include <cdda/sdk/drive_backend.hh>
#include "cdio.hh"
#include <memory>
#include <string>

namespace cdda {

/**
 * @class cdio_backend
 * @brief libcdio implementation of the drive backend interface
 * @ingroup cdio_backend
 *
 * @note This is an internal implementation class. Users should
 *       create instances via create_cdio_backend().
 */
class cdio_backend : public drive_backend {
public:
    cdio_backend() = default;
    ~cdio_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;
    std::string version() const override;

    std::unique_ptr<drive_session> open_session(const std::string& device_hint) override;
    void close_tray(const std::string& device_hint) override;

private:
    void require_initialized() const;

    bool m_initialized = false;
};

} // namespace cdda

#endif // CDDA_CDIO_BACKEND_IMPL_HH
