/**
 * @file cdio_backend_factory.cc
 * @brief libcdio backend factory implementation
 * @ingroup cdio_backend
 */

#include <cdda_backends/cdio/cdio_backend.hh>
#include "cdio_backend_impl.hh"

namespace cdda {

/**
 * @brief Factory function implementation for the libcdio backend
 *
 * Keeps the libcdio headers out of application code.
 */
std::unique_ptr<drive_backend> create_cdio_backend() {
    return std::make_unique<cdio_backend>();
}

} // namespace cdda
