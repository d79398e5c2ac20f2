#include <cdda_backends/paranoia/paranoia_backend.hh>
#include "paranoia_backend_impl.hh"

namespace cdda {

std::unique_ptr<drive_backend> create_paranoia_backend() {
    return std::make_unique<paranoia_backend>();
}

} // namespace cdda
