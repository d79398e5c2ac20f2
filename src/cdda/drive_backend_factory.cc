#include <cdda/sector_stream.hh>
#include <cdda/sdk/cdda_sdk_config.h>
#include <cdda/backends/null/null_backend.hh>

#ifdef CDDA_HAS_PARANOIA_BACKEND
#include <cdda_backends/paranoia/paranoia_backend.hh>
#endif

#ifdef CDDA_HAS_CDIO_BACKEND
#include <cdda_backends/cdio/cdio_backend.hh>
#endif

namespace cdda {

std::shared_ptr<drive_backend> create_default_drive_backend() {
#ifdef CDDA_HAS_PARANOIA_BACKEND
    return create_paranoia_backend();
#elif defined(CDDA_HAS_CDIO_BACKEND)
    return create_cdio_backend();
#else
    // No driver available: a drive without a disc
    return create_null_backend();
#endif
}

} // namespace cdda
