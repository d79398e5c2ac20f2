/**
 * @file cdio_backend.hh
 * @brief libcdio drive backend factory
 * @ingroup backends
 */

#ifndef CDDA_BACKENDS_CDIO_BACKEND_HH
#define CDDA_BACKENDS_CDIO_BACKEND_HH

#include <memory>

// Include generated export header
#include "export_cdda_backend_cdio.h"

namespace cdda {

/**
 * @defgroup cdio_backend libcdio Drive Backend
 * @ingroup backends
 * @brief Plain audio sector reads through libcdio
 *
 * The libcdio backend talks to the operating system's CD driver through
 * libcdio. Sectors are read exactly once with READ CD; nothing is verified
 * or re-read, so scratched discs may yield clicks. Use the paranoia backend
 * when accuracy matters more than speed.
 *
 * ## Platform Support
 *
 * | Platform | Driver |
 * |----------|--------|
 * | Linux    | ioctl / SG_IO |
 * | FreeBSD  | CAM |
 * | macOS    | IOKit |
 * | Windows  | ASPI / WinNT IOCTL |
 *
 * @{
 */

// Forward declaration
class drive_backend;

/**
 * @brief Create a libcdio drive backend instance
 * @return New backend instance; must be initialized before use
 *
 * ## Usage Example
 *
 * @code
 * #include <cdda_backends/cdio/cdio_backend.hh>
 * #include <cdda/sector_stream.hh>
 *
 * cdda::stream_options options;
 * options.device = "/dev/sr0";
 * cdda::sector_stream cd(cdda::create_cdio_backend(), options);
 * cd.open();
 * @endcode
 *
 * @see drive_backend, create_paranoia_backend()
 */
CDDA_BACKEND_CDIO_EXPORT std::unique_ptr<drive_backend> create_cdio_backend();

/** @} */ // end of cdio_backend group

} // namespace cdda

#endif // CDDA_BACKENDS_CDIO_BACKEND_HH
