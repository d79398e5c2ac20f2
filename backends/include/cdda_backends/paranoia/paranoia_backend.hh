/**
 * @file paranoia_backend.hh
 * @brief cdparanoia drive backend factory
 * @ingroup backends
 */

#ifndef CDDA_BACKENDS_PARANOIA_BACKEND_HH
#define CDDA_BACKENDS_PARANOIA_BACKEND_HH

#include <memory>

// Include generated export header
#include "export_cdda_backend_paranoia.h"

namespace cdda {

/**
 * @defgroup paranoia_backend cdparanoia Drive Backend
 * @ingroup backends
 * @brief Verified audio extraction through libcdio-paranoia
 *
 * Every sector is read with overlap verification, jitter correction and
 * re-reads of failing sectors, controlled through correction_flags. This
 * is the backend to rip with; it is slower than the plain libcdio backend
 * and may stall on damaged discs while it retries.
 *
 * TOC queries, speed and tray control behave exactly as in the libcdio
 * backend.
 *
 * @code
 * cdda::stream_options options;
 * options.correction = cdda::correction_full ^ cdda::correction_never_skip;
 * options.max_retries = 5;
 * cdda::sector_stream cd(cdda::create_paranoia_backend(), options);
 * @endcode
 *
 * @{
 */

// Forward declaration
class drive_backend;

/**
 * @brief Create a cdparanoia drive backend instance
 * @return New backend instance; must be initialized before use
 * @see drive_backend, create_cdio_backend()
 */
CDDA_BACKEND_PARANOIA_EXPORT std::unique_ptr<drive_backend> create_paranoia_backend();

/** @} */ // end of paranoia_backend group

} // namespace cdda

#endif // CDDA_BACKENDS_PARANOIA_BACKEND_HH
