#ifndef CDDA_BACKENDS_NULL_BACKEND_HH
#define CDDA_BACKENDS_NULL_BACKEND_HH

#include <cdda/sdk/types.hh>
#include <cdda/sdk/track_position.hh>
#include <cdda/sdk/drive_backend.hh>
#include <cdda/export_cdda.h>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

// Public factory header for the Null backend
// This header can be included by applications that want a simulated drive for testing

namespace cdda {

/**
 * @brief One track of a simulated disc
 */
struct null_track {
    lsn_t length_sectors = 0;
    uint8_t flags = track_flag_copy_permitted;
};

/**
 * @brief Layout of the simulated disc. No tracks means no disc in the drive.
 */
struct disc_layout {
    std::vector<null_track> tracks;
    lsn_t first_sector = 0;
    std::string model = "CDDA NULL DRIVE 1.0";
    int drive_type = 0;                   ///< no device node behind it
    int interface_type = interface_test;
};

/**
 * @brief Audio disc layout with the given track lengths, starting at sector 0
 */
CDDA_EXPORT disc_layout make_disc_layout(std::initializer_list<lsn_t> track_lengths);

/**
 * Create a Null drive backend instance.
 *
 * The Null backend provides:
 * - A simulated drive holding the disc described by @p layout
 * - Deterministic audio content (see null_backend_sample_byte())
 * - Driver errors for reads outside the disc, like a real drive
 * - Headless environment support for tests, examples and benchmarks
 *
 * @return New Null backend instance
 *
 * Example usage:
 * @code
 * auto backend = cdda::create_null_backend(cdda::make_disc_layout({100, 150}));
 * cdda::sector_stream cd(std::move(backend));
 * cd.open();
 * @endcode
 */
CDDA_EXPORT std::unique_ptr<drive_backend> create_null_backend(disc_layout layout = {});

/**
 * @brief The byte a Null drive returns at an absolute stream offset
 */
CDDA_EXPORT uint8_t null_backend_sample_byte(int64_t offset) noexcept;

} // namespace cdda

#endif // CDDA_BACKENDS_NULL_BACKEND_HH
