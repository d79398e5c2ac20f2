#include <cdda/sdk/drive_backend.hh>
#include <cdda/error.hh>
#include <failsafe/failsafe.hh>
#include <string>

namespace cdda {

void drive_session::read_sectors(lsn_t start, uint32_t count, void* out, std::size_t out_size) {
    if (count == 0 || out_size != static_cast<std::size_t>(count) * bytes_per_sector) {
        throw alignment_error("cdda: must read complete sectors (requested "
                              + std::to_string(out_size) + " bytes for "
                              + std::to_string(count) + " sectors)");
    }
    if (!out) {
        THROW_RUNTIME("No output buffer for sector read");
    }
    if (!is_open()) {
        throw not_open_error();
    }
    do_read_sectors(start, count, out);
}

} // namespace cdda
