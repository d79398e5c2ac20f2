/**
 * @example 01_disc_info.cc
 * @brief Print the drive model and the table of contents
 */

#include "example_common.hh"
#include <cdda/error.hh>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace {
    // mm:ss.ff from a sector count
    std::string timecode(cdda::lsn_t sectors) {
        const int frames = sectors % cdda::sectors_per_second;
        const int seconds = sectors / cdda::sectors_per_second;
        std::ostringstream os;
        os << std::setfill('0') << std::setw(2) << seconds / 60 << ':'
           << std::setw(2) << seconds % 60 << '.' << std::setw(2) << frames;
        return os.str();
    }
}

int main(int argc, char* argv[]) {
    cdda::examples::arguments args;
    if (!cdda::examples::parse_arguments(argc, argv, args)) {
        cdda::examples::print_usage(argv[0], "");
        return 1;
    }

    try {
        auto backend = cdda::examples::create_backend(args.backend);
        cdda::sector_stream cd(backend, args.options);
        cd.open();

        std::cout << "cdda " << cdda::version() << " using " << backend->get_name()
                  << " (" << backend->version() << ")\n";
        std::cout << "Drive: " << (cd.model().empty() ? "unknown" : cd.model()) << "\n";
        std::cout << "Tracks: " << cd.track_count()
                  << ", first audio sector " << cd.first_audio_sector()
                  << ", length " << timecode(cd.length_sectors()) << "\n\n";

        std::cout << " #  start     length    type   copy  emph\n";
        for (const auto& track : cd.toc()) {
            std::cout << std::setw(2) << track.track_num << "  "
                      << std::setw(8) << track.start_sector << "  "
                      << timecode(track.length_sectors) << "  "
                      << (track.is_audio() ? "audio" : "data ") << "  "
                      << (track.is_copy_permitted() ? "yes " : "no  ") << "  "
                      << (track.is_preemphasis_enabled() ? "yes" : "no") << "\n";
        }

        cd.close();
    } catch (const cdda::no_drive_error& e) {
        std::cerr << "No disc: " << e.what() << '\n';
        return 1;
    } catch (const cdda::toc_error& e) {
        std::cerr << "Unreadable table of contents: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
