#include <cdda/sdk/track_position.hh>
#include <cdda/error.hh>
#include <ostream>
#include <string>

namespace cdda {

lsn_t toc_length_sectors(const toc_t& toc) noexcept {
    if (toc.empty()) {
        return 0;
    }
    return toc.back().end_sector();
}

track_num_t toc_track_at_sector(const toc_t& toc, lsn_t sector) noexcept {
    for (const auto& track : toc) {
        if (track.contains_sector(sector)) {
            return track.track_num;
        }
    }
    return 0;
}

void validate_toc(const toc_t& toc) {
    for (std::size_t i = 0; i < toc.size(); ++i) {
        const auto& track = toc[i];
        if (track.start_sector < 0) {
            throw toc_error(toc_fault::invalid_sector_address,
                            "track " + std::to_string(track.track_num) + " starts at invalid sector "
                            + std::to_string(track.start_sector));
        }
        if (track.length_sectors <= 0) {
            throw toc_error(toc_fault::zero_length_track,
                            "track " + std::to_string(track.track_num) + " has no sectors");
        }
        if (i == 0) {
            continue;
        }
        const auto& prev = toc[i - 1];
        // gaps between sessions are tolerated, overlaps are not
        if (track.track_num != prev.track_num + 1 || track.start_sector < prev.end_sector()) {
            throw toc_error(toc_fault::unordered_tracks,
                            "track " + std::to_string(track.track_num) + " at sector "
                            + std::to_string(track.start_sector) + " does not follow track "
                            + std::to_string(prev.track_num) + " ending at sector "
                            + std::to_string(prev.end_sector()));
        }
    }
}

std::ostream& operator<<(std::ostream& os, const track_position& track) {
    os << "track_position{"
       << "track=" << track.track_num << ", "
       << "start=" << track.start_sector << ", "
       << "length=" << track.length_sectors << ", "
       << "audio=" << (track.is_audio() ? "true" : "false") << ", "
       << "copy=" << (track.is_copy_permitted() ? "true" : "false") << ", "
       << "preemphasis=" << (track.is_preemphasis_enabled() ? "true" : "false")
       << "}";
    return os;
}

} // namespace cdda
