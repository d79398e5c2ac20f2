/**
 * @example 02_rip_track.cc
 * @brief Rip one track to a WAV file
 *
 * Streams a track sector by sector into a RIFF/WAVE file. Pass "-b null"
 * to try it without a drive.
 */

#include "example_common.hh"
#include <cdda/error.hh>
#include <cdda/sdk/io_stream.hh>
#include <algorithm>
#include <iostream>
#include <vector>

namespace {
    constexpr uint32_t wav_header_size = 44;

    bool write_tag(cdda::io_stream* out, const char* tag) {
        return out->write(tag, 4) == 4;
    }

    // Canonical 44-byte header for 16-bit stereo 44.1 kHz PCM
    bool write_wav_header(cdda::io_stream* out, uint32_t data_bytes) {
        const uint32_t byte_rate = cdda::sample_rate * cdda::channels * cdda::bytes_per_sample;
        const uint16_t block_align = cdda::channels * cdda::bytes_per_sample;

        return write_tag(out, "RIFF")
            && cdda::write_u32le(out, data_bytes + wav_header_size - 8)
            && write_tag(out, "WAVE")
            && write_tag(out, "fmt ")
            && cdda::write_u32le(out, 16)
            && cdda::write_u16le(out, 1)  // PCM
            && cdda::write_u16le(out, cdda::channels)
            && cdda::write_u32le(out, cdda::sample_rate)
            && cdda::write_u32le(out, byte_rate)
            && cdda::write_u16le(out, block_align)
            && cdda::write_u16le(out, cdda::bits_per_sample)
            && write_tag(out, "data")
            && cdda::write_u32le(out, data_bytes);
    }
}

int main(int argc, char* argv[]) {
    cdda::examples::arguments args;
    args.output = "track.wav";
    if (!cdda::examples::parse_arguments(argc, argv, args)) {
        cdda::examples::print_usage(argv[0], "[-t track] [-o file.wav]");
        return 1;
    }

    try {
        cdda::sector_stream cd(cdda::examples::create_backend(args.backend), args.options);
        cd.open();

        const auto track = cdda::examples::find_track(cd, args.track);
        if (!track.is_audio()) {
            std::cerr << "Track " << args.track << " is a data track\n";
            return 1;
        }
        const auto data_bytes = static_cast<uint32_t>(cdda::sector_to_bytes(track.length_sectors));

        auto out = cdda::io_from_file(args.output.c_str(), "wb");
        if (!out) {
            std::cerr << "Cannot create " << args.output << '\n';
            return 1;
        }
        if (!write_wav_header(out.get(), data_bytes)) {
            std::cerr << "Cannot write " << args.output << '\n';
            return 1;
        }

        cd.seek_to_sector(track.start_sector);

        // one second of audio per read
        std::vector<uint8_t> pcm(static_cast<size_t>(cdda::bytes_per_sector) * cdda::sectors_per_second);
        uint32_t remaining = data_bytes;
        while (remaining > 0) {
            const size_t wanted = std::min<size_t>(pcm.size(), remaining);
            const size_t got = cd.read(pcm.data(), wanted);
            if (got == 0) {
                std::cerr << "Unexpected end of disc\n";
                return 1;
            }
            // WAV wants little-endian samples; the stream delivers host order
            if (cdda::write_pcm_le(out.get(), pcm.data(), got) != got) {
                std::cerr << "Cannot write " << args.output << '\n';
                return 1;
            }
            remaining -= static_cast<uint32_t>(got);
            std::cout << "\rRipped " << (data_bytes - remaining) * 100ull / data_bytes << "%" << std::flush;
        }
        std::cout << "\nWrote track " << args.track << " to " << args.output << '\n';

        out->close();
        cd.close();
    } catch (const cdda::device_error& e) {
        std::cerr << "\nDrive error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
