/**
 * @example 03_play_track.cc
 * @brief Play a track through SDL3
 *
 * Reads the disc in real time and queues the PCM on an SDL3 audio stream.
 * The stream's samples are already in host order, which is what
 * SDL_AUDIO_S16 expects.
 */

#include "example_common.hh"
#include <cdda/error.hh>
#include <cdda/sdk/compiler.hh>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#if defined(CDDA_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#elif defined(CDDA_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif
#include <SDL3/SDL.h>
#if defined(CDDA_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(CDDA_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif

namespace {
    // Keep about half a second queued ahead of the device
    constexpr int queue_target = cdda::bytes_per_sector * cdda::sectors_per_second / 2;

    std::string get_sdl_error() {
        const char* error = SDL_GetError();
        return error ? error : "Unknown SDL error";
    }

    struct sdl_audio {
        sdl_audio() {
            if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
                throw std::runtime_error("Failed to initialize SDL3 audio: " + get_sdl_error());
            }
        }
        ~sdl_audio() {
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
        }
    };
}

int main(int argc, char* argv[]) {
    cdda::examples::arguments args;
    if (!cdda::examples::parse_arguments(argc, argv, args)) {
        cdda::examples::print_usage(argv[0], "[-t track]");
        return 1;
    }
    // playback needs no more than real time
    if (args.options.speed == cdda::full_speed) {
        args.options.speed = 4;
    }

    try {
        cdda::sector_stream cd(cdda::examples::create_backend(args.backend), args.options);
        cd.open();
        const auto track = cdda::examples::find_track(cd, args.track);
        if (!track.is_audio()) {
            std::cerr << "Track " << args.track << " is a data track\n";
            return 1;
        }

        sdl_audio audio;
        SDL_AudioSpec spec;
        spec.format = SDL_AUDIO_S16;
        spec.channels = cdda::channels;
        spec.freq = cdda::sample_rate;

#if defined(CDDA_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#elif defined(CDDA_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif
        SDL_AudioStream* stream = SDL_OpenAudioDeviceStream(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec, nullptr, nullptr);
#if defined(CDDA_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(CDDA_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif
        if (!stream) {
            std::cerr << "Cannot open playback device: " << get_sdl_error() << '\n';
            return 1;
        }
        SDL_ResumeAudioStreamDevice(stream);

        cd.seek_to_sector(track.start_sector);
        std::cout << "Playing track " << track.track_num << " ("
                  << track.length_sectors / cdda::sectors_per_second << " s)\n";

        std::vector<uint8_t> pcm(static_cast<size_t>(cdda::bytes_per_sector) * 15);
        int64_t remaining = cdda::sector_to_bytes(track.length_sectors);
        while (remaining > 0) {
            if (SDL_GetAudioStreamQueued(stream) > queue_target) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                continue;
            }
            const size_t wanted = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(pcm.size()), remaining));
            const size_t got = cd.read(pcm.data(), wanted);
            if (got == 0) {
                break;
            }
            if (!SDL_PutAudioStreamData(stream, pcm.data(), static_cast<int>(got))) {
                std::cerr << "Cannot queue audio: " << get_sdl_error() << '\n';
                break;
            }
            remaining -= static_cast<int64_t>(got);
        }

        SDL_FlushAudioStream(stream);
        while (SDL_GetAudioStreamQueued(stream) > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        SDL_DestroyAudioStream(stream);
        std::cout << "Playback finished\n";
    } catch (const cdda::device_error& e) {
        std::cerr << "Drive error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
