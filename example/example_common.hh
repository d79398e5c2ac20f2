/**
 * @file example_common.hh
 * @brief Common utilities for cdda examples
 *
 * Backend selection by name and a small command line parser.
 */

#ifndef CDDA_EXAMPLE_COMMON_HH
#define CDDA_EXAMPLE_COMMON_HH

#include <cdda/sector_stream.hh>
#include <cdda/backends/null/null_backend.hh>
#include <cdda/sdk/cdda_sdk_config.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#ifdef CDDA_HAS_CDIO_BACKEND
#include <cdda_backends/cdio/cdio_backend.hh>
#endif
#ifdef CDDA_HAS_PARANOIA_BACKEND
#include <cdda_backends/paranoia/paranoia_backend.hh>
#endif

namespace cdda {
    namespace examples {
        struct arguments {
            std::string backend;      ///< "paranoia", "cdio", "null"; empty for the default
            stream_options options;
            int track = 1;
            std::string output;
        };

        /**
         * @brief Create a backend by name
         *
         * "null" simulates a three-track disc so these programs run without a drive.
         */
        inline std::shared_ptr<drive_backend> create_backend(const std::string& name) {
            if (name.empty()) {
                return create_default_drive_backend();
            }
            if (name == "null") {
                return create_null_backend(make_disc_layout({75 * 30, 75 * 45, 75 * 20}));
            }
#ifdef CDDA_HAS_CDIO_BACKEND
            if (name == "cdio") {
                return create_cdio_backend();
            }
#endif
#ifdef CDDA_HAS_PARANOIA_BACKEND
            if (name == "paranoia") {
                return create_paranoia_backend();
            }
#endif
            throw std::invalid_argument("Backend not available in this build: " + name);
        }

        inline void print_usage(const char* program, const char* extra) {
            std::cerr << "Usage: " << program << " [-b paranoia|cdio|null] [-d device] [-s speed] " << extra << "\n";
        }

        /**
         * @brief Parse -b, -d, -s, -t and -o
         * @return false on malformed input
         */
        inline bool parse_arguments(int argc, char* argv[], arguments& args) {
            for (int i = 1; i < argc; ++i) {
                const std::string flag = argv[i];
                if (i + 1 >= argc) {
                    return false;
                }
                const std::string value = argv[++i];
                if (flag == "-b") {
                    args.backend = value;
                } else if (flag == "-d") {
                    args.options.device = value;
                } else if (flag == "-s") {
                    args.options.speed = std::stoi(value);
                } else if (flag == "-t") {
                    args.track = std::stoi(value);
                } else if (flag == "-o") {
                    args.output = value;
                } else {
                    return false;
                }
            }
            return true;
        }

        /**
         * @brief TOC entry of a track, by 1-based number
         */
        inline track_position find_track(sector_stream& cd, int track) {
            for (const auto& t : cd.toc()) {
                if (t.track_num == track) {
                    return t;
                }
            }
            throw std::out_of_range("No track " + std::to_string(track) + " on this disc");
        }
    } // namespace examples
} // namespace cdda

#endif // CDDA_EXAMPLE_COMMON_HH
