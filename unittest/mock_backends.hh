#ifndef CDDA_MOCK_BACKENDS_HH
#define CDDA_MOCK_BACKENDS_HH

#include <cdda/sdk/drive_backend.hh>
#include <cdda/error.hh>
#include <memory>
#include <vector>
#include <algorithm>
#include <functional>
#include <atomic>
#include <string>
#include <cstring>
#include <stdexcept>

namespace cdda::test {

    // Byte a mock drive returns at an absolute stream offset
    inline uint8_t mock_sample_byte(int64_t offset) {
        return static_cast<uint8_t>((offset * 31 + offset / bytes_per_sector) & 0xFF);
    }

    // Expected stream content for [offset, offset + size)
    inline std::vector<uint8_t> mock_pcm(int64_t offset, size_t size) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = mock_sample_byte(offset + static_cast<int64_t>(i));
        }
        return data;
    }

    struct read_request {
        lsn_t start;
        uint32_t count;
    };

    // Drive state shared by the mock backend and its sessions, so tests can
    // inspect device traffic after a stream took ownership of the session
    struct mock_drive_state {
        toc_t toc;
        std::string model = "MOCK CDROM 1.00";
        int drive_type = 11;
        int interface_type = interface_sgio_scsi;
        bool disc_present = true;
        bool correcting = false;

        // Statistics for testing
        std::atomic<int> open_calls{0};
        std::atomic<int> close_calls{0};
        std::atomic<int> read_calls{0};
        std::atomic<int> toc_calls{0};
        std::atomic<int> speed_calls{0};
        std::atomic<int> eject_calls{0};
        std::atomic<int> close_tray_calls{0};
        std::vector<read_request> reads;

        // Last settings pushed by the stream
        int speed = 0;
        int correction_mode = -1;
        int search_overlap = -1;
        int max_retries = -1000;
        std::string last_hint;

        // Configurable behaviors; throw from them to simulate driver failures
        std::function<void(lsn_t, uint32_t)> on_read;
        std::function<void(int)> on_set_speed;
        std::function<void()> on_eject;
        std::function<void()> on_read_toc;

        lsn_t end_sector() const {
            lsn_t end = 0;
            for (const auto& track : toc) {
                end = std::max(end, track.end_sector());
            }
            return end;
        }

        int total_sectors_read() const {
            int total = 0;
            for (const auto& r : reads) {
                total += static_cast<int>(r.count);
            }
            return total;
        }

        void reset_stats() {
            open_calls = 0;
            close_calls = 0;
            read_calls = 0;
            toc_calls = 0;
            speed_calls = 0;
            eject_calls = 0;
            close_tray_calls = 0;
            reads.clear();
        }
    };

    // Audio disc with consecutive tracks of the given lengths, starting at 0
    inline toc_t make_toc(std::initializer_list<lsn_t> lengths) {
        toc_t toc;
        lsn_t start = 0;
        int num = 1;
        for (lsn_t length : lengths) {
            track_position track;
            track.track_num = num++;
            track.flags = track_flag_copy_permitted;
            track.start_sector = start;
            track.length_sectors = length;
            toc.push_back(track);
            start += length;
        }
        return toc;
    }

    class mock_drive_session : public drive_session {
        private:
            std::shared_ptr<mock_drive_state> m_state;
            bool m_open{true};

        public:
            explicit mock_drive_session(std::shared_ptr<mock_drive_state> state)
                : m_state(std::move(state)) {}

            ~mock_drive_session() override {
                close();
            }

            std::string model() override {
                return m_open ? m_state->model : std::string();
            }

            int drive_type() const override {
                return m_open ? m_state->drive_type : -1;
            }

            int interface_type() const override {
                return m_open ? m_state->interface_type : -1;
            }

            int track_count() override {
                if (!m_open) throw not_open_error();
                return static_cast<int>(m_state->toc.size());
            }

            lsn_t first_audio_sector() override {
                if (!m_open) throw not_open_error();
                for (const auto& track : m_state->toc) {
                    if (track.is_audio()) {
                        return track.start_sector;
                    }
                }
                throw cdda_error("no audio track");
            }

            toc_t read_toc(int count) override {
                if (!m_open) throw not_open_error();
                m_state->toc_calls++;
                if (m_state->on_read_toc) {
                    m_state->on_read_toc();
                }
                toc_t result(m_state->toc.begin(),
                             m_state->toc.begin() + std::min<std::ptrdiff_t>(count, static_cast<std::ptrdiff_t>(m_state->toc.size())));
                validate_toc(result);
                return result;
            }

            void set_speed(int multiplier) override {
                if (!m_open) throw not_open_error();
                m_state->speed_calls++;
                if (m_state->on_set_speed) {
                    m_state->on_set_speed(multiplier);
                }
                m_state->speed = multiplier;
            }

            void eject_media() override {
                if (!m_open) throw not_open_error();
                m_state->eject_calls++;
                if (m_state->on_eject) {
                    m_state->on_eject();
                }
                close();
            }

            void close() override {
                if (m_open) {
                    m_open = false;
                    m_state->close_calls++;
                }
            }

            bool is_open() const override {
                return m_open;
            }

            bool supports_correction() const override {
                return m_state->correcting;
            }

            void set_correction_mode(int flags) override {
                m_state->correction_mode = flags;
            }

            void set_search_overlap(int sectors) override {
                m_state->search_overlap = sectors;
            }

            void set_max_retries(int retries) override {
                m_state->max_retries = retries;
            }

        protected:
            void do_read_sectors(lsn_t start, uint32_t count, void* out) override {
                m_state->read_calls++;
                m_state->reads.push_back(read_request{start, count});
                if (m_state->on_read) {
                    m_state->on_read(start, count);
                }
                if (start < 0 || start + static_cast<lsn_t>(count) > m_state->end_sector()) {
                    throw driver_error(driver_status::bad_parameter, "read outside disc");
                }
                auto* bytes = static_cast<uint8_t*>(out);
                const int64_t base = sector_to_bytes(start);
                for (size_t i = 0; i < static_cast<size_t>(count) * bytes_per_sector; ++i) {
                    bytes[i] = mock_sample_byte(base + static_cast<int64_t>(i));
                }
            }
    };

    class mock_drive_backend : public drive_backend {
        private:
            std::shared_ptr<mock_drive_state> m_state;
            bool m_initialized{false};

        public:
            // Statistics for testing
            std::atomic<int> init_calls{0};
            std::atomic<int> shutdown_calls{0};

            // Configurable behaviors
            std::function<void()> on_init;
            std::function<void(const std::string&)> on_close_tray;

            explicit mock_drive_backend(std::shared_ptr<mock_drive_state> state = std::make_shared<mock_drive_state>())
                : m_state(std::move(state)) {}

            void init() override {
                init_calls++;
                if (m_initialized) {
                    throw state_error("mock backend already initialized");
                }
                if (on_init) {
                    on_init();
                }
                m_initialized = true;
            }

            void shutdown() override {
                shutdown_calls++;
                m_initialized = false;
            }

            std::string get_name() const override { return "mock"; }
            bool is_initialized() const override { return m_initialized; }
            std::string version() const override { return "0.0.0-mock"; }

            std::unique_ptr<drive_session> open_session(const std::string& device_hint) override {
                if (!m_initialized) {
                    throw state_error("Backend not initialized");
                }
                m_state->open_calls++;
                m_state->last_hint = device_hint;
                if (!m_state->disc_present) {
                    throw no_drive_error("mock drive is empty");
                }
                return std::make_unique<mock_drive_session>(m_state);
            }

            void close_tray(const std::string& device_hint) override {
                if (!m_initialized) {
                    throw state_error("Backend not initialized");
                }
                m_state->close_tray_calls++;
                if (on_close_tray) {
                    on_close_tray(device_hint);
                }
            }

            mock_drive_state& state() { return *m_state; }
    };

    // Backend plus a handle on its state, for a disc of the given track lengths
    struct mock_drive {
        std::shared_ptr<mock_drive_state> state;
        std::shared_ptr<mock_drive_backend> backend;

        explicit mock_drive(std::initializer_list<lsn_t> track_lengths)
            : state(std::make_shared<mock_drive_state>()),
              backend(std::make_shared<mock_drive_backend>(state)) {
            state->toc = make_toc(track_lengths);
        }
    };

} // namespace cdda::test

#endif // CDDA_MOCK_BACKENDS_HH
