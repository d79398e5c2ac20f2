/**
 * @file test_sector_stream_unit.cc
 * @brief Unit tests for sector_stream using a mock drive
 *
 * Test Coverage:
 * - Open/close lifecycle and settings pushed to the drive
 * - Calls on a closed stream
 * - Read-ahead buffering and sector-granular device reads
 * - Fast (buffered) and slow (refetching) seeks
 * - End of disc handling
 * - Driver failures during reads and seeks
 * - Drive control: speed, correction, eject, tray
 */

#include <doctest/doctest.h>
#include <cdda/sector_stream.hh>
#include <cdda/error.hh>
#include "../../mock_backends.hh"
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace cdda;
using namespace cdda::test;

namespace {
    constexpr size_t sector = bytes_per_sector;

    // buffered_offset - tell == unread buffered bytes
    void check_buffer_invariant(sector_stream& cd) {
        CHECK(cd.buffered_offset() - cd.tell() == static_cast<int64_t>(cd.buffered_bytes()));
    }

    std::vector<uint8_t> read_bytes(sector_stream& cd, size_t size) {
        std::vector<uint8_t> data(size);
        data.resize(cd.read(data.data(), data.size()));
        return data;
    }
}

TEST_SUITE("SectorStream::Lifecycle") {

    TEST_CASE("should_open_and_configure_drive") {
        mock_drive drive({100, 150});

        stream_options options;
        options.device = "/dev/sr1";
        options.max_retries = 7;
        options.correction = correction_verify | correction_repair;
        sector_stream cd(drive.backend, options);

        CHECK_FALSE(cd.is_open());
        cd.open();

        CHECK(cd.is_open());
        CHECK(cd.tell() == 0);
        CHECK(cd.buffered_bytes() == 0);
        CHECK(drive.backend->init_calls == 1);
        CHECK(drive.state->open_calls == 1);
        CHECK(drive.state->last_hint == "/dev/sr1");
        CHECK(drive.state->speed == full_speed);
        CHECK(drive.state->max_retries == 7);
        CHECK(drive.state->correction_mode == (correction_verify | correction_repair));

        // opening never touches the audio
        CHECK(drive.state->read_calls == 0);
    }

    TEST_CASE("should_default_to_full_correction_and_default_retries") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();

        CHECK(drive.state->correction_mode == correction_full);
        CHECK(drive.state->max_retries == 0);
        CHECK(drive.state->last_hint.empty());
    }

    TEST_CASE("should_ignore_second_open") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();
        CHECK_NOTHROW(cd.open());
        CHECK(drive.state->open_calls == 1);
    }

    TEST_CASE("should_not_reinitialize_an_initialized_backend") {
        mock_drive drive({100});
        drive.backend->init();
        sector_stream cd(drive.backend);
        cd.open();
        CHECK(drive.backend->init_calls == 1);
    }

    TEST_CASE("should_report_missing_disc") {
        mock_drive drive({100});
        drive.state->disc_present = false;
        sector_stream cd(drive.backend);

        CHECK_THROWS_AS(cd.open(), no_drive_error);
        CHECK_FALSE(cd.is_open());
    }

    TEST_CASE("should_release_drive_when_configuration_fails") {
        mock_drive drive({100});
        drive.state->on_set_speed = [](int) {
            throw driver_error(driver_status::unsupported, "no speed control");
        };
        sector_stream cd(drive.backend);

        CHECK_THROWS_AS(cd.open(), driver_error);
        CHECK_FALSE(cd.is_open());
        CHECK(drive.state->close_calls == 1);
    }

    TEST_CASE("should_close_idempotently") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);

        CHECK_NOTHROW(cd.close());
        cd.open();
        cd.close();
        CHECK_FALSE(cd.is_open());
        CHECK(drive.state->close_calls == 1);
        CHECK_NOTHROW(cd.close());
        CHECK(drive.state->close_calls == 1);
    }

    TEST_CASE("should_restart_at_byte_zero_after_reopen") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();
        cd.seek(sector * 10 + 3, seek_origin::set);
        cd.close();

        cd.open();
        CHECK(cd.tell() == 0);
        CHECK(cd.buffered_offset() == 0);
        CHECK(read_bytes(cd, 10) == mock_pcm(0, 10));
    }

    TEST_CASE("should_close_drive_on_destruction") {
        mock_drive drive({100});
        {
            sector_stream cd(drive.backend);
            cd.open();
        }
        CHECK(drive.state->close_calls == 1);
    }

    TEST_CASE("should_keep_session_when_moved") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();
        cd.seek(100, seek_origin::set);

        sector_stream moved(std::move(cd));
        CHECK(moved.is_open());
        CHECK(moved.tell() == 100);
        CHECK(read_bytes(moved, 10) == mock_pcm(100, 10));
        CHECK(drive.state->close_calls == 0);
    }

    TEST_CASE("should_refuse_writes") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();
        const uint8_t data[4] = {1, 2, 3, 4};
        CHECK(cd.write(data, sizeof(data)) == 0);
    }
}

TEST_SUITE("SectorStream::NotOpen") {

    TEST_CASE("should_throw_on_io_when_not_open") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        std::vector<uint8_t> data(sector);

        CHECK_THROWS_AS(cd.read(data.data(), data.size()), not_open_error);
        CHECK_THROWS_AS(cd.seek(0, seek_origin::set), not_open_error);
        CHECK_THROWS_AS(cd.seek_to_sector(1), not_open_error);
        CHECK_THROWS_AS(cd.toc(), not_open_error);
        CHECK_THROWS_AS(cd.length_sectors(), not_open_error);
        CHECK_THROWS_AS(cd.set_speed(1), not_open_error);
        CHECK_THROWS_AS(cd.force_search_overlap(10), not_open_error);
        CHECK_THROWS_AS(cd.eject_media(), not_open_error);
    }

    TEST_CASE("should_report_sentinels_when_not_open") {
        mock_drive drive({100, 150});
        sector_stream cd(drive.backend);

        CHECK(cd.track_at_sector(-1) == -1);
        CHECK(cd.track_at_sector(150) == -1);
        CHECK(cd.track_count() == -1);
        CHECK(cd.first_audio_sector() == -1);
        CHECK(cd.model().empty());
        CHECK(cd.drive_type() == -1);
        CHECK(cd.interface_type() == -1);
        CHECK(cd.tell() == -1);
        CHECK(cd.get_size() == -1);
    }

    TEST_CASE("should_describe_not_open_error") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        try {
            cd.toc();
            FAIL("expected not_open_error");
        } catch (const not_open_error& e) {
            CHECK(std::string(e.what()) == "cdda: stream is not open");
        }
    }

    TEST_CASE("should_fail_without_backend") {
        sector_stream cd(nullptr);
        CHECK_THROWS_AS(cd.open(), std::runtime_error);
        CHECK_FALSE(cd.is_open());
    }
}

TEST_SUITE("SectorStream::Toc") {

    TEST_CASE("should_locate_tracks_on_two_track_disc") {
        mock_drive drive({100, 150});
        sector_stream cd(drive.backend);
        cd.open();

        CHECK(cd.seek_to_sector(100) == static_cast<int64_t>(100 * sector));
        CHECK(cd.track_at_sector(150) == 2);
        CHECK(cd.track_at_sector(0) == 1);
        CHECK(cd.track_at_sector(99) == 1);
        CHECK(cd.track_at_sector(100) == 2);
        CHECK(cd.track_at_sector(249) == 2);
        CHECK(cd.track_at_sector(250) == 0);
        CHECK(cd.track_at_sector(300) == 0);
        CHECK(cd.track_at_sector(-1) == 0);
    }

    TEST_CASE("should_report_disc_geometry") {
        mock_drive drive({100, 150});
        sector_stream cd(drive.backend);
        cd.open();

        CHECK(cd.track_count() == 2);
        CHECK(cd.first_audio_sector() == 0);
        CHECK(cd.length_sectors() == 250);
        CHECK(cd.get_size() == static_cast<int64_t>(250 * sector));
        CHECK(cd.model() == "MOCK CDROM 1.00");

        auto toc = cd.toc();
        REQUIRE(toc.size() == 2);
        CHECK(toc[1].track_num == 2);
        CHECK(toc[1].start_sector == 100);
        CHECK(toc[1].length_sectors == 150);
    }

    TEST_CASE("should_ask_drive_for_toc_each_time") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();

        const int before = drive.state->toc_calls;
        cd.toc();
        cd.toc();
        CHECK(drive.state->toc_calls == before + 2);
    }

    TEST_CASE("should_propagate_invalid_toc") {
        mock_drive drive({100, 150});
        drive.state->toc[1].start_sector = 50;  // overlaps track 1
        sector_stream cd(drive.backend);
        cd.open();

        CHECK_THROWS_AS(cd.toc(), toc_error);
        CHECK_THROWS_AS(cd.length_sectors(), toc_error);
    }
}

TEST_SUITE("SectorStream::Read") {

    TEST_CASE("should_read_three_and_a_half_sectors_with_one_device_read") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();

        auto data = read_bytes(cd, sector * 7 / 2);

        CHECK(data.size() == sector * 7 / 2);
        CHECK(data == mock_pcm(0, data.size()));
        REQUIRE(drive.state->reads.size() == 1);
        CHECK(drive.state->reads[0].start == 0);
        CHECK(drive.state->reads[0].count == 4);
        CHECK(cd.buffered_bytes() == sector / 2);
        CHECK(cd.tell() == static_cast<int64_t>(sector * 7 / 2));
        CHECK(cd.buffered_offset() == static_cast<int64_t>(4 * sector));
        check_buffer_invariant(cd);
    }

    TEST_CASE("should_serve_small_reads_from_buffer") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();

        read_bytes(cd, 100);
        CHECK(drive.state->read_calls == 1);
        read_bytes(cd, 100);
        read_bytes(cd, 1000);
        CHECK(drive.state->read_calls == 1);
        CHECK(cd.tell() == 1200);
        check_buffer_invariant(cd);
    }

    TEST_CASE("should_read_whole_sectors_from_device") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();

        for (size_t size : {1u, 17u, 2351u, 2352u, 2353u, 5000u, 9999u}) {
            read_bytes(cd, size);
        }
        for (const auto& r : drive.state->reads) {
            CHECK(r.count > 0);
        }
        // device reads are contiguous
        lsn_t next = 0;
        for (const auto& r : drive.state->reads) {
            CHECK(r.start == next);
            next = r.start + static_cast<lsn_t>(r.count);
        }
        CHECK(cd.buffered_offset() == sector_to_bytes(next));
    }

    TEST_CASE("should_return_same_bytes_regardless_of_chunking") {
        const size_t total = sector * 6 + 123;
        std::vector<size_t> chunkings[] = {
            {total},
            {1, 2, 3, 5, 8, 13, 21, 34, 55, 89, 144, 233, 377, 610, 987, 1597, total},
            {sector, sector, sector, sector, sector, sector, total},
            {sector - 1, 2, sector * 2 + 7, total},
        };

        for (const auto& chunks : chunkings) {
            mock_drive drive({10});
            sector_stream cd(drive.backend);
            cd.open();

            std::vector<uint8_t> got;
            for (size_t chunk : chunks) {
                const size_t want = std::min(chunk, total - got.size());
                if (want == 0) {
                    break;
                }
                auto part = read_bytes(cd, want);
                got.insert(got.end(), part.begin(), part.end());
                check_buffer_invariant(cd);
            }
            CHECK(got.size() == total);
            CHECK(got == mock_pcm(0, total));
        }
    }

    TEST_CASE("should_return_zero_for_empty_request") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();
        uint8_t byte = 0;
        CHECK(cd.read(&byte, 0) == 0);
        CHECK(drive.state->read_calls == 0);
    }

    TEST_CASE("should_stop_at_end_of_disc") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();

        SUBCASE("read_across_the_end") {
            cd.seek(sector * 19 / 2, seek_origin::set);
            auto data = read_bytes(cd, 5000);
            CHECK(data.size() == sector / 2);
            CHECK(data == mock_pcm(static_cast<int64_t>(sector * 19 / 2), sector / 2));
            CHECK(cd.tell() == static_cast<int64_t>(10 * sector));
            CHECK(read_bytes(cd, 10).empty());
        }

        SUBCASE("large_read_is_clamped") {
            auto data = read_bytes(cd, sector * 50);
            CHECK(data.size() == 10 * sector);
            for (const auto& r : drive.state->reads) {
                CHECK(r.start + static_cast<lsn_t>(r.count) <= 10);
            }
        }

        SUBCASE("seek_past_the_end") {
            const int64_t past = static_cast<int64_t>(12 * sector);
            CHECK(cd.seek(past, seek_origin::set) == past);
            CHECK(cd.tell() == past);
            CHECK(read_bytes(cd, 10).empty());
            CHECK(drive.state->read_calls == 0);
        }
    }

    TEST_CASE("should_report_partial_read_then_raise_failure") {
        mock_drive drive({20});
        sector_stream cd(drive.backend);
        cd.open();
        read_bytes(cd, sector * 3 / 2);
        REQUIRE(cd.buffered_bytes() == sector / 2);

        drive.state->on_read = [](lsn_t, uint32_t) {
            throw driver_error(driver_status::failed, "medium error");
        };
        auto data = read_bytes(cd, sector * 2);
        CHECK(data.size() == sector / 2);
        CHECK(data == mock_pcm(static_cast<int64_t>(sector * 3 / 2), sector / 2));
        check_buffer_invariant(cd);

        std::vector<uint8_t> more(100);
        CHECK_THROWS_AS(cd.read(more.data(), more.size()), driver_error);

        // the drive recovers: reading resumes where the data stopped
        drive.state->on_read = nullptr;
        auto rest = read_bytes(cd, 100);
        CHECK(rest == mock_pcm(static_cast<int64_t>(2 * sector), 100));
    }

    TEST_CASE("should_drop_pending_failure_when_seeking_away") {
        mock_drive drive({20});
        sector_stream cd(drive.backend);
        cd.open();
        read_bytes(cd, sector / 2);

        drive.state->on_read = [](lsn_t start, uint32_t) {
            if (start >= 1) {
                throw driver_error(driver_status::failed, "medium error");
            }
        };
        CHECK(read_bytes(cd, sector * 2).size() == sector / 2);

        // the failure belonged to sector 1; reading from elsewhere works
        drive.state->on_read = nullptr;
        CHECK(cd.seek(0, seek_origin::set) == 0);
        CHECK(read_bytes(cd, 100) == mock_pcm(0, 100));
        check_buffer_invariant(cd);
    }

    TEST_CASE("should_drop_pending_failure_on_short_backward_seek") {
        mock_drive drive({20});
        sector_stream cd(drive.backend);
        cd.open();
        read_bytes(cd, 10);

        drive.state->on_read = [](lsn_t, uint32_t) {
            throw driver_error(driver_status::failed, "medium error");
        };
        CHECK(read_bytes(cd, sector).size() == sector - 10);
        drive.state->on_read = nullptr;

        cd.seek(-20, seek_origin::cur);
        CHECK(read_bytes(cd, 20) == mock_pcm(static_cast<int64_t>(sector - 20), 20));
    }

    TEST_CASE("should_throw_when_nothing_was_read") {
        mock_drive drive({20});
        sector_stream cd(drive.backend);
        cd.open();
        drive.state->on_read = [](lsn_t, uint32_t) {
            throw driver_error(driver_status::mmc_sense_data, "unreadable");
        };

        std::vector<uint8_t> data(100);
        try {
            cd.read(data.data(), data.size());
            FAIL("expected driver_error");
        } catch (const driver_error& e) {
            CHECK(e.status() == driver_status::mmc_sense_data);
        }
        CHECK(cd.tell() == 0);
        CHECK(cd.buffered_bytes() == 0);
    }
}

TEST_SUITE("SectorStream::Seek") {

    TEST_CASE("should_serve_short_forward_seek_from_buffer") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();

        cd.seek(sector * 3, seek_origin::set);
        const int reads = drive.state->read_calls;
        CHECK(cd.buffered_bytes() == sector);

        CHECK(cd.seek(5, seek_origin::cur) == static_cast<int64_t>(sector * 3 + 5));
        CHECK(drive.state->read_calls == reads);
        CHECK(cd.buffered_bytes() == sector - 5);
        check_buffer_invariant(cd);
        CHECK(read_bytes(cd, 10) == mock_pcm(static_cast<int64_t>(sector * 3 + 5), 10));
        CHECK(drive.state->read_calls == reads);
    }

    TEST_CASE("should_not_touch_drive_when_seeking_to_current_position") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();
        cd.seek(5000, seek_origin::set);
        const int reads = drive.state->read_calls;
        const auto buffered = cd.buffered_bytes();

        CHECK(cd.seek(5000, seek_origin::set) == 5000);
        CHECK(cd.seek(0, seek_origin::cur) == 5000);
        CHECK(drive.state->read_calls == reads);
        CHECK(cd.buffered_bytes() == buffered);
    }

    TEST_CASE("should_refetch_one_sector_on_slow_seek") {
        mock_drive drive({100});
        sector_stream cd(drive.backend);
        cd.open();

        const int64_t target = static_cast<int64_t>(sector * 42 + 1000);
        CHECK(cd.seek(target, seek_origin::set) == target);
        REQUIRE(drive.state->reads.size() == 1);
        CHECK(drive.state->reads[0].start == 42);
        CHECK(drive.state->reads[0].count == 1);
        CHECK(cd.buffered_offset() == static_cast<int64_t>(sector * 43));
        CHECK(cd.buffered_bytes() == sector - 1000);
        check_buffer_invariant(cd);
    }

    TEST_CASE("should_return_same_bytes_after_any_seek") {
        mock_drive drive({30});
        sector_stream cd(drive.backend);
        cd.open();

        // forward, backward, sector-aligned, buffered, across sectors
        for (int64_t target : {int64_t(7), int64_t(sector * 5), int64_t(3), int64_t(sector * 5 + 100),
                               int64_t(sector * 5 + 2000), int64_t(sector * 20 - 1), int64_t(0)}) {
            CHECK(cd.seek(target, seek_origin::set) == target);
            check_buffer_invariant(cd);
            CHECK(read_bytes(cd, 3000) == mock_pcm(target, 3000));
            check_buffer_invariant(cd);
        }
    }

    TEST_CASE("should_resolve_each_origin") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();

        CHECK(cd.seek(1000, seek_origin::set) == 1000);
        CHECK(cd.seek(-500, seek_origin::cur) == 500);
        CHECK(cd.seek(-static_cast<int64_t>(sector), seek_origin::end) == static_cast<int64_t>(9 * sector));
        CHECK(cd.seek(0, seek_origin::end) == static_cast<int64_t>(10 * sector));
        CHECK(read_bytes(cd, 1).empty());
    }

    TEST_CASE("should_reject_negative_target") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();
        cd.seek(100, seek_origin::set);

        CHECK_THROWS_AS(cd.seek(-1, seek_origin::set), std::invalid_argument);
        CHECK_THROWS_AS(cd.seek(-101, seek_origin::cur), std::invalid_argument);
        CHECK(cd.tell() == 100);
        check_buffer_invariant(cd);
    }

    TEST_CASE("should_not_wrap_sector_numbers_far_past_the_end") {
        mock_drive drive({200});
        sector_stream cd(drive.backend);
        cd.open();

        // 2^32 sectors further on, the sector number no longer fits lsn_t
        const int64_t target = (int64_t(1) << 32) * static_cast<int64_t>(sector)
                               + 100 * static_cast<int64_t>(sector) + 7;
        CHECK(cd.seek(target, seek_origin::set) == target);
        CHECK(drive.state->read_calls == 0);
        CHECK(read_bytes(cd, 16).empty());
        CHECK(drive.state->read_calls == 0);
        CHECK(cd.tell() == target);
    }

    TEST_CASE("should_reject_offsets_that_overflow") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();

        const int64_t top = std::numeric_limits<int64_t>::max();
        CHECK(cd.seek(top, seek_origin::set) == top);
        CHECK_THROWS_AS(cd.seek(1, seek_origin::cur), std::invalid_argument);
        CHECK_THROWS_AS(cd.seek(top, seek_origin::end), std::invalid_argument);
        CHECK(cd.tell() == top);
        CHECK(cd.seek(-top, seek_origin::cur) == 0);
        CHECK(read_bytes(cd, 32) == mock_pcm(0, 32));
    }

    TEST_CASE("should_seek_to_sector_start") {
        mock_drive drive({10, 10});
        sector_stream cd(drive.backend);
        cd.open();

        auto toc = cd.toc();
        CHECK(cd.seek_to_sector(toc[1].start_sector) == static_cast<int64_t>(10 * sector));
        CHECK(cd.buffered_bytes() == sector);
        CHECK(read_bytes(cd, 64) == mock_pcm(static_cast<int64_t>(10 * sector), 64));
    }

    TEST_CASE("should_land_on_sector_boundary_when_refetch_fails") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();
        read_bytes(cd, 100);

        drive.state->on_read = [](lsn_t, uint32_t) {
            throw driver_error(driver_status::failed, "seek error");
        };
        CHECK_THROWS_AS(cd.seek(static_cast<int64_t>(sector * 4 + 17), seek_origin::set), driver_error);
        CHECK(cd.tell() == static_cast<int64_t>(sector * 4));
        CHECK(cd.buffered_bytes() == 0);
        check_buffer_invariant(cd);

        drive.state->on_read = nullptr;
        CHECK(read_bytes(cd, 10) == mock_pcm(static_cast<int64_t>(sector * 4), 10));
    }
}

TEST_SUITE("SectorStream::DriveControl") {

    TEST_CASE("should_report_drive_type_and_interface") {
        mock_drive drive({10});
        drive.state->drive_type = 22;
        drive.state->interface_type = interface_cooked_ioctl;
        sector_stream cd(drive.backend);
        cd.open();

        CHECK(cd.drive_type() == 22);
        CHECK(cd.interface_type() == interface_cooked_ioctl);

        cd.close();
        CHECK(cd.drive_type() == -1);
        CHECK(cd.interface_type() == -1);
    }

    TEST_CASE("should_forward_speed") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();

        cd.set_speed(4);
        CHECK(drive.state->speed == 4);
        CHECK(cd.options().speed == 4);

        drive.state->on_set_speed = [](int) {
            throw driver_error(driver_status::not_permitted, "speed locked");
        };
        CHECK_THROWS_AS(cd.set_speed(8), driver_error);
        CHECK(cd.options().speed == 4);
        CHECK(cd.is_open());
    }

    TEST_CASE("should_apply_correction_mode_now_or_on_open") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);

        cd.set_correction_mode(correction_disable);
        CHECK(drive.state->correction_mode == -1);
        cd.open();
        CHECK(drive.state->correction_mode == correction_disable);

        cd.set_correction_mode(correction_repair | correction_never_skip);
        CHECK(drive.state->correction_mode == (correction_repair | correction_never_skip));
    }

    TEST_CASE("should_bound_search_overlap") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();

        CHECK_THROWS_AS(cd.force_search_overlap(-1), std::invalid_argument);
        CHECK_THROWS_AS(cd.force_search_overlap(76), std::invalid_argument);
        CHECK(drive.state->search_overlap == -1);

        cd.force_search_overlap(0);
        CHECK(drive.state->search_overlap == 0);
        cd.force_search_overlap(75);
        CHECK(drive.state->search_overlap == 75);
    }

    TEST_CASE("should_close_after_eject") {
        mock_drive drive({10});
        sector_stream cd(drive.backend);
        cd.open();
        read_bytes(cd, 100);

        cd.eject_media();
        CHECK(drive.state->eject_calls == 1);
        CHECK_FALSE(cd.is_open());
        CHECK(cd.tell() == -1);
    }

    TEST_CASE("should_close_even_when_eject_fails") {
        mock_drive drive({10});
        drive.state->on_eject = [] {
            throw driver_error(driver_status::not_permitted, "tray locked");
        };
        sector_stream cd(drive.backend);
        cd.open();

        CHECK_THROWS_AS(cd.eject_media(), driver_error);
        CHECK_FALSE(cd.is_open());
        CHECK(drive.state->close_calls == 1);
    }

    TEST_CASE("should_close_tray_without_open_stream") {
        mock_drive drive({10});
        std::string hint_seen = "unset";
        drive.backend->on_close_tray = [&](const std::string& hint) { hint_seen = hint; };

        stream_options options;
        options.device = "/dev/cdrom";
        sector_stream cd(drive.backend, options);

        CHECK_NOTHROW(cd.close_tray());
        CHECK(drive.state->close_tray_calls == 1);
        CHECK(hint_seen == "/dev/cdrom");
        CHECK(drive.backend->is_initialized());
        CHECK_FALSE(cd.is_open());
    }
}
