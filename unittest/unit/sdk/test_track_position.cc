#include <doctest/doctest.h>
#include <cdda/sdk/track_position.hh>
#include <cdda/error.hh>
#include <sstream>

using namespace cdda;

namespace {
    track_position make_track(int num, lsn_t start, lsn_t length, uint8_t flags = track_flag_copy_permitted) {
        track_position t;
        t.track_num = num;
        t.start_sector = start;
        t.length_sectors = length;
        t.flags = flags;
        return t;
    }

    toc_fault fault_of(const toc_t& toc) {
        try {
            validate_toc(toc);
        } catch (const toc_error& e) {
            return e.fault();
        }
        FAIL("expected toc_error");
        return toc_fault::invalid_first_track;
    }
}

TEST_SUITE("SDK::TrackPosition") {
    TEST_CASE("Track flags") {
        auto audio = make_track(1, 0, 100);
        CHECK(audio.is_audio());
        CHECK(audio.is_copy_permitted());
        CHECK_FALSE(audio.is_preemphasis_enabled());

        auto data = make_track(2, 100, 50, track_flag_data);
        CHECK_FALSE(data.is_audio());
        CHECK_FALSE(data.is_copy_permitted());

        auto emphasized = make_track(3, 150, 10, track_flag_preemphasis);
        CHECK(emphasized.is_preemphasis_enabled());
        CHECK(emphasized.is_audio());
    }

    TEST_CASE("Sector containment is half-open") {
        auto t = make_track(2, 100, 150);
        CHECK(t.end_sector() == 250);
        CHECK_FALSE(t.contains_sector(99));
        CHECK(t.contains_sector(100));
        CHECK(t.contains_sector(249));
        CHECK_FALSE(t.contains_sector(250));
    }

    TEST_CASE("Disc length and track lookup") {
        toc_t toc = {make_track(1, 0, 100), make_track(2, 100, 150)};

        CHECK(toc_length_sectors(toc) == 250);
        CHECK(toc_length_sectors({}) == 0);

        CHECK(toc_track_at_sector(toc, 0) == 1);
        CHECK(toc_track_at_sector(toc, 150) == 2);
        CHECK(toc_track_at_sector(toc, 300) == 0);
        CHECK(toc_track_at_sector(toc, -1) == 0);
        CHECK(toc_track_at_sector({}, 0) == 0);
    }

    TEST_CASE("Disc starting after a pregap") {
        toc_t toc = {make_track(1, 150, 1000), make_track(2, 1150, 500)};
        CHECK(toc_length_sectors(toc) == 1650);
        CHECK(toc_track_at_sector(toc, 0) == 0);
        CHECK(toc_track_at_sector(toc, 149) == 0);
        CHECK(toc_track_at_sector(toc, 150) == 1);
        CHECK_NOTHROW(validate_toc(toc));
    }

    TEST_CASE("TOC validation") {
        SUBCASE("Well formed") {
            CHECK_NOTHROW(validate_toc({make_track(1, 0, 100), make_track(2, 100, 150)}));
            CHECK_NOTHROW(validate_toc({}));
        }

        SUBCASE("Gap between sessions") {
            CHECK_NOTHROW(validate_toc({make_track(1, 0, 100), make_track(2, 11500, 300, track_flag_data)}));
        }

        SUBCASE("Negative start") {
            CHECK(fault_of({make_track(1, -5, 100)}) == toc_fault::invalid_sector_address);
        }

        SUBCASE("Zero length") {
            CHECK(fault_of({make_track(1, 0, 100), make_track(2, 100, 0)}) == toc_fault::zero_length_track);
        }

        SUBCASE("Overlapping tracks") {
            CHECK(fault_of({make_track(1, 0, 100), make_track(2, 99, 10)}) == toc_fault::unordered_tracks);
        }

        SUBCASE("Skipped track number") {
            CHECK(fault_of({make_track(1, 0, 100), make_track(3, 100, 10)}) == toc_fault::unordered_tracks);
        }
    }

    TEST_CASE("Debug output") {
        std::ostringstream os;
        os << make_track(2, 100, 150, track_flag_copy_permitted | track_flag_preemphasis);
        const auto text = os.str();
        CHECK(text.find("track=2") != std::string::npos);
        CHECK(text.find("start=100") != std::string::npos);
        CHECK(text.find("length=150") != std::string::npos);
        CHECK(text.find("preemphasis=true") != std::string::npos);
    }
}
