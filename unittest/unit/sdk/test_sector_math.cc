#include <doctest/doctest.h>
#include <cdda/sdk/types.hh>
#include <cdda/sdk/endian.hh>

using namespace cdda;

TEST_SUITE("SDK::SectorMath") {
    TEST_CASE("CD-DA constants") {
        CHECK(bytes_per_sector == 2352);
        CHECK(samples_per_sector == 588);
        CHECK(sectors_per_second == 75);
        CHECK(sample_rate * bytes_per_sample * channels == bytes_per_sector * sectors_per_second);
        CHECK(max_tracks == 99);
    }

    TEST_CASE("Offset to sector") {
        CHECK(sector_of(0) == 0);
        CHECK(sector_of(2351) == 0);
        CHECK(sector_of(2352) == 1);
        CHECK(sector_of(2352 * 100 + 17) == 100);

        CHECK(sector_floor(2352 * 3 + 5) == 2352 * 3);
        CHECK(sector_floor(2352 * 3) == 2352 * 3);
        CHECK(sector_to_bytes(150) == 352800);
    }

    TEST_CASE("Sectors covering a request") {
        // always one more than the whole sectors in the request
        CHECK(sectors_covering(1) == 1);
        CHECK(sectors_covering(2351) == 1);
        CHECK(sectors_covering(2352) == 2);
        CHECK(sectors_covering(2352 * 7 / 2) == 4);
    }

    TEST_CASE("Alignment") {
        CHECK(is_sector_aligned(0));
        CHECK(is_sector_aligned(2352 * 9));
        CHECK_FALSE(is_sector_aligned(2352 * 9 + 1));
    }

    TEST_CASE("Large discs fit 64-bit offsets") {
        // 99 minutes of audio
        constexpr int64_t sectors = 99 * 60 * sectors_per_second;
        CHECK(sector_to_bytes(sectors) == sectors * 2352);
        CHECK(sector_of(sector_to_bytes(sectors) - 1) == sectors - 1);
    }

    TEST_CASE("Byte swapping") {
        CHECK(swap16(0x1234) == 0x3412);
        CHECK(swap32(0x12345678) == 0x78563412);
        CHECK(swap16(swap16(0xABCD)) == 0xABCD);

        if (is_little_endian) {
            CHECK(swap16le(0x1234) == 0x1234);
            CHECK(swap16be(0x1234) == 0x3412);
            CHECK(swap32le(0x12345678) == 0x12345678);
        } else {
            CHECK(swap16le(0x1234) == 0x3412);
            CHECK(swap16be(0x1234) == 0x1234);
            CHECK(swap32be(0x12345678) == 0x12345678);
        }
    }
}
