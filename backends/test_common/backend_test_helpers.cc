#include "backend_test_helpers.hh"
#include <cdda/error.hh>
#include <cdda/sector_stream.hh>
#include <doctest/doctest.h>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace cdda::test {

std::string test_device_hint() {
    const char* device = std::getenv("CDDA_TEST_DEVICE");
    return device ? std::string(device) : std::string();
}

std::unique_ptr<drive_session> open_or_skip(drive_backend& backend, const std::string& hint) {
    try {
        return backend.open_session(hint);
    } catch (const no_drive_error& e) {
        MESSAGE("Skipping, no disc available: " << e.what());
        return nullptr;
    }
}

void test_backend_initialization(std::unique_ptr<drive_backend> backend) {
    REQUIRE(backend != nullptr);

    // Should not be initialized initially
    CHECK_FALSE(backend->is_initialized());
    CHECK_FALSE(backend->get_name().empty());

    CHECK_NOTHROW(backend->init());
    CHECK(backend->is_initialized());
    CHECK_FALSE(backend->version().empty());

    // Double init should throw
    CHECK_THROWS_AS(backend->init(), state_error);

    CHECK_NOTHROW(backend->shutdown());
    CHECK_FALSE(backend->is_initialized());

    // Double shutdown should be safe
    CHECK_NOTHROW(backend->shutdown());

    // And it can come back
    CHECK_NOTHROW(backend->init());
    CHECK(backend->is_initialized());
    backend->shutdown();
}

void test_requires_initialization(std::unique_ptr<drive_backend> backend) {
    REQUIRE(backend != nullptr);

    CHECK_THROWS_AS(backend->open_session(""), state_error);
    CHECK_THROWS_AS(backend->close_tray(""), state_error);
}

void test_session_open_close(std::unique_ptr<drive_backend> backend, const std::string& hint) {
    REQUIRE(backend != nullptr);
    backend->init();

    auto session = open_or_skip(*backend, hint);
    if (!session) {
        return;
    }
    CHECK(session->is_open());
    CHECK(session->track_count() > 0);
    CHECK(session->track_count() <= max_tracks);
    CHECK(session->interface_type() >= 0);

    session->close();
    CHECK_FALSE(session->is_open());
    CHECK(session->model().empty());
    CHECK(session->drive_type() == -1);
    CHECK(session->interface_type() == -1);

    // Close is idempotent
    CHECK_NOTHROW(session->close());

    std::vector<uint8_t> sector(bytes_per_sector);
    CHECK_THROWS_AS(session->read_sectors(0, 1, sector.data(), sector.size()), not_open_error);

    // A second session after the first one is released
    auto again = backend->open_session(hint);
    CHECK(again->is_open());
}

void test_toc_consistency(std::unique_ptr<drive_backend> backend, const std::string& hint) {
    REQUIRE(backend != nullptr);
    backend->init();

    auto session = open_or_skip(*backend, hint);
    if (!session) {
        return;
    }

    const int count = session->track_count();
    const auto toc = session->read_toc(count);
    REQUIRE(static_cast<int>(toc.size()) == count);
    CHECK_NOTHROW(validate_toc(toc));

    bool found_first_audio = false;
    const lsn_t first_audio = session->first_audio_sector();
    for (const auto& track : toc) {
        CHECK(track.length_sectors > 0);
        CHECK(toc_track_at_sector(toc, track.start_sector) == track.track_num);
        if (track.is_audio() && !found_first_audio) {
            CHECK(track.start_sector == first_audio);
            found_first_audio = true;
        }
    }
    CHECK(found_first_audio);

    // A shorter listing is a prefix of the full one
    if (count > 1) {
        const auto prefix = session->read_toc(1);
        REQUIRE(prefix.size() == 1);
        CHECK(prefix[0].start_sector == toc[0].start_sector);
    }
}

void test_sector_reads(std::unique_ptr<drive_backend> backend, const std::string& hint) {
    REQUIRE(backend != nullptr);
    backend->init();

    auto session = open_or_skip(*backend, hint);
    if (!session) {
        return;
    }
    const lsn_t start = session->first_audio_sector();

    SUBCASE("Single sector") {
        std::vector<uint8_t> sector(bytes_per_sector);
        CHECK_NOTHROW(session->read_sectors(start, 1, sector.data(), sector.size()));
    }

    SUBCASE("Several sectors in one request") {
        std::vector<uint8_t> sectors(4 * bytes_per_sector);
        CHECK_NOTHROW(session->read_sectors(start, 4, sectors.data(), sectors.size()));
    }

    SUBCASE("Partial sectors are refused") {
        std::vector<uint8_t> buffer(bytes_per_sector + 100);
        CHECK_THROWS_AS(session->read_sectors(start, 1, buffer.data(), buffer.size()), alignment_error);
        CHECK_THROWS_AS(session->read_sectors(start, 1, buffer.data(), 100), alignment_error);
        CHECK_THROWS_AS(session->read_sectors(start, 0, buffer.data(), 0), alignment_error);
        CHECK(session->is_open());
    }
}

void test_stream_over_backend(std::unique_ptr<drive_backend> backend, const std::string& hint) {
    REQUIRE(backend != nullptr);

    stream_options options;
    options.device = hint;
    sector_stream cd(std::move(backend), options);
    try {
        cd.open();
    } catch (const no_drive_error& e) {
        MESSAGE("Skipping, no disc available: " << e.what());
        return;
    }
    REQUIRE(cd.is_open());
    CHECK(cd.tell() == 0);
    CHECK(cd.get_size() == sector_to_bytes(cd.length_sectors()));

    const lsn_t first = cd.first_audio_sector();
    CHECK(cd.seek_to_sector(first) == sector_to_bytes(first));

    // three and a half sectors leave half a sector buffered
    std::vector<uint8_t> pcm(bytes_per_sector * 7 / 2);
    CHECK(cd.read(pcm.data(), pcm.size()) == pcm.size());
    CHECK(cd.buffered_bytes() == bytes_per_sector / 2);
    CHECK(cd.buffered_offset() - cd.tell() == static_cast<int64_t>(cd.buffered_bytes()));

    // backward seek refetches the sector holding the target
    const int64_t target = sector_to_bytes(first) + 1000;
    CHECK(cd.seek(target, seek_origin::set) == target);
    CHECK(cd.tell() == target);
    CHECK(cd.buffered_offset() == sector_to_bytes(first + 1));

    cd.close();
    CHECK_FALSE(cd.is_open());
    CHECK(cd.tell() == -1);
}

} // namespace cdda::test
