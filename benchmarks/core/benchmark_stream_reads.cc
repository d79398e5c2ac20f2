#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <cdda/backends/null/null_backend.hh>
#include <string>
#include <vector>

namespace cdda::benchmark {

namespace {
    // 74 minutes
    constexpr lsn_t disc_sectors = 74 * 60 * sectors_per_second;

    // Read, starting over at the end of the disc
    void read_wrapping(sector_stream& cd, std::vector<uint8_t>& buffer) {
        if (cd.read(buffer.data(), buffer.size()) < buffer.size()) {
            cd.seek(0, seek_origin::set);
        }
    }
}

void register_stream_read_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Sector Stream Reads");

    auto cd = open_benchmark_stream(disc_sectors);

    // Sub-sector reads are mostly served from the read-ahead buffer
    for (size_t size : {64u, 588u, 4096u}) {
        std::vector<uint8_t> buffer(size);
        bench.batch(size).unit("byte").run("read_" + std::to_string(size), [&] {
            read_wrapping(*cd, buffer);
            ankerl::nanobench::doNotOptimizeAway(buffer.data());
        });
    }

    // One second of audio per call
    std::vector<uint8_t> second(static_cast<size_t>(bytes_per_sector) * sectors_per_second);
    bench.batch(second.size()).unit("byte").run("read_one_second", [&] {
        read_wrapping(*cd, second);
        ankerl::nanobench::doNotOptimizeAway(second.data());
    });
    bench.batch(1).unit("op");
}

void register_seek_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Sector Stream Seeks");

    auto cd = open_benchmark_stream(disc_sectors);
    std::vector<uint8_t> sector(bytes_per_sector);

    // Forward within the buffer: no drive access
    bench.run("seek_buffered", [&] {
        if (cd->buffered_bytes() < 8) {
            cd->seek_to_sector(100);
        }
        cd->seek(4, seek_origin::cur);
        ankerl::nanobench::doNotOptimizeAway(cd->tell());
    });

    // Backward: drops the buffer and refetches a sector
    int64_t target = 0;
    bench.run("seek_refetch", [&] {
        target = (target + sector_to_bytes(997) + 13) % sector_to_bytes(disc_sectors);
        cd->seek(target, seek_origin::set);
        ankerl::nanobench::doNotOptimizeAway(cd->tell());
    });

    bench.run("seek_to_sector_and_read", [&] {
        cd->seek_to_sector(1234);
        cd->read(sector.data(), sector.size());
        ankerl::nanobench::doNotOptimizeAway(sector.data());
    });
}

void register_null_backend_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Null Drive");

    sector_stream cd(create_null_backend(make_disc_layout({disc_sectors})));
    cd.open();

    std::vector<uint8_t> sectors(static_cast<size_t>(bytes_per_sector) * 16);
    bench.batch(sectors.size()).unit("byte").run("null_read_16_sectors", [&] {
        read_wrapping(cd, sectors);
        ankerl::nanobench::doNotOptimizeAway(sectors.data());
    });
    bench.batch(1).unit("op");
}

} // namespace cdda::benchmark
