#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>
#include <cdda/sector_stream.hh>
#include <iostream>

// Declare benchmark suites
namespace cdda::benchmark {
    void register_stream_read_benchmarks(ankerl::nanobench::Bench& bench);
    void register_seek_benchmarks(ankerl::nanobench::Bench& bench);
    void register_null_backend_benchmarks(ankerl::nanobench::Bench& bench);
}

int main(int /*argc*/, char** /*argv*/) {
    std::cout << "Running cdda " << cdda::version() << " benchmarks...\n\n";

    // Create benchmark instance
    ankerl::nanobench::Bench bench;
    bench.performanceCounters(true);

    // Register all benchmark suites
    cdda::benchmark::register_stream_read_benchmarks(bench);
    cdda::benchmark::register_seek_benchmarks(bench);
    cdda::benchmark::register_null_backend_benchmarks(bench);

    return 0;
}
