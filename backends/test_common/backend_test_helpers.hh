#ifndef CDDA_BACKEND_TEST_HELPERS_HH
#define CDDA_BACKEND_TEST_HELPERS_HH

#include <cdda/sdk/drive_backend.hh>
#include <memory>
#include <string>

namespace cdda::test {

// Common test functions that work with any drive backend implementation
// These are shared between the null, libcdio and cdparanoia backend tests.
// Functions needing a disc report a MESSAGE and return when none is present.

// Device path for hardware tests, from CDDA_TEST_DEVICE; empty for the default drive
std::string test_device_hint();

// Test backend initialization lifecycle
void test_backend_initialization(std::unique_ptr<drive_backend> backend);

// Everything but init() must throw before init()
void test_requires_initialization(std::unique_ptr<drive_backend> backend);

// Test opening and closing sessions
void test_session_open_close(std::unique_ptr<drive_backend> backend, const std::string& hint);

// TOC agrees with track_count() and first_audio_sector()
void test_toc_consistency(std::unique_ptr<drive_backend> backend, const std::string& hint);

// Whole-sector reads, request validation
void test_sector_reads(std::unique_ptr<drive_backend> backend, const std::string& hint);

// sector_stream over the backend: sub-sector reads and seeks
void test_stream_over_backend(std::unique_ptr<drive_backend> backend, const std::string& hint);

// Open a session, or return nullptr after reporting that no disc is available
std::unique_ptr<drive_session> open_or_skip(drive_backend& backend, const std::string& hint);

} // namespace cdda::test

#endif // CDDA_BACKEND_TEST_HELPERS_HH
