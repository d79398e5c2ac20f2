#include <cdda/sdk/io_stream.hh>
#include <cdda/sdk/endian.hh>
#include <algorithm>
#include <cstring>
#include <fstream>

namespace cdda {

namespace {

std::ios::openmode open_mode_of(const char* mode) {
    const bool update = std::strchr(mode, '+') != nullptr;
    switch (mode[0]) {
        case 'r':
            return std::ios::binary | std::ios::in | (update ? std::ios::out : std::ios::openmode{});
        case 'w':
            return std::ios::binary | std::ios::out | std::ios::trunc | (update ? std::ios::in : std::ios::openmode{});
        case 'a':
            return std::ios::binary | std::ios::out | std::ios::app | (update ? std::ios::in : std::ios::openmode{});
        default:
            return std::ios::binary | std::ios::in;
    }
}

// Ripped tracks and raw PCM dumps go through this
class file_stream : public io_stream {
public:
    file_stream(const char* filename, std::ios::openmode mode)
        : m_mode(mode) {
        m_file.open(filename, mode);
    }

    size_t read(void* ptr, size_t size_bytes) override {
        if (!is_open() || (m_mode & std::ios::in) == 0) {
            return 0;
        }
        m_file.read(static_cast<char*>(ptr), static_cast<std::streamsize>(size_bytes));
        const auto got = static_cast<size_t>(m_file.gcount());
        // a short read leaves eof set; clear it so tell() and writes keep working
        if (got < size_bytes) {
            m_file.clear();
        }
        return got;
    }

    size_t write(const void* ptr, size_t size_bytes) override {
        if (!is_open() || (m_mode & std::ios::out) == 0) {
            return 0;
        }
        m_file.write(static_cast<const char*>(ptr), static_cast<std::streamsize>(size_bytes));
        if (!m_file) {
            m_file.clear();
            return 0;
        }
        return size_bytes;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!is_open()) {
            return -1;
        }
        std::ios::seekdir dir = std::ios::beg;
        if (whence == seek_origin::cur) {
            dir = std::ios::cur;
        } else if (whence == seek_origin::end) {
            dir = std::ios::end;
        }
        m_file.clear();
        // fstream shares one position between get and put areas
        if (!m_file.seekg(offset, dir)) {
            m_file.clear();
            return -1;
        }
        return tell();
    }

    int64_t tell() override {
        if (!is_open()) {
            return -1;
        }
        return static_cast<int64_t>(m_file.tellg());
    }

    int64_t get_size() override {
        if (!is_open()) {
            return -1;
        }
        m_file.flush();
        m_file.clear();
        const auto here = m_file.tellg();
        m_file.seekg(0, std::ios::end);
        const auto size = m_file.tellg();
        m_file.seekg(here);
        return static_cast<int64_t>(size);
    }

    void close() override {
        m_file.close();
    }

    bool is_open() const override {
        return m_file.is_open();
    }

private:
    std::ios::openmode m_mode;
    std::fstream m_file;
};

} // namespace

bool write_u16le(io_stream* stream, uint16_t value) {
    const uint16_t le = swap16le(value);
    return stream->write(&le, sizeof(le)) == sizeof(le);
}

bool write_u32le(io_stream* stream, uint32_t value) {
    const uint32_t le = swap32le(value);
    return stream->write(&le, sizeof(le)) == sizeof(le);
}

size_t write_pcm_le(io_stream* stream, const void* pcm, size_t size_bytes) {
    size_bytes -= size_bytes % bytes_per_sample;
    if (is_little_endian) {
        return stream->write(pcm, size_bytes);
    }

    const auto* in = static_cast<const uint8_t*>(pcm);
    uint8_t swapped[bytes_per_sector];
    size_t written = 0;
    while (written < size_bytes) {
        const size_t chunk = std::min(size_bytes - written, sizeof(swapped));
        for (size_t i = 0; i < chunk; i += bytes_per_sample) {
            swapped[i] = in[written + i + 1];
            swapped[i + 1] = in[written + i];
        }
        const size_t n = stream->write(swapped, chunk);
        written += n;
        if (n != chunk) {
            break;
        }
    }
    return written - written % bytes_per_sample;
}

std::unique_ptr<io_stream> io_from_file(const char* filename, const char* mode) {
    if (!filename || !mode) {
        return nullptr;
    }
    auto stream = std::make_unique<file_stream>(filename, open_mode_of(mode));
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

} // namespace cdda
