/**
 * @file io_stream.hh
 * @brief Binary I/O stream abstraction
 * @ingroup sdk_io
 */

#ifndef CDDA_SDK_IO_STREAM_H
#define CDDA_SDK_IO_STREAM_H

#include <cdda/sdk/types.hh>
#include <cdda/sdk/export_cdda_sdk.h>
#include <memory>

namespace cdda {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 * @ingroup sdk_io
 */
enum class seek_origin : int {
    set = 0,  ///< Seek from beginning of stream (SEEK_SET)
    cur = 1,  ///< Seek from current position (SEEK_CUR)
    end = 2   ///< Seek from end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Abstract interface for binary I/O operations
 * @ingroup sdk_io
 *
 * The disc reader (sector_stream) implements this interface, so code
 * written against io_stream can consume CD audio or a file alike.
 *
 * @code
 * // copy the first second of audio from the disc to a file
 * cdda::sector_stream cd(backend);
 * cd.open();
 * auto out = cdda::io_from_file("second.pcm", "wb");
 * std::vector<uint8_t> buf(cdda::bytes_per_sector * cdda::sectors_per_second);
 * cdda::write_pcm_le(out.get(), buf.data(), cd.read(buf.data(), buf.size()));
 * @endcode
 *
 * @see io_from_file(), write_pcm_le(), sector_stream
 */
class io_stream {
public:
    virtual ~io_stream() = default;

    /**
     * @brief Read binary data from stream
     *
     * @param ptr Buffer to read into
     * @param size_bytes Number of bytes to read
     * @return Actual number of bytes read (may be less than requested)
     *
     * @note Returns 0 at end of stream
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Write binary data to stream
     *
     * @return Actual number of bytes written
     *
     * @note Not all streams support writing
     */
    virtual size_t write(const void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Seek to a position in the stream
     *
     * @param offset Byte offset from origin
     * @param whence Origin for seek operation
     * @return New position from start, or -1 on error
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    /**
     * @brief Get current position in stream
     * @return Current byte position from start, or -1 on error
     */
    virtual int64_t tell() = 0;

    /**
     * @brief Get total size of stream
     * @return Total size in bytes, or -1 if unknown
     */
    virtual int64_t get_size() = 0;

    /**
     * @brief Close the stream
     */
    virtual void close() = 0;

    /**
     * @brief Check if stream is open and usable
     */
    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @defgroup io_endian Endian-aware I/O helpers
 * @ingroup sdk_io
 * @brief Write integers and disc audio in little-endian order, as RIFF/WAVE expects
 * @{
 */

CDDA_SDK_EXPORT bool write_u16le(io_stream* stream, uint16_t value);

CDDA_SDK_EXPORT bool write_u32le(io_stream* stream, uint32_t value);

/**
 * @brief Write disc PCM as little-endian 16-bit samples
 *
 * Disc audio is delivered in host order. On big-endian hosts the samples
 * are swapped on the way out; @p pcm itself is left untouched.
 *
 * @param pcm Interleaved 16-bit samples in host order
 * @param size_bytes Byte count; a trailing odd byte is not written
 * @return Bytes written, always even
 */
CDDA_SDK_EXPORT size_t write_pcm_le(io_stream* stream, const void* pcm, size_t size_bytes);

/** @} */ // end of io_endian group

/**
 * @defgroup io_factory I/O Stream Factory Functions
 * @ingroup sdk_io
 * @{
 */

/**
 * @brief Open a file as an I/O stream
 *
 * @param filename Path to file
 * @param mode "rb" to read, "wb" to create or truncate, "ab" to append;
 *        a '+' adds the other direction
 * @return New io_stream, or nullptr if the file cannot be opened
 */
CDDA_SDK_EXPORT std::unique_ptr<io_stream> io_from_file(const char* filename, const char* mode);

/** @} */ // end of io_factory group

} // namespace cdda

#endif // CDDA_SDK_IO_STREAM_H
