/**
 * @file buffer.hh
 * @brief Lightweight buffer container for sector data
 * @ingroup sdk
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <type_traits>

namespace cdda {
    /**
     * @class buffer
     * @brief RAII buffer container for raw sector transfers
     * @tparam T Element type (must be trivially copyable)
     * @ingroup sdk
     *
     * A fixed-size alternative to std::vector: the size only changes
     * through an explicit reset(), so a buffer handed to a driver never
     * reallocates behind its back.
     *
     * @code
     * buffer<uint8_t> scratch(4 * bytes_per_sector);
     * session->read_sectors(start, 4, scratch.data(), scratch.size());
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        /**
         * @brief Construct buffer with specified size
         * @param size Number of elements
         *
         * Allocates memory and zero-initializes all elements.
         */
        explicit buffer(std::size_t size = 0)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        /**
         * @brief Get buffer size
         * @return Number of elements in buffer
         */
        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Reset buffer to new size
         * @param newSize New number of elements
         *
         * Discards all existing data and allocates new zero-initialized buffer.
         */
        void reset(std::size_t newSize) {
            m_data = std::make_unique<T[]>(newSize);
            m_size = newSize;
            std::fill_n(m_data.get(), m_size, T{});
        }

        /**
         * @brief Unchecked element access
         *
         * @warning No bounds checking - undefined behavior if pos >= size()
         */
        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

    private:
        std::unique_ptr<T[]> m_data;  ///< Buffer data
        std::size_t m_size;           ///< Number of elements
    };
}
