// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_UTIL_COMMON_BUFFER_H_
#define STAKESCAN_SRC_UTIL_COMMON_BUFFER_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stakescan {
    /// Buffer to store and retrieve byte data. Used for raw output scripts
    /// and the payloads carved out of them.
    class buffer {
      public:
        buffer() = default;

        /// Constructs a buffer holding a copy of the given bytes.
        /// \param data pointer to the start of the data.
        /// \param len the number of bytes to copy.
        buffer(const void* data, size_t len);

        /// Returns the number of bytes contained in the buffer.
        /// \return the number of bytes.
        [[nodiscard]] auto size() const -> size_t;

        /// Returns true if the buffer holds no bytes.
        [[nodiscard]] auto empty() const -> bool;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return a pointer to the data.
        [[nodiscard]] auto data() -> void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return a pointer to the data.
        [[nodiscard]] auto data() const -> const void*;

        /// Returns a raw pointer to the buffer data at an offset.
        /// \param offset the byte offset into the buffer.
        /// \return a pointer to the data.
        [[nodiscard]] auto data_at(size_t offset) const -> const void*;

        /// Returns the byte at the given offset. Offset must be less than
        /// \ref size.
        /// \param offset the byte offset into the buffer.
        /// \return the byte value.
        [[nodiscard]] auto byte_at(size_t offset) const -> unsigned char;

        /// Adds the given number of bytes from the given pointer to the end of
        /// the buffer.
        /// \param data pointer to the start of the data.
        /// \param len the number of bytes to read.
        void append(const void* data, size_t len);

        /// Appends a single byte to the end of the buffer.
        /// \param byte value to append.
        void push_back(unsigned char byte);

        /// Removes any existing content in the buffer making its size 0.
        void clear();

        auto operator==(const buffer& other) const -> bool;
        auto operator!=(const buffer& other) const -> bool;
        auto operator<(const buffer& other) const -> bool;

        /// Copies a sub-range of the buffer. The range is clamped to the
        /// bytes actually present.
        /// \param offset the first byte to copy.
        /// \param len maximum number of bytes to copy.
        /// \return a new buffer with the copied bytes.
        [[nodiscard]] auto slice(size_t offset, size_t len) const -> buffer;

        /// Returns a pointer to the data, cast to an unsigned char*.
        /// \return unsigned char pointer.
        [[nodiscard]] auto c_ptr() const -> const unsigned char*;

        /// Creates a new buffer from the provided hex string. Accepts upper
        /// and lower case digits.
        /// \param hex string-encoded hex representation of this buffer.
        /// \return a new buffer, or std::nullopt if the string is empty, of
        ///         odd length, too large or contains a non-hex character.
        static auto
        from_hex(const std::string& hex) -> std::optional<buffer>;

        /// Returns a lower-case hex string representation of the contents of
        /// the buffer.
        /// \return a hex encoded string.
        [[nodiscard]] auto to_hex() const -> std::string;

      private:
        std::vector<std::byte> m_data{};
    };

    /// Converts a single hex digit to its value.
    /// \param c character to convert.
    /// \return digit value, or std::nullopt if c is not a hex digit.
    auto hex_digit_value(char c) -> std::optional<unsigned char>;

    /// Encodes a byte range as lower-case hex.
    /// \param data pointer to the first byte.
    /// \param len number of bytes.
    /// \return hex string of length 2 * len.
    auto to_hex(const unsigned char* data, size_t len) -> std::string;
}

#endif // STAKESCAN_SRC_UTIL_COMMON_BUFFER_H_
