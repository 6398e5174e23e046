// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace stakescan {
    buffer::buffer(const void* data, size_t len) {
        append(data, len);
    }

    void buffer::clear() {
        m_data.clear();
    }

    void buffer::append(const void* data, size_t len) {
        if(len == 0) {
            return;
        }
        const auto orig_size = m_data.size();
        m_data.resize(orig_size + len);
        std::memcpy(&m_data[orig_size], data, len);
    }

    void buffer::push_back(unsigned char byte) {
        m_data.push_back(static_cast<std::byte>(byte));
    }

    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::empty() const -> bool {
        return m_data.empty();
    }

    auto buffer::data() -> void* {
        return m_data.data();
    }

    auto buffer::data() const -> const void* {
        return m_data.data();
    }

    auto buffer::data_at(size_t offset) const -> const void* {
        return &m_data[offset];
    }

    auto buffer::byte_at(size_t offset) const -> unsigned char {
        return static_cast<unsigned char>(m_data[offset]);
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }

    auto buffer::operator!=(const buffer& other) const -> bool {
        return m_data != other.m_data;
    }

    auto buffer::operator<(const buffer& other) const -> bool {
        return m_data < other.m_data;
    }

    auto buffer::slice(size_t offset, size_t len) const -> buffer {
        auto ret = buffer();
        if(offset >= m_data.size()) {
            return ret;
        }
        const auto n = std::min(len, m_data.size() - offset);
        ret.append(&m_data[offset], n);
        return ret;
    }

    auto buffer::c_ptr() const -> const unsigned char* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const unsigned char*>(m_data.data());
    }

    auto buffer::to_hex() const -> std::string {
        return stakescan::to_hex(c_ptr(), m_data.size());
    }

    auto buffer::from_hex(const std::string& hex) -> std::optional<buffer> {
        // Large enough for any standard output script, including the
        // relaxed OP_RETURN size limit.
        constexpr auto max_size = 2 * 1024 * 1024;
        if(hex.empty() || ((hex.size() % 2) != 0) || (hex.size() > max_size)) {
            return std::nullopt;
        }

        auto ret = stakescan::buffer();
        ret.m_data.reserve(hex.size() / 2);

        for(size_t i = 0; i < hex.size(); i += 2) {
            const auto hi = hex_digit_value(hex[i]);
            const auto lo = hex_digit_value(hex[i + 1]);
            if(!hi.has_value() || !lo.has_value()) {
                return std::nullopt;
            }
            ret.push_back(static_cast<unsigned char>((*hi << 4U) | *lo));
        }

        return ret;
    }

    auto hex_digit_value(char c) -> std::optional<unsigned char> {
        if(c >= '0' && c <= '9') {
            return static_cast<unsigned char>(c - '0');
        }
        if(c >= 'a' && c <= 'f') {
            return static_cast<unsigned char>(c - 'a' + 10);
        }
        if(c >= 'A' && c <= 'F') {
            return static_cast<unsigned char>(c - 'A' + 10);
        }
        return std::nullopt;
    }

    auto to_hex(const unsigned char* data, size_t len) -> std::string {
        static constexpr std::array<char, 16> digits{'0',
                                                     '1',
                                                     '2',
                                                     '3',
                                                     '4',
                                                     '5',
                                                     '6',
                                                     '7',
                                                     '8',
                                                     '9',
                                                     'a',
                                                     'b',
                                                     'c',
                                                     'd',
                                                     'e',
                                                     'f'};
        auto ret = std::string();
        ret.reserve(len * 2);
        for(size_t i = 0; i < len; i++) {
            ret.push_back(digits[data[i] >> 4U]);
            ret.push_back(digits[data[i] & 0x0fU]);
        }
        return ret;
    }
}
