// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "scan_window.hpp"

#include <tuple>

namespace stakescan::scanner {
    auto scan_window::operator==(const scan_window& rhs) const -> bool {
        return std::tie(m_start, m_end) == std::tie(rhs.m_start, rhs.m_end);
    }

    auto scan_window::size() const -> uint64_t {
        return m_end - m_start + 1;
    }

    auto scan_window::contains(bitcoin::block_height_t height) const -> bool {
        return height >= m_start && height <= m_end;
    }

    scan_window::iterator::iterator(bitcoin::block_height_t height)
        : m_height(height) {}

    auto scan_window::iterator::operator*() const -> reference {
        return m_height;
    }

    auto scan_window::iterator::operator++() -> iterator& {
        m_height++;
        return *this;
    }

    auto scan_window::iterator::operator++(int) -> iterator {
        auto ret = *this;
        m_height++;
        return ret;
    }

    auto scan_window::iterator::operator==(const iterator& rhs) const
        -> bool {
        return m_height == rhs.m_height;
    }

    auto scan_window::iterator::operator!=(const iterator& rhs) const
        -> bool {
        return m_height != rhs.m_height;
    }

    auto scan_window::begin() const -> iterator {
        return iterator(m_start);
    }

    auto scan_window::end() const -> iterator {
        return iterator(m_end + 1);
    }

    auto compute_window(bitcoin::block_height_t tip, uint64_t size)
        -> std::optional<scan_window> {
        if(size == 0) {
            return std::nullopt;
        }
        auto start = size > tip ? bitcoin::block_height_t{0} : tip - size + 1;
        return scan_window{start, tip};
    }

    height_cursor::height_cursor(scan_window window) : m_window(window) {}

    auto height_cursor::next() -> std::optional<bitcoin::block_height_t> {
        std::unique_lock l(m_mut);
        if(m_offset >= m_window.size()) {
            return std::nullopt;
        }
        return m_window.m_start + m_offset++;
    }

    void height_cursor::reset() {
        std::unique_lock l(m_mut);
        m_offset = 0;
    }
}
