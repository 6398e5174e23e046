// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_SCANNER_SCAN_WINDOW_H_
#define STAKESCAN_SRC_SCANNER_SCAN_WINDOW_H_

#include "bitcoin/transaction.hpp"

#include <iterator>
#include <mutex>
#include <optional>

namespace stakescan::scanner {
    /// Inclusive range of block heights examined in one run. Iterating a
    /// window yields its heights in ascending order and may be repeated.
    struct scan_window {
        auto operator==(const scan_window& rhs) const -> bool;

        /// Lowest height in the window.
        bitcoin::block_height_t m_start{};
        /// Highest height in the window.
        bitcoin::block_height_t m_end{};

        /// Returns the number of heights in the window.
        [[nodiscard]] auto size() const -> uint64_t;

        /// Checks whether a height lies inside the window.
        [[nodiscard]] auto contains(bitcoin::block_height_t height) const
            -> bool;

        /// Forward iterator over the heights of a window.
        class iterator {
          public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = bitcoin::block_height_t;
            using difference_type = std::ptrdiff_t;
            using pointer = const value_type*;
            using reference = const value_type&;

            explicit iterator(bitcoin::block_height_t height);

            auto operator*() const -> reference;
            auto operator++() -> iterator&;
            auto operator++(int) -> iterator;
            auto operator==(const iterator& rhs) const -> bool;
            auto operator!=(const iterator& rhs) const -> bool;

          private:
            bitcoin::block_height_t m_height;
        };

        [[nodiscard]] auto begin() const -> iterator;
        [[nodiscard]] auto end() const -> iterator;
    };

    /// Computes the window of the most recent blocks ending at the tip.
    /// \param tip height of the chain tip.
    /// \param size number of blocks to cover.
    /// \return [tip - size + 1, tip], with the start clamped to 0, or
    ///         std::nullopt if size is 0.
    auto compute_window(bitcoin::block_height_t tip, uint64_t size)
        -> std::optional<scan_window>;

    /// Hands out the heights of a window in ascending order, each exactly
    /// once, to any number of threads.
    class height_cursor {
      public:
        /// Constructor.
        /// \param window window to walk.
        explicit height_cursor(scan_window window);

        /// Claims the next unclaimed height.
        /// \return the height, or std::nullopt once every height has been
        ///         claimed.
        auto next() -> std::optional<bitcoin::block_height_t>;

        /// Returns the cursor to the start of the window.
        void reset();

      private:
        scan_window m_window;
        std::mutex m_mut;
        uint64_t m_offset{};
    };
}

#endif // STAKESCAN_SRC_SCANNER_SCAN_WINDOW_H_
