// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_UTIL_RPC_HTTP_EPOLL_EVENT_HANDLER_H_
#define STAKESCAN_SRC_UTIL_RPC_HTTP_EPOLL_EVENT_HANDLER_H_

#include "event_handler.hpp"

#include <chrono>
#include <set>

namespace stakescan::rpc {
    /// Event handler implementation using Linux epoll.
    class epoll_event_handler : public event_handler {
      public:
        epoll_event_handler() = default;
        ~epoll_event_handler() override;

        epoll_event_handler(const epoll_event_handler&) = delete;
        auto operator=(const epoll_event_handler&)
            -> epoll_event_handler& = delete;
        epoll_event_handler(epoll_event_handler&&) = delete;
        auto
        operator=(epoll_event_handler&&) -> epoll_event_handler& = delete;

        /// \copydoc event_handler::init
        auto init() -> bool override;

        /// \copydoc event_handler::set_timeout
        void set_timeout(long timeout_ms) override;

        /// \copydoc event_handler::register_fd
        auto register_fd(int fd, event_type et) -> bool override;

        /// \copydoc event_handler::poll
        auto poll() -> std::optional<std::vector<event>> override;

      private:
        using clock_type = std::chrono::steady_clock;

        /// Longest single epoll_wait when no timer is armed.
        static constexpr long idle_wait_ms{1000};

        int m_epoll{-1};
        std::optional<clock_type::time_point> m_deadline;
        std::set<int> m_tracked;
    };
}

#endif // STAKESCAN_SRC_UTIL_RPC_HTTP_EPOLL_EVENT_HANDLER_H_
