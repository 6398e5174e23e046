// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_UTIL_RPC_HTTP_EVENT_HANDLER_H_
#define STAKESCAN_SRC_UTIL_RPC_HTTP_EVENT_HANDLER_H_

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace stakescan::rpc {
    /// Event handler interface for tracking events on non-blocking file
    /// descriptors.
    class event_handler {
      public:
        /// Type of event to register interest in.
        enum class event_type {
            /// Remove file descriptor.
            remove,
            /// Ready to read event.
            in,
            /// Ready to write event.
            out,
            /// Read and write events.
            inout,
        };

        event_handler() = default;
        virtual ~event_handler() = default;

        event_handler(const event_handler&) = delete;
        auto operator=(const event_handler&) -> event_handler& = delete;
        event_handler(event_handler&&) = delete;
        auto operator=(event_handler&&) -> event_handler& = delete;

        /// Type alias for an event. First value is the file descriptor, second
        /// is true if the event is a timeout.
        using event = std::pair<int, bool>;

        /// Initializes the event handler.
        /// \return true if initialization succeeded.
        virtual auto init() -> bool = 0;

        /// Sets the timeout after which poll reports a timeout event even if
        /// there is no activity.
        /// \param timeout_ms timeout in milliseconds. -1 to disable timeout.
        virtual void set_timeout(long timeout_ms) = 0;

        /// Registers a file descriptor to track for events.
        /// \param fd file descriptor.
        /// \param et event type.
        /// \return true if the registration succeeded.
        virtual auto register_fd(int fd, event_type et) -> bool = 0;

        /// Wait for events on tracked file descriptors. Blocks until at least
        /// one event is available, or the timeout expires.
        /// \return list of events, or std::nullopt if there was an error
        ///         during polling.
        virtual auto poll() -> std::optional<std::vector<event>> = 0;
    };
}

#endif // STAKESCAN_SRC_UTIL_RPC_HTTP_EVENT_HANDLER_H_
