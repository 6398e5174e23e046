// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "epoll_event_handler.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <sys/epoll.h>
#include <unistd.h>

namespace stakescan::rpc {
    epoll_event_handler::~epoll_event_handler() {
        if(m_epoll != -1) {
            close(m_epoll);
        }
    }

    auto epoll_event_handler::init() -> bool {
        m_epoll = epoll_create1(EPOLL_CLOEXEC);
        return m_epoll != -1;
    }

    void epoll_event_handler::set_timeout(long timeout_ms) {
        if(timeout_ms < 0) {
            m_deadline.reset();
            return;
        }
        m_deadline = clock_type::now() + std::chrono::milliseconds(timeout_ms);
    }

    auto epoll_event_handler::register_fd(int fd, event_type et) -> bool {
        if(et == event_type::remove) {
            m_tracked.erase(fd);
            // The descriptor may already be closed, in which case the kernel
            // has dropped it from the interest list on its own.
            return epoll_ctl(m_epoll, EPOLL_CTL_DEL, fd, nullptr) == 0
                || errno == EBADF || errno == ENOENT;
        }

        epoll_event ev{};
        ev.data.fd = fd;
        ev.events = EPOLLET;
        if(et == event_type::in || et == event_type::inout) {
            ev.events |= EPOLLIN;
        }
        if(et == event_type::out || et == event_type::inout) {
            ev.events |= EPOLLOUT;
        }

        if(m_tracked.find(fd) == m_tracked.end()) {
            if(epoll_ctl(m_epoll, EPOLL_CTL_ADD, fd, &ev) != 0) {
                return false;
            }
            m_tracked.insert(fd);
            return true;
        }
        return epoll_ctl(m_epoll, EPOLL_CTL_MOD, fd, &ev) == 0;
    }

    auto epoll_event_handler::poll() -> std::optional<std::vector<event>> {
        auto wait_ms = idle_wait_ms;
        if(m_deadline.has_value()) {
            const auto remaining
                = std::chrono::duration_cast<std::chrono::milliseconds>(
                      m_deadline.value() - clock_type::now())
                      .count();
            wait_ms = std::max(0L,
                               std::min(wait_ms, static_cast<long>(remaining)));
        }

        constexpr auto n_events = 256;
        auto evs = std::array<struct epoll_event, n_events>();
        const auto event_count = epoll_wait(m_epoll,
                                            evs.data(),
                                            n_events,
                                            static_cast<int>(wait_ms));
        if(event_count == -1) {
            if(errno == EINTR) {
                return std::vector<event>();
            }
            return std::nullopt;
        }

        auto ret = std::vector<event>();
        ret.reserve(static_cast<size_t>(event_count) + 1);

        if(m_deadline.has_value() && clock_type::now() >= m_deadline.value()) {
            ret.emplace_back(0, true);
            m_deadline.reset();
        }

        for(size_t i = 0; i < static_cast<size_t>(event_count); i++) {
            const int fd = evs[i].data.fd;
            ret.emplace_back(fd, false);
        }

        return ret;
    }
}
