// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "retry_policy.hpp"

#include <algorithm>
#include <thread>

namespace stakescan::scanner {
    retry_policy::retry_policy(size_t max_attempts,
                               std::chrono::milliseconds initial_backoff,
                               std::chrono::milliseconds max_backoff,
                               sleep_function sleep)
        : m_max_attempts(std::max(max_attempts, size_t{1})),
          m_initial_backoff(initial_backoff),
          m_max_backoff(max_backoff),
          m_sleep(std::move(sleep)) {
        if(!m_sleep) {
            m_sleep = [](std::chrono::milliseconds d) {
                std::this_thread::sleep_for(d);
            };
        }
    }

    auto retry_policy::backoff(size_t retry) const
        -> std::chrono::milliseconds {
        auto wait = m_initial_backoff;
        for(size_t i = 1; i < retry && wait < m_max_backoff; i++) {
            wait *= 2;
        }
        return std::min(wait, m_max_backoff);
    }

    auto retry_policy::max_attempts() const -> size_t {
        return m_max_attempts;
    }
}
