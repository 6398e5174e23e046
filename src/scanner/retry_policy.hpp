// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_SCANNER_RETRY_POLICY_H_
#define STAKESCAN_SRC_SCANNER_RETRY_POLICY_H_

#include "bitcoin/node_client.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <variant>

namespace stakescan::scanner {
    /// \brief Bounded retry with exponential backoff for node calls.
    ///
    /// Transient failures are retried up to the attempt limit, waiting the
    /// initial backoff before the first retry and doubling the wait on each
    /// subsequent retry up to the cap. Not-found results are returned
    /// immediately. No attempt starts, and no wait extends, past the
    /// deadline when one is given.
    class retry_policy {
      public:
        using clock_type = std::chrono::steady_clock;
        /// Function used to wait between attempts.
        using sleep_function = std::function<void(std::chrono::milliseconds)>;

        /// Constructor.
        /// \param max_attempts total attempts, first attempt included.
        ///                     Treated as 1 if 0.
        /// \param initial_backoff wait before the first retry.
        /// \param max_backoff upper bound for any wait.
        /// \param sleep wait function. Defaults to
        ///              std::this_thread::sleep_for.
        retry_policy(size_t max_attempts,
                     std::chrono::milliseconds initial_backoff,
                     std::chrono::milliseconds max_backoff,
                     sleep_function sleep = {});

        /// Returns the wait before the given retry.
        /// \param retry retry number, starting at 1 for the second attempt.
        /// \return initial_backoff * 2^(retry - 1), capped at max_backoff.
        [[nodiscard]] auto backoff(size_t retry) const
            -> std::chrono::milliseconds;

        /// Returns the attempt limit.
        [[nodiscard]] auto max_attempts() const -> size_t;

        /// Runs a node call under the policy.
        /// \tparam T result type of the call.
        /// \param fn call to run.
        /// \param deadline time after which no attempt starts.
        /// \return the first successful result, not_found as soon as it is
        ///         reported, or transient once attempts or time run out.
        template<typename T>
        auto run(const std::function<std::variant<T, bitcoin::node_error>()>&
                     fn,
                 std::optional<clock_type::time_point> deadline
                 = std::nullopt) const
            -> std::variant<T, bitcoin::node_error> {
            for(size_t attempt = 1;; attempt++) {
                if(deadline.has_value() && clock_type::now() >= *deadline) {
                    return bitcoin::node_error::transient;
                }

                auto res = fn();
                auto* err = std::get_if<bitcoin::node_error>(&res);
                if(err == nullptr || *err == bitcoin::node_error::not_found
                   || attempt >= m_max_attempts) {
                    return res;
                }

                auto wait = backoff(attempt);
                if(deadline.has_value()
                   && clock_type::now() + wait >= *deadline) {
                    return res;
                }
                m_sleep(wait);
            }
        }

      private:
        size_t m_max_attempts;
        std::chrono::milliseconds m_initial_backoff;
        std::chrono::milliseconds m_max_backoff;
        sleep_function m_sleep;
    };
}

#endif // STAKESCAN_SRC_SCANNER_RETRY_POLICY_H_
