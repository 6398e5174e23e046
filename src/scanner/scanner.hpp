// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_SCANNER_SCANNER_H_
#define STAKESCAN_SRC_SCANNER_SCANNER_H_

#include "aggregator.hpp"
#include "babylon/params.hpp"
#include "bitcoin/node_client.hpp"
#include "retry_policy.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <memory>
#include <variant>

namespace stakescan::scanner {
    /// Failures that abort a scan before any report is produced.
    enum class scan_error : uint8_t {
        client_unavailable, ///< A node client could not be created
        tip_unavailable,    ///< The chain tip could not be fetched
        empty_window        ///< The configured scan range is zero
    };

    /// Returns a human-readable description of a scan error.
    /// \param err error to describe.
    /// \return error description.
    auto to_string(scan_error err) -> std::string;

    /// Extracts and decodes the OP_RETURN payload of every transaction in a
    /// block. Transactions without an OP_RETURN output are counted but
    /// otherwise ignored.
    /// \param blk block to process.
    /// \param params global parameters to check stakes against, or nullptr.
    /// \param log log instance for per-payload diagnostics.
    /// \return the block's contribution to the report.
    auto process_block(const bitcoin::block& blk,
                       const babylon::global_params* params,
                       logging::log& log) -> block_result;

    /// \brief Scans the most recent blocks of the chain for stakes.
    ///
    /// Fetches the chain tip once, derives the scan window, then lets a
    /// fixed pool of worker threads claim heights from a shared cursor.
    /// Each worker owns its own node client. Blocks that cannot be fetched
    /// within the retry policy or before the scan deadline are recorded as
    /// skipped.
    class scanner {
      public:
        /// Constructor.
        /// \param opts configuration options.
        /// \param factory creates one node client per worker.
        /// \param params global parameters to check stakes against, or
        ///               nullptr to skip parameter checks.
        /// \param log log instance.
        /// \param sleep wait function used between retries. Defaults to
        ///              sleeping the calling thread.
        scanner(config::options opts,
                bitcoin::node_client_factory factory,
                std::shared_ptr<const babylon::global_params> params,
                std::shared_ptr<logging::log> log,
                retry_policy::sleep_function sleep = {});

        scanner() = delete;
        scanner(const scanner&) = delete;
        auto operator=(const scanner&) -> scanner& = delete;
        scanner(scanner&&) = delete;
        auto operator=(scanner&&) -> scanner& = delete;

        ~scanner() = default;

        /// Runs the scan to completion. Blocks until every worker exits.
        /// \return the report, or the error that prevented the scan.
        auto run() -> std::variant<scan_report, scan_error>;

      private:
        config::options m_opts;
        bitcoin::node_client_factory m_factory;
        std::shared_ptr<const babylon::global_params> m_params;
        std::shared_ptr<logging::log> m_log;
        retry_policy m_retry;

        using deadline_type
            = std::optional<retry_policy::clock_type::time_point>;

        void worker(bitcoin::node_client& client,
                    height_cursor& cursor,
                    aggregator& agg,
                    deadline_type deadline);
    };
}

#endif // STAKESCAN_SRC_SCANNER_SCANNER_H_
