// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_SCANNER_AGGREGATOR_H_
#define STAKESCAN_SRC_SCANNER_AGGREGATOR_H_

#include "babylon/staking_payload.hpp"
#include "scan_window.hpp"

#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace stakescan::scanner {
    /// Blocks holding a group of stakes and the range of their block times.
    struct stake_span {
        auto operator==(const stake_span& rhs) const -> bool;

        /// Adds the block of one stake.
        /// \param height height of the block.
        /// \param time block timestamp, seconds since the epoch.
        void add(bitcoin::block_height_t height, int64_t time);

        /// Returns the seconds between the first and last block times.
        [[nodiscard]] auto duration() const -> int64_t;

        /// Heights of the blocks holding the stakes.
        std::set<bitcoin::block_height_t> m_blocks;
        /// Earliest block time. Unset while m_blocks is empty.
        int64_t m_first_time{};
        /// Latest block time.
        int64_t m_last_time{};
    };

    /// Totals for one finality provider.
    struct finality_provider_stats {
        auto operator==(const finality_provider_stats& rhs) const -> bool;

        /// Number of stakes delegated to the provider.
        uint64_t m_stake_count{};
        /// Sum of the delegated stakes, in satoshis.
        uint64_t m_total_amount{};
        /// Distinct staker keys.
        std::set<pubkey_t> m_stakers;
        /// Protocol versions seen in the provider's stakes.
        std::set<uint8_t> m_versions;
        /// Lowest height of a stake to the provider.
        bitcoin::block_height_t m_first_height{};
        /// Highest height of a stake to the provider.
        bitcoin::block_height_t m_last_height{};
        /// Blocks and times of the provider's stakes.
        stake_span m_span;
    };

    /// Totals for one protocol version.
    struct version_stats {
        auto operator==(const version_stats& rhs) const -> bool;

        /// Number of stakes using the version.
        uint64_t m_stake_count{};
        /// Sum of the stakes, in satoshis.
        uint64_t m_total_amount{};
        /// Distinct staker keys.
        std::set<pubkey_t> m_stakers;
        /// Distinct finality provider keys.
        std::set<pubkey_t> m_finality_providers;
        /// Blocks and times of the version's stakes.
        stake_span m_span;
    };

    /// Everything learned from one block, submitted as a unit.
    struct block_result {
        /// Height of the block.
        bitcoin::block_height_t m_height{};
        /// Number of transactions in the block.
        uint64_t m_transactions{};
        /// Number of OP_RETURN payloads starting with the magic tag.
        uint64_t m_babylon_tagged{};
        /// Accepted stakes, in block order.
        std::vector<babylon::stake_record> m_stakes;
        /// Rejected payloads by reason.
        std::map<babylon::rejection_reason, uint64_t> m_rejections;
    };

    /// Immutable result of a scan.
    struct scan_report {
        auto operator==(const scan_report& rhs) const -> bool;

        /// Heights the scan covered.
        scan_window m_window;
        /// Transactions examined in fetched blocks.
        uint64_t m_total_transactions{};
        /// OP_RETURN payloads starting with the magic tag.
        uint64_t m_babylon_tagged{};
        /// Accepted stakes.
        uint64_t m_total_stakes{};
        /// Rejected OP_RETURN payloads.
        uint64_t m_total_rejected{};
        /// Rejected payloads by reason.
        std::map<babylon::rejection_reason, uint64_t> m_rejections;
        /// Heights that could not be fetched.
        std::set<bitcoin::block_height_t> m_skipped_heights;
        /// Sum of all accepted stakes, in satoshis.
        uint64_t m_total_amount{};
        /// Distinct staker keys across all providers.
        std::set<pubkey_t> m_stakers;
        /// Blocks and times of all accepted stakes.
        stake_span m_span;
        /// Per finality provider totals.
        std::map<pubkey_t, finality_provider_stats> m_finality_providers;
        /// Per protocol version totals.
        std::map<uint8_t, version_stats> m_versions;
        /// Accepted stakes ordered by height, then txid.
        std::vector<babylon::stake_record> m_stakes;
    };

    /// \brief Accumulates scan results into run-wide statistics.
    ///
    /// Thread-safe. Results may be submitted in any order; the snapshot
    /// does not depend on it. Taking the snapshot ends the run: any later
    /// submission throws std::logic_error.
    class aggregator {
      public:
        /// Constructor.
        /// \param window heights covered by the run.
        explicit aggregator(scan_window window);

        /// Adds a single stake to the statistics.
        /// \param rec stake to add.
        /// \throw std::logic_error if the snapshot was already taken.
        void ingest(const babylon::stake_record& rec);

        /// Adds all results from one block. Either the whole block is
        /// counted or, if this throws, none of it.
        /// \param res results of the block.
        /// \throw std::logic_error if the snapshot was already taken.
        void submit(const block_result& res);

        /// Records a height whose block could not be fetched.
        /// \param height skipped height.
        /// \throw std::logic_error if the snapshot was already taken.
        void record_skipped(bitcoin::block_height_t height);

        /// Produces the final report and closes the aggregator.
        /// \return the report.
        /// \throw std::logic_error if called more than once.
        auto snapshot() -> scan_report;

      private:
        std::mutex m_mut;
        bool m_closed{false};
        scan_report m_report;

        void check_open() const;
        void add_stake(const babylon::stake_record& rec);
    };
}

#endif // STAKESCAN_SRC_SCANNER_AGGREGATOR_H_
