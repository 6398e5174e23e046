// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "aggregator.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace stakescan::scanner {
    auto stake_span::operator==(const stake_span& rhs) const -> bool {
        return std::tie(m_blocks, m_first_time, m_last_time)
            == std::tie(rhs.m_blocks, rhs.m_first_time, rhs.m_last_time);
    }

    void stake_span::add(bitcoin::block_height_t height, int64_t time) {
        if(m_blocks.empty()) {
            m_first_time = time;
            m_last_time = time;
        }
        m_blocks.insert(height);
        m_first_time = std::min(m_first_time, time);
        m_last_time = std::max(m_last_time, time);
    }

    auto stake_span::duration() const -> int64_t {
        return m_last_time - m_first_time;
    }

    auto finality_provider_stats::operator==(
        const finality_provider_stats& rhs) const -> bool {
        return std::tie(m_stake_count,
                        m_total_amount,
                        m_stakers,
                        m_versions,
                        m_first_height,
                        m_last_height,
                        m_span)
            == std::tie(rhs.m_stake_count,
                        rhs.m_total_amount,
                        rhs.m_stakers,
                        rhs.m_versions,
                        rhs.m_first_height,
                        rhs.m_last_height,
                        rhs.m_span);
    }

    auto version_stats::operator==(const version_stats& rhs) const -> bool {
        return std::tie(m_stake_count,
                        m_total_amount,
                        m_stakers,
                        m_finality_providers,
                        m_span)
            == std::tie(rhs.m_stake_count,
                        rhs.m_total_amount,
                        rhs.m_stakers,
                        rhs.m_finality_providers,
                        rhs.m_span);
    }

    auto scan_report::operator==(const scan_report& rhs) const -> bool {
        return std::tie(m_window,
                        m_total_transactions,
                        m_babylon_tagged,
                        m_total_stakes,
                        m_total_rejected,
                        m_rejections,
                        m_skipped_heights,
                        m_total_amount,
                        m_stakers,
                        m_span,
                        m_finality_providers,
                        m_versions,
                        m_stakes)
            == std::tie(rhs.m_window,
                        rhs.m_total_transactions,
                        rhs.m_babylon_tagged,
                        rhs.m_total_stakes,
                        rhs.m_total_rejected,
                        rhs.m_rejections,
                        rhs.m_skipped_heights,
                        rhs.m_total_amount,
                        rhs.m_stakers,
                        rhs.m_span,
                        rhs.m_finality_providers,
                        rhs.m_versions,
                        rhs.m_stakes);
    }

    aggregator::aggregator(scan_window window) {
        m_report.m_window = window;
    }

    void aggregator::check_open() const {
        if(m_closed) {
            throw std::logic_error("Aggregator used after snapshot");
        }
    }

    void aggregator::add_stake(const babylon::stake_record& rec) {
        const auto& data = rec.m_data;

        auto [fp_it, inserted]
            = m_report.m_finality_providers.try_emplace(data.m_fp_key);
        auto& fp = fp_it->second;
        if(inserted) {
            fp.m_first_height = rec.m_height;
            fp.m_last_height = rec.m_height;
        }
        fp.m_stake_count++;
        fp.m_total_amount += rec.m_amount;
        fp.m_stakers.insert(data.m_staker_key);
        fp.m_versions.insert(data.m_version);
        fp.m_first_height = std::min(fp.m_first_height, rec.m_height);
        fp.m_last_height = std::max(fp.m_last_height, rec.m_height);
        fp.m_span.add(rec.m_height, rec.m_time);

        auto& ver = m_report.m_versions[data.m_version];
        ver.m_stake_count++;
        ver.m_total_amount += rec.m_amount;
        ver.m_stakers.insert(data.m_staker_key);
        ver.m_finality_providers.insert(data.m_fp_key);
        ver.m_span.add(rec.m_height, rec.m_time);

        m_report.m_total_stakes++;
        m_report.m_total_amount += rec.m_amount;
        m_report.m_stakers.insert(data.m_staker_key);
        m_report.m_span.add(rec.m_height, rec.m_time);
        m_report.m_stakes.push_back(rec);
    }

    void aggregator::ingest(const babylon::stake_record& rec) {
        std::unique_lock l(m_mut);
        check_open();
        add_stake(rec);
    }

    void aggregator::submit(const block_result& res) {
        std::unique_lock l(m_mut);
        check_open();
        m_report.m_total_transactions += res.m_transactions;
        m_report.m_babylon_tagged += res.m_babylon_tagged;
        for(const auto& rec : res.m_stakes) {
            add_stake(rec);
        }
        for(const auto& [reason, count] : res.m_rejections) {
            m_report.m_rejections[reason] += count;
            m_report.m_total_rejected += count;
        }
    }

    void aggregator::record_skipped(bitcoin::block_height_t height) {
        std::unique_lock l(m_mut);
        check_open();
        m_report.m_skipped_heights.insert(height);
    }

    auto aggregator::snapshot() -> scan_report {
        std::unique_lock l(m_mut);
        check_open();
        m_closed = true;

        auto report = std::move(m_report);
        std::sort(report.m_stakes.begin(),
                  report.m_stakes.end(),
                  [](const auto& lhs, const auto& rhs) {
                      return std::tie(lhs.m_height, lhs.m_txid)
                           < std::tie(rhs.m_height, rhs.m_txid);
                  });
        return report;
    }
}
