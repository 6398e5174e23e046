// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "report_writer.hpp"

#include "util/common/config.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <vector>

namespace stakescan::report {
    namespace {
        void add_span(Json::Value& obj, const scanner::stake_span& span) {
            obj["unique_blocks"] = Json::UInt64(span.m_blocks.size());
            auto range = Json::Value(Json::objectValue);
            if(span.m_blocks.empty()) {
                range["first_timestamp"] = Json::Value();
                range["last_timestamp"] = Json::Value();
            } else {
                range["first_timestamp"] = Json::Int64(span.m_first_time);
                range["last_timestamp"] = Json::Int64(span.m_last_time);
            }
            range["duration_seconds"] = Json::Int64(span.duration());
            obj["time_range"] = range;
        }

        auto to_json(const scanner::finality_provider_stats& stats)
            -> Json::Value {
            auto ret = Json::Value(Json::objectValue);
            ret["stake_count"] = Json::UInt64(stats.m_stake_count);
            ret["total_staked_amount"] = Json::UInt64(stats.m_total_amount);
            ret["distinct_staker_count"]
                = Json::UInt64(stats.m_stakers.size());
            ret["first_height"] = Json::UInt64(stats.m_first_height);
            ret["last_height"] = Json::UInt64(stats.m_last_height);
            ret["average_stake"] = Json::UInt64(
                stats.m_stake_count == 0
                    ? 0
                    : stats.m_total_amount / stats.m_stake_count);
            add_span(ret, stats.m_span);
            auto versions = Json::Value(Json::arrayValue);
            for(auto v : stats.m_versions) {
                versions.append(Json::UInt(v));
            }
            ret["versions"] = versions;
            return ret;
        }

        auto to_json(const scanner::version_stats& stats) -> Json::Value {
            auto ret = Json::Value(Json::objectValue);
            ret["stake_count"] = Json::UInt64(stats.m_stake_count);
            ret["total_staked_amount"] = Json::UInt64(stats.m_total_amount);
            ret["distinct_staker_count"]
                = Json::UInt64(stats.m_stakers.size());
            ret["finality_provider_count"]
                = Json::UInt64(stats.m_finality_providers.size());
            add_span(ret, stats.m_span);
            return ret;
        }

        auto to_json(const babylon::stake_record& rec) -> Json::Value {
            auto ret = Json::Value(Json::objectValue);
            ret["txid"] = rec.m_txid;
            ret["height"] = Json::UInt64(rec.m_height);
            ret["version"] = Json::UInt(rec.m_data.m_version);
            ret["staker_public_key"]
                = stakescan::to_string(rec.m_data.m_staker_key);
            ret["finality_provider"]
                = stakescan::to_string(rec.m_data.m_fp_key);
            ret["staking_time"] = Json::UInt(rec.m_data.m_staking_time);
            ret["amount"] = Json::UInt64(rec.m_amount);
            return ret;
        }
    }

    auto to_json(const scanner::scan_report& report) -> Json::Value {
        auto ret = Json::Value(Json::objectValue);

        auto window = Json::Value(Json::objectValue);
        window["start_height"] = Json::UInt64(report.m_window.m_start);
        window["end_height"] = Json::UInt64(report.m_window.m_end);
        ret["scan_window"] = window;

        ret["total_transactions"] = Json::UInt64(report.m_total_transactions);
        ret["babylon_tagged"] = Json::UInt64(report.m_babylon_tagged);
        ret["total_stakes"] = Json::UInt64(report.m_total_stakes);
        ret["total_rejected"] = Json::UInt64(report.m_total_rejected);
        ret["total_staked_amount"] = Json::UInt64(report.m_total_amount);
        ret["distinct_stakers"] = Json::UInt64(report.m_stakers.size());
        add_span(ret, report.m_span);

        auto rejections = Json::Value(Json::objectValue);
        for(auto reason : babylon::all_rejection_reasons) {
            const auto it = report.m_rejections.find(reason);
            rejections[babylon::to_string(reason)] = Json::UInt64(
                it == report.m_rejections.end() ? 0 : it->second);
        }
        ret["rejections"] = rejections;

        ret["blocks_skipped"]
            = Json::UInt64(report.m_skipped_heights.size());
        auto skipped = Json::Value(Json::arrayValue);
        for(auto height : report.m_skipped_heights) {
            skipped.append(Json::UInt64(height));
        }
        ret["skipped_heights"] = skipped;

        auto fps = Json::Value(Json::objectValue);
        for(const auto& [key, stats] : report.m_finality_providers) {
            fps[stakescan::to_string(key)] = to_json(stats);
        }
        ret["finality_providers"] = fps;

        auto versions = Json::Value(Json::objectValue);
        for(const auto& [version, stats] : report.m_versions) {
            versions[std::to_string(version)] = to_json(stats);
        }
        ret["versions"] = versions;

        auto stakes = Json::Value(Json::arrayValue);
        for(const auto& rec : report.m_stakes) {
            stakes.append(to_json(rec));
        }
        ret["stakes"] = stakes;

        return ret;
    }

    auto serialize(const scanner::scan_report& report) -> std::string {
        auto builder = Json::StreamWriterBuilder();
        builder["indentation"] = "  ";
        return Json::writeString(builder, to_json(report)) + "\n";
    }

    auto write_report(const scanner::scan_report& report,
                      const std::string& path) -> std::optional<std::string> {
        const auto doc = serialize(report);
        if(path == config::stdout_report_file) {
            std::cout << doc << std::flush;
            if(!std::cout.good()) {
                return "Failed to write report to stdout";
            }
            return std::nullopt;
        }

        auto file = std::ofstream(path, std::ios::out | std::ios::trunc);
        if(!file.good()) {
            return "Unable to open report file " + path;
        }
        file << doc;
        file.close();
        if(file.fail()) {
            return "Failed to write report file " + path;
        }
        return std::nullopt;
    }

    void log_summary(const scanner::scan_report& report, logging::log& log) {
        log.info("Scanned blocks",
                 report.m_window.m_start,
                 "to",
                 report.m_window.m_end);
        log.info("Transactions examined:", report.m_total_transactions);
        log.info("Babylon-tagged payloads:", report.m_babylon_tagged);
        log.info("Valid stakes:",
                 report.m_total_stakes,
                 "rejected:",
                 report.m_total_rejected);
        for(const auto& [reason, count] : report.m_rejections) {
            log.debug("  ", babylon::to_string(reason), count);
        }
        if(!report.m_skipped_heights.empty()) {
            log.warn("Blocks skipped:", report.m_skipped_heights.size());
        }
        log.info("Total staked:",
                 report.m_total_amount,
                 "sat from",
                 report.m_stakers.size(),
                 "stakers to",
                 report.m_finality_providers.size(),
                 "finality providers");
        if(!report.m_span.m_blocks.empty()) {
            log.info("Stakes found in",
                     report.m_span.m_blocks.size(),
                     "blocks over",
                     report.m_span.duration(),
                     "seconds");
        }

        using fp_entry = std::pair<const pubkey_t*,
                                   const scanner::finality_provider_stats*>;
        auto ranked = std::vector<fp_entry>();
        for(const auto& [key, stats] : report.m_finality_providers) {
            ranked.emplace_back(&key, &stats);
        }
        std::stable_sort(ranked.begin(),
                         ranked.end(),
                         [](const fp_entry& lhs, const fp_entry& rhs) {
                             return lhs.second->m_total_amount
                                  > rhs.second->m_total_amount;
                         });
        if(ranked.size() > summary_top_providers) {
            ranked.resize(summary_top_providers);
        }
        for(const auto& [key, stats] : ranked) {
            log.info("Finality provider",
                     stakescan::to_string(*key),
                     stats->m_stake_count,
                     "stakes,",
                     stats->m_total_amount,
                     "sat,",
                     stats->m_stakers.size(),
                     "stakers");
        }
    }
}
