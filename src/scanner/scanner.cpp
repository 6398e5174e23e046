// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "scanner.hpp"

#include <algorithm>
#include <thread>

namespace stakescan::scanner {
    auto to_string(scan_error err) -> std::string {
        switch(err) {
            case scan_error::client_unavailable:
                return "failed to initialize node client";
            case scan_error::tip_unavailable:
                return "failed to fetch chain tip";
            case scan_error::empty_window:
                return "scan range is empty";
        }
        return "unknown";
    }

    auto process_block(const bitcoin::block& blk,
                       const babylon::global_params* params,
                       logging::log& log) -> block_result {
        auto res = block_result();
        res.m_height = blk.m_height;
        res.m_transactions = blk.m_transactions.size();

        for(const auto& tx : blk.m_transactions) {
            const auto payload = bitcoin::extract_op_return(tx);
            if(!payload.has_value()) {
                continue;
            }
            if(babylon::has_magic_tag(payload->m_data)) {
                res.m_babylon_tagged++;
            }

            auto stake
                = babylon::decode_stake(tx, blk.m_height, *payload, params);
            if(auto* reason = std::get_if<babylon::rejection_reason>(&stake)) {
                log.trace("Rejected",
                          tx.m_txid,
                          "at height",
                          blk.m_height,
                          ":",
                          babylon::to_string(*reason));
                res.m_rejections[*reason]++;
                continue;
            }

            auto& rec = std::get<babylon::stake_record>(stake);
            rec.m_time = blk.m_time;
            if(log.enabled(logging::log_level::debug)) {
                log.debug("Stake",
                          rec.m_txid,
                          "of",
                          rec.m_amount,
                          "sat to finality provider",
                          stakescan::to_string(rec.m_data.m_fp_key));
            }
            res.m_stakes.push_back(std::move(rec));
        }

        return res;
    }

    scanner::scanner(config::options opts,
                     bitcoin::node_client_factory factory,
                     std::shared_ptr<const babylon::global_params> params,
                     std::shared_ptr<logging::log> log,
                     retry_policy::sleep_function sleep)
        : m_opts(std::move(opts)),
          m_factory(std::move(factory)),
          m_params(std::move(params)),
          m_log(std::move(log)),
          m_retry(m_opts.m_retry_max_attempts,
                  std::chrono::milliseconds(m_opts.m_retry_initial_backoff),
                  std::chrono::milliseconds(m_opts.m_retry_max_backoff),
                  std::move(sleep)) {}

    auto scanner::run() -> std::variant<scan_report, scan_error> {
        auto deadline = deadline_type();
        if(m_opts.m_scan_timeout > 0) {
            deadline = retry_policy::clock_type::now()
                     + std::chrono::seconds(m_opts.m_scan_timeout);
        }

        auto tip_client = m_factory();
        if(!tip_client) {
            m_log->error("Failed to initialize node client for",
                         m_opts.m_rpc_url);
            return scan_error::client_unavailable;
        }

        auto tip = m_retry.run<bitcoin::block_height_t>(
            [&]() {
                return tip_client->get_block_count();
            },
            deadline);
        if(auto* err = std::get_if<bitcoin::node_error>(&tip)) {
            m_log->error("Unable to fetch chain tip from bitcoind:",
                         bitcoin::to_string(*err));
            return scan_error::tip_unavailable;
        }

        const auto window
            = compute_window(std::get<bitcoin::block_height_t>(tip),
                             m_opts.m_scan_range);
        if(!window.has_value()) {
            return scan_error::empty_window;
        }

        const auto n_workers = static_cast<size_t>(
            std::min<uint64_t>(m_opts.m_worker_count, window->size()));
        auto clients = std::vector<std::unique_ptr<bitcoin::node_client>>();
        clients.push_back(std::move(tip_client));
        while(clients.size() < n_workers) {
            auto client = m_factory();
            if(!client) {
                m_log->error("Failed to initialize node client for",
                             m_opts.m_rpc_url);
                return scan_error::client_unavailable;
            }
            clients.push_back(std::move(client));
        }

        m_log->info("Scanning blocks",
                    window->m_start,
                    "to",
                    window->m_end,
                    "with",
                    clients.size(),
                    "workers");

        auto agg = aggregator(*window);
        auto cursor = height_cursor(*window);
        auto workers = std::vector<std::thread>();
        workers.reserve(clients.size());
        for(auto& client : clients) {
            workers.emplace_back([&, c = client.get()]() {
                worker(*c, cursor, agg, deadline);
            });
        }
        for(auto& t : workers) {
            t.join();
        }

        return agg.snapshot();
    }

    void scanner::worker(bitcoin::node_client& client,
                         height_cursor& cursor,
                         aggregator& agg,
                         deadline_type deadline) {
        for(auto height = cursor.next(); height.has_value();
            height = cursor.next()) {
            const auto h = height.value();
            auto res = m_retry.run<bitcoin::block>(
                [&]() {
                    return client.get_block(h);
                },
                deadline);
            if(auto* err = std::get_if<bitcoin::node_error>(&res)) {
                if(deadline.has_value()
                   && retry_policy::clock_type::now() >= *deadline) {
                    m_log->debug("Scan deadline passed, skipping block", h);
                } else {
                    m_log->debug("Skipping block",
                                 h,
                                 "after",
                                 bitcoin::to_string(*err));
                }
                agg.record_skipped(h);
                continue;
            }

            agg.submit(process_block(std::get<bitcoin::block>(res),
                                     m_params.get(),
                                     *m_log));
        }
    }
}
