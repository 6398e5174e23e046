// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "babylon/staking_payload.hpp"
#include "bitcoin/rpc_node_client.hpp"
#include "scanner/retry_policy.hpp"
#include "util/common/config.hpp"

#include <iostream>

// LCOV_EXCL_START
auto main(int argc, char** argv) -> int {
    auto args = stakescan::config::get_args(argc, argv);
    if(args.size() < 2 || args.size() > 3) {
        std::cerr << "Usage: " << args[0] << " [config file] <txid>"
                  << std::endl;
        return -1;
    }

    auto config_file = std::optional<std::string>();
    if(args.size() == 3) {
        config_file = args[1];
    }
    const auto& txid = args.back();

    auto cfg_or_err = stakescan::config::load_options(config_file);
    if(std::holds_alternative<std::string>(cfg_or_err)) {
        std::cerr << "Error loading config: "
                  << std::get<std::string>(cfg_or_err) << std::endl;
        return -1;
    }
    auto opts = std::get<stakescan::config::options>(cfg_or_err);

    auto logger = std::make_shared<stakescan::logging::log>(opts.m_loglevel);

    auto client = stakescan::bitcoin::rpc_node_client(opts.m_rpc_url,
                                                      opts.m_rpc_timeout,
                                                      logger);
    if(!client.init()) {
        logger->error("Failed to initialize node client");
        return -1;
    }

    auto retry = stakescan::scanner::retry_policy(
        opts.m_retry_max_attempts,
        std::chrono::milliseconds(opts.m_retry_initial_backoff),
        std::chrono::milliseconds(opts.m_retry_max_backoff));
    auto res = retry.run<stakescan::bitcoin::transaction>([&]() {
        return client.get_transaction(txid);
    });
    if(auto* err = std::get_if<stakescan::bitcoin::node_error>(&res)) {
        logger->error("Unable to fetch transaction",
                      txid,
                      ":",
                      stakescan::bitcoin::to_string(*err));
        return -1;
    }
    const auto& tx = std::get<stakescan::bitcoin::transaction>(res);

    logger->info("Transaction",
                 tx.m_txid,
                 "has",
                 tx.m_outputs.size(),
                 "outputs");
    for(size_t i = 0; i < tx.m_outputs.size(); i++) {
        const auto& out = tx.m_outputs[i];
        auto cls = stakescan::bitcoin::classify_output(out, i);
        auto* payload
            = std::get_if<stakescan::bitcoin::op_return_payload>(&cls);
        if(payload == nullptr) {
            logger->info("Output",
                         i,
                         stakescan::bitcoin::is_p2tr(out.m_script)
                             ? "taproot"
                             : "other",
                         out.m_value,
                         "sat, script",
                         out.m_script.to_hex());
            continue;
        }
        logger->info("Output",
                     i,
                     "OP_RETURN, payload",
                     payload->m_data.to_hex(),
                     stakescan::babylon::has_magic_tag(payload->m_data)
                         ? "(Babylon tag)"
                         : "");
    }

    const auto payload = stakescan::bitcoin::extract_op_return(tx);
    if(!payload.has_value()) {
        logger->info("No OP_RETURN output");
        return 0;
    }

    if(opts.m_global_params_file.has_value()) {
        logger->info("Global parameters are not checked for single "
                     "transactions");
    }

    auto stake = stakescan::babylon::decode_stake(tx, 0, *payload, nullptr);
    if(auto* reason
       = std::get_if<stakescan::babylon::rejection_reason>(&stake)) {
        logger->info("Not a valid stake:",
                     stakescan::babylon::to_string(*reason));
        return 0;
    }

    const auto& rec = std::get<stakescan::babylon::stake_record>(stake);
    logger->info("Valid stake, version",
                 static_cast<int>(rec.m_data.m_version));
    logger->info("Staker:", stakescan::to_string(rec.m_data.m_staker_key));
    logger->info("Finality provider:",
                 stakescan::to_string(rec.m_data.m_fp_key));
    logger->info("Staking time:", rec.m_data.m_staking_time, "blocks");
    logger->info("Amount:", rec.m_amount, "sat");

    return 0;
}
// LCOV_EXCL_STOP
