// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "bitcoin/rpc_node_client.hpp"
#include "report/report_writer.hpp"
#include "scanner.hpp"
#include "util/common/config.hpp"

#include <iostream>

// LCOV_EXCL_START
auto main(int argc, char** argv) -> int {
    auto args = stakescan::config::get_args(argc, argv);
    if(args.size() > 2) {
        std::cerr << "Usage: " << args[0] << " [config file]" << std::endl;
        return -1;
    }

    auto config_file = std::optional<std::string>();
    if(args.size() == 2) {
        config_file = args[1];
    }

    auto cfg_or_err = stakescan::config::load_options(config_file);
    if(std::holds_alternative<std::string>(cfg_or_err)) {
        std::cerr << "Error loading config: "
                  << std::get<std::string>(cfg_or_err) << std::endl;
        return -1;
    }
    auto opts = std::get<stakescan::config::options>(cfg_or_err);

    auto logger = std::make_shared<stakescan::logging::log>(opts.m_loglevel);

    auto params = std::shared_ptr<const stakescan::babylon::global_params>();
    if(opts.m_global_params_file.has_value()) {
        auto params_or_err = stakescan::babylon::global_params::load(
            opts.m_global_params_file.value());
        if(std::holds_alternative<std::string>(params_or_err)) {
            logger->error(std::get<std::string>(params_or_err));
            return -1;
        }
        params = std::make_shared<stakescan::babylon::global_params>(
            std::move(std::get<stakescan::babylon::global_params>(
                params_or_err)));
        logger->info("Loaded",
                     params->versions().size(),
                     "global parameter versions from",
                     opts.m_global_params_file.value());
    }

    auto factory = stakescan::bitcoin::make_rpc_node_client_factory(
        opts.m_rpc_url,
        opts.m_rpc_timeout,
        logger);
    auto scan = stakescan::scanner::scanner(opts, factory, params, logger);

    auto res = scan.run();
    if(auto* err = std::get_if<stakescan::scanner::scan_error>(&res)) {
        logger->error("Scan failed:", stakescan::scanner::to_string(*err));
        return -1;
    }
    const auto& report = std::get<stakescan::scanner::scan_report>(res);

    stakescan::report::log_summary(report, *logger);

    if(auto err = stakescan::report::write_report(report, opts.m_report_file)) {
        logger->error(err.value());
        return -1;
    }
    if(opts.m_report_file != stakescan::config::stdout_report_file) {
        logger->info("Report written to", opts.m_report_file);
    }

    return 0;
}
// LCOV_EXCL_STOP
