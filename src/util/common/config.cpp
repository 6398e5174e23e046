// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace stakescan::config {
    namespace {
        auto is_digits(const std::string& s) -> bool {
            return !s.empty()
                && std::all_of(s.begin(), s.end(), [](unsigned char c) {
                       return std::isdigit(c) != 0;
                   });
        }

        auto read_ulong(const parser& cfg,
                        const std::string& key,
                        size_t& out) -> std::optional<std::string> {
            if(!cfg.contains(key)) {
                return std::nullopt;
            }
            const auto val = cfg.get_ulong(key);
            if(!val.has_value()) {
                return "Option " + key + " must be a non-negative integer";
            }
            out = val.value();
            return std::nullopt;
        }
    }

    auto read_options(const parser& cfg)
        -> std::variant<options, std::string> {
        auto opts = options{};

        opts.m_rpc_url = cfg.get_string(rpc_url_key).value_or("");

        auto err = read_ulong(cfg, scan_range_key, opts.m_scan_range);
        if(err.has_value()) {
            return err.value();
        }

        err = read_ulong(cfg, worker_count_key, opts.m_worker_count);
        if(err.has_value()) {
            return err.value();
        }

        auto rpc_timeout = static_cast<size_t>(opts.m_rpc_timeout);
        err = read_ulong(cfg, rpc_timeout_key, rpc_timeout);
        if(err.has_value()) {
            return err.value();
        }
        if(rpc_timeout > max_duration_ms) {
            return std::string(rpc_timeout_key) + " must not exceed "
                 + std::to_string(max_duration_ms);
        }
        opts.m_rpc_timeout = static_cast<long>(rpc_timeout);

        err = read_ulong(cfg,
                         retry_max_attempts_key,
                         opts.m_retry_max_attempts);
        if(err.has_value()) {
            return err.value();
        }

        err = read_ulong(cfg,
                         retry_initial_backoff_key,
                         opts.m_retry_initial_backoff);
        if(err.has_value()) {
            return err.value();
        }

        err = read_ulong(cfg,
                         retry_max_backoff_key,
                         opts.m_retry_max_backoff);
        if(err.has_value()) {
            return err.value();
        }

        err = read_ulong(cfg, scan_timeout_key, opts.m_scan_timeout);
        if(err.has_value()) {
            return err.value();
        }

        opts.m_global_params_file = cfg.get_string(global_params_file_key);
        opts.m_report_file
            = cfg.get_string(report_file_key).value_or(opts.m_report_file);

        if(cfg.contains(loglevel_key)) {
            const auto lvl = cfg.get_loglevel(loglevel_key);
            if(!lvl.has_value()) {
                return std::string("Option ") + loglevel_key
                     + " must be one of TRACE, DEBUG, INFO, WARN, ERROR or "
                       "FATAL";
            }
            opts.m_loglevel = lvl.value();
        }

        return opts;
    }

    auto load_options(const std::optional<std::string>& config_file)
        -> std::variant<options, std::string> {
        auto opt = [&]() -> std::variant<options, std::string> {
            if(!config_file.has_value()) {
                auto empty = std::istringstream();
                return read_options(parser(empty));
            }
            auto file = std::ifstream(config_file.value());
            if(!file.good()) {
                return "Unable to open config file " + config_file.value();
            }
            return read_options(parser(file));
        }();

        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_rpc_url.empty()) {
            return "No RPC endpoint configured. Set btc_rpc_url in the "
                   "config file or the BTC_RPC_URL environment variable";
        }
        if(opts.m_rpc_url.rfind("http://", 0) != 0
           && opts.m_rpc_url.rfind("https://", 0) != 0) {
            return "btc_rpc_url must be an http:// or https:// URL";
        }
        if(opts.m_scan_range == 0) {
            return "scan_range must be at least 1";
        }
        if(opts.m_worker_count == 0
           || opts.m_worker_count > max_worker_count) {
            return "worker_count must be between 1 and "
                 + std::to_string(max_worker_count);
        }
        if(opts.m_retry_max_attempts == 0) {
            return "retry_max_attempts must be at least 1";
        }
        if(opts.m_rpc_timeout < 0
           || static_cast<size_t>(opts.m_rpc_timeout) > max_duration_ms) {
            return "rpc_timeout must be between 0 and "
                 + std::to_string(max_duration_ms);
        }
        if(opts.m_retry_max_backoff > max_duration_ms) {
            return "retry_max_backoff must not exceed "
                 + std::to_string(max_duration_ms);
        }
        if(opts.m_scan_timeout > max_scan_timeout) {
            return "scan_timeout must not exceed "
                 + std::to_string(max_scan_timeout);
        }
        if(opts.m_retry_initial_backoff > opts.m_retry_max_backoff) {
            return "retry_initial_backoff must not exceed retry_max_backoff";
        }
        if(opts.m_report_file.empty()) {
            return "report_file must not be empty";
        }

        return std::nullopt;
    }

    auto get_args(int argc, char** argv) -> std::vector<std::string> {
        auto args = std::vector<char*>(static_cast<size_t>(argc));
        std::memcpy(args.data(),
                    argv,
                    static_cast<size_t>(argc) * sizeof(argv));
        auto ret = std::vector<std::string>();
        ret.reserve(static_cast<size_t>(argc));
        for(auto* arg : args) {
            auto str = std::string(arg);
            ret.emplace_back(std::move(str));
        }
        return ret;
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    void parser::init(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            if(!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if(line.empty() || line[0] == '#') {
                continue;
            }
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(std::getline(line_stream, value) && !value.empty()) {
                    m_options.emplace(key, parse_value(value));
                }
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::get_decimal(const std::string& key) const
        -> std::optional<double> {
        return get_val<double>(key);
    }

    auto parser::contains(const std::string& key) const -> bool {
        return find_or_env(key).has_value();
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            if(!value.empty()) {
                return parse_value(value);
            }
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value) -> value_t {
        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }

        // 19 digits always fit in 64 bits.
        static constexpr size_t max_int_digits = 19;
        if(is_digits(value) && value.size() <= max_int_digits) {
            return static_cast<size_t>(std::stoull(value));
        }

        static constexpr size_t max_decimal_len = 64;
        const auto dot = value.find('.');
        if(dot != std::string::npos && value.size() <= max_decimal_len
           && is_digits(value.substr(0, dot))
           && is_digits(value.substr(dot + 1))) {
            return std::stod(value);
        }

        return value;
    }
}
