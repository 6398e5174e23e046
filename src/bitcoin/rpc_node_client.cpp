// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc_node_client.hpp"

namespace stakescan::bitcoin {
    rpc_node_client::rpc_node_client(std::string endpoint,
                                     long timeout,
                                     std::shared_ptr<logging::log> log)
        : rpc::json_rpc_http_client(std::move(endpoint),
                                    timeout,
                                    std::move(log)) {}

    auto rpc_node_client::interpret(const std::string& method,
                                    const std::optional<Json::Value>& res)
        -> call_return_type {
        if(!res.has_value()) {
            return node_error::transient;
        }

        const auto& v = res.value();
        if(!v.isObject()) {
            return node_error::transient;
        }
        if(v.isMember(error_key) && !v[error_key].isNull()) {
            const auto& err = v[error_key];
            if(!err.isObject()) {
                m_log->debug(method, "returned a malformed error object");
                return node_error::transient;
            }
            const auto code = err["code"].isInt() ? err["code"].asInt() : 0;
            m_log->debug(method,
                         "returned error",
                         code,
                         err["message"].isString() ? err["message"].asString()
                                                   : "");
            if(code == rpc_invalid_address_or_key
               || code == rpc_invalid_parameter) {
                return node_error::not_found;
            }
            return node_error::transient;
        }

        if(!v.isMember(result_key) || v[result_key].isNull()) {
            return node_error::not_found;
        }

        return v[result_key];
    }

    auto rpc_node_client::call_sync(const std::string& method,
                                    Json::Value params) -> call_return_type {
        // Shared with the callback so a response that arrives after a failed
        // pump never writes through a dangling reference.
        auto response
            = std::make_shared<std::optional<std::optional<Json::Value>>>();
        call(method,
             std::move(params),
             [response](std::optional<Json::Value> res) {
                 response->emplace(std::move(res));
             });

        while(!response->has_value()) {
            if(!pump()) {
                m_log->debug("Event loop failure during", method);
                return node_error::transient;
            }
        }

        return interpret(method, response->value());
    }

    auto rpc_node_client::get_block_count() -> block_count_return_type {
        auto res = call_sync("getblockcount", Json::Value(Json::arrayValue));
        if(auto* err = std::get_if<node_error>(&res)) {
            return *err;
        }
        const auto& v = std::get<Json::Value>(res);
        if(!v.isUInt64()) {
            m_log->debug("getblockcount returned a non-integer result");
            return node_error::transient;
        }
        return static_cast<block_height_t>(v.asUInt64());
    }

    auto rpc_node_client::get_block(block_height_t height)
        -> block_return_type {
        auto params = Json::Value(Json::arrayValue);
        params.append(Json::UInt64(height));
        auto hash_res = call_sync("getblockhash", std::move(params));
        if(auto* err = std::get_if<node_error>(&hash_res)) {
            return *err;
        }
        const auto& hash = std::get<Json::Value>(hash_res);
        if(!hash.isString()) {
            m_log->debug("getblockhash returned a non-string result for height",
                        height);
            return node_error::transient;
        }

        params = Json::Value(Json::arrayValue);
        params.append(hash.asString());
        params.append(block_verbosity_full);
        auto block_res = call_sync("getblock", std::move(params));
        if(auto* err = std::get_if<node_error>(&block_res)) {
            return *err;
        }

        auto blk = block_from_json(std::get<Json::Value>(block_res));
        if(!blk.has_value()) {
            m_log->debug("Malformed getblock result for height", height);
            return node_error::transient;
        }
        return std::move(blk.value());
    }

    auto rpc_node_client::get_transaction(const std::string& txid)
        -> transaction_return_type {
        auto params = Json::Value(Json::arrayValue);
        params.append(txid);
        params.append(true);
        auto res = call_sync("getrawtransaction", std::move(params));
        if(auto* err = std::get_if<node_error>(&res)) {
            return *err;
        }

        auto tx = transaction_from_json(std::get<Json::Value>(res));
        if(!tx.has_value()) {
            m_log->debug("Malformed getrawtransaction result for", txid);
            return node_error::transient;
        }
        return std::move(tx.value());
    }

    auto make_rpc_node_client_factory(std::string endpoint,
                                      long timeout,
                                      std::shared_ptr<logging::log> log)
        -> node_client_factory {
        return [endpoint = std::move(endpoint),
                timeout,
                log = std::move(log)]() -> std::unique_ptr<node_client> {
            auto client
                = std::make_unique<rpc_node_client>(endpoint, timeout, log);
            if(!client->init()) {
                return nullptr;
            }
            return client;
        };
    }
}
