// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_BITCOIN_RPC_NODE_CLIENT_H_
#define STAKESCAN_SRC_BITCOIN_RPC_NODE_CLIENT_H_

#include "node_client.hpp"
#include "util/rpc/http/json_rpc_http_client.hpp"

namespace stakescan::bitcoin {
    /// Node client backed by bitcoind's JSON-RPC interface. Issues one
    /// request at a time and pumps the underlying asynchronous client until
    /// the response arrives.
    class rpc_node_client : public node_client,
                            public rpc::json_rpc_http_client {
      public:
        /// Constructor.
        /// \param endpoint bitcoind RPC URL, with credentials if required.
        /// \param timeout per-request timeout in milliseconds.
        /// \param log log instance.
        rpc_node_client(std::string endpoint,
                        long timeout,
                        std::shared_ptr<logging::log> log);

        static constexpr auto error_key = "error";
        static constexpr auto result_key = "result";

        /// bitcoind RPC_INVALID_ADDRESS_OR_KEY, returned for unknown blocks
        /// and transactions.
        static constexpr int rpc_invalid_address_or_key = -5;
        /// bitcoind RPC_INVALID_PARAMETER, returned for heights above the
        /// tip.
        static constexpr int rpc_invalid_parameter = -8;

        /// getrawtransaction verbose / getblock verbosity for decoded
        /// transactions.
        static constexpr int block_verbosity_full = 2;

        /// Calls getblockcount.
        auto get_block_count() -> block_count_return_type override;

        /// Calls getblockhash then getblock with full transaction data.
        auto get_block(block_height_t height) -> block_return_type override;

        /// Calls getrawtransaction in verbose mode. Requires txindex on the
        /// node for confirmed transactions.
        auto get_transaction(const std::string& txid)
            -> transaction_return_type override;

      private:
        using call_return_type = std::variant<Json::Value, node_error>;

        auto call_sync(const std::string& method, Json::Value params)
            -> call_return_type;

        auto interpret(const std::string& method,
                       const std::optional<Json::Value>& res)
            -> call_return_type;
    };

    /// Returns a factory creating initialized \ref rpc_node_client
    /// instances. The factory returns nullptr if initialization fails.
    /// \param endpoint bitcoind RPC URL.
    /// \param timeout per-request timeout in milliseconds.
    /// \param log log instance shared by every client.
    auto make_rpc_node_client_factory(std::string endpoint,
                                      long timeout,
                                      std::shared_ptr<logging::log> log)
        -> node_client_factory;
}

#endif // STAKESCAN_SRC_BITCOIN_RPC_NODE_CLIENT_H_
