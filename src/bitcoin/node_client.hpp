// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_BITCOIN_NODE_CLIENT_H_
#define STAKESCAN_SRC_BITCOIN_NODE_CLIENT_H_

#include "transaction.hpp"

#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace stakescan::bitcoin {
    /// Failure categories reported by a node client. Transport-specific
    /// detail is logged by the implementation and never crosses this
    /// boundary.
    enum class node_error : uint8_t {
        not_found, ///< The node does not have the requested block or tx
        transient  ///< Transport failure, timeout or unexpected response
    };

    /// Returns a human-readable name for a node error.
    /// \param err error to describe.
    /// \return error name.
    auto to_string(node_error err) -> std::string;

    /// \brief Read-only access to a Bitcoin node.
    ///
    /// Calls block until the node responds or the request fails.
    /// Implementations are not required to be thread-safe; concurrent
    /// scanners use one instance per thread.
    class node_client {
      public:
        virtual ~node_client() = default;

        node_client() = default;
        node_client(const node_client&) = delete;
        auto operator=(const node_client&) -> node_client& = delete;
        node_client(node_client&&) = delete;
        auto operator=(node_client&&) -> node_client& = delete;

        /// Return type of \ref get_block_count.
        using block_count_return_type
            = std::variant<block_height_t, node_error>;
        /// Return type of \ref get_block.
        using block_return_type = std::variant<block, node_error>;
        /// Return type of \ref get_transaction.
        using transaction_return_type = std::variant<transaction, node_error>;

        /// Returns the height of the node's current chain tip.
        virtual auto get_block_count() -> block_count_return_type = 0;

        /// Returns the block at the given height of the active chain with
        /// all of its transactions.
        /// \param height height of the block to fetch.
        virtual auto get_block(block_height_t height) -> block_return_type
            = 0;

        /// Returns a transaction by ID.
        /// \param txid transaction ID, hex.
        virtual auto get_transaction(const std::string& txid)
            -> transaction_return_type
            = 0;
    };

    /// Creates a node client. Invoked once per scanner thread.
    using node_client_factory
        = std::function<std::unique_ptr<node_client>()>;
}

#endif // STAKESCAN_SRC_BITCOIN_NODE_CLIENT_H_
