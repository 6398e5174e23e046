// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_BITCOIN_TRANSACTION_H_
#define STAKESCAN_SRC_BITCOIN_TRANSACTION_H_

#include "util/common/buffer.hpp"

#include <cstdint>
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

/// Bitcoin chain data as returned by a node, reduced to the fields the
/// scanner reads.
namespace stakescan::bitcoin {
    /// Height of a block in the chain. The genesis block is height 0.
    using block_height_t = uint64_t;

    /// Satoshis per bitcoin.
    static constexpr uint64_t coin = 100000000;

    /// A transaction output.
    struct output {
        auto operator==(const output& rhs) const -> bool;

        /// Locking script (scriptPubKey) bytes.
        buffer m_script;
        /// Output value in satoshis.
        uint64_t m_value{};
    };

    /// A transaction with its outputs. Inputs are not needed to classify
    /// staking transactions and are not retained.
    struct transaction {
        auto operator==(const transaction& rhs) const -> bool;

        /// Transaction ID as the big-endian hex string bitcoind reports.
        std::string m_txid;
        /// Ordered list of outputs.
        std::vector<output> m_outputs;
    };

    /// A block and its transactions, in block order.
    struct block {
        /// Block height.
        block_height_t m_height{};
        /// Block hash, hex.
        std::string m_hash;
        /// Block header timestamp, seconds since the epoch.
        int64_t m_time{};
        /// Transactions in the order they appear in the block.
        std::vector<transaction> m_transactions;
    };

    /// Converts a decimal BTC amount as reported by bitcoind into satoshis,
    /// rounding to the nearest satoshi.
    /// \param btc amount in BTC.
    /// \return amount in satoshis, or std::nullopt if negative or not finite.
    auto btc_to_satoshi(double btc) -> std::optional<uint64_t>;

    /// Reads a verbose transaction object (getrawtransaction verbose, or an
    /// element of getblock verbosity 2 "tx") into a transaction.
    /// \param json transaction object.
    /// \return the transaction, or std::nullopt if a required field is
    ///         missing or malformed.
    auto transaction_from_json(const Json::Value& json)
        -> std::optional<transaction>;

    /// Reads a getblock verbosity 2 result into a block.
    /// \param json block object.
    /// \return the block, or std::nullopt if a required field is missing or
    ///         malformed.
    auto block_from_json(const Json::Value& json) -> std::optional<block>;
}

#endif // STAKESCAN_SRC_BITCOIN_TRANSACTION_H_
