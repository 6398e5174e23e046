// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_TESTS_UTIL_H_
#define STAKESCAN_TESTS_UTIL_H_

#include "babylon/staking_payload.hpp"
#include "bitcoin/node_client.hpp"

#include <map>
#include <mutex>
#include <set>

namespace stakescan::test {
    /// x coordinates of G, 2G, 3G and 4G: valid x-only keys.
    static constexpr auto key_g_hex
        = "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
    static constexpr auto key_2g_hex
        = "c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
    static constexpr auto key_3g_hex
        = "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9";
    static constexpr auto key_4g_hex
        = "e493dbf1c10d80f3581e4904930b1404cc6c13900ee0758474fa94abe8c4cd13";
    /// 32 bytes that are not the x coordinate of any curve point.
    static constexpr auto off_curve_key_hex
        = "eefdea4cdb677750a420fee807eacf21eb9898ae79b9768766e4faa04a2d4a34";

    /// Parses a hex key, failing the current test if it is malformed.
    auto key(const std::string& hex) -> pubkey_t;

    /// Returns staking payload fields with the given keys.
    auto make_staking_data(const pubkey_t& staker,
                           const pubkey_t& fp,
                           uint8_t version = 0,
                           uint16_t staking_time = 64000)
        -> babylon::staking_data;

    /// Returns a taproot output script with a fixed key.
    auto p2tr_script() -> buffer;

    /// Returns a P2WPKH output script with a fixed key hash.
    auto p2wpkh_script() -> buffer;

    /// Returns OP_RETURN followed by the minimal push of payload.
    auto op_return_script(const buffer& payload) -> buffer;

    /// Returns a transaction with a single P2WPKH output.
    auto plain_tx(const std::string& txid) -> bitcoin::transaction;

    /// Returns a transaction shaped like a Babylon staking transaction: a
    /// taproot staking output, an OP_RETURN output carrying payload and a
    /// change output.
    auto op_return_tx(const std::string& txid,
                      const buffer& payload,
                      uint64_t amount = 500000) -> bitcoin::transaction;

    /// Returns a valid staking transaction.
    auto stake_tx(const std::string& txid,
                  const babylon::staking_data& data,
                  uint64_t amount) -> bitcoin::transaction;

    /// Returns a block holding the given transactions.
    auto make_block(bitcoin::block_height_t height,
                    std::vector<bitcoin::transaction> txs) -> bitcoin::block;

    /// In-memory chain shared by every \ref fake_node_client created from
    /// the same instance. Thread-safe.
    class fake_chain {
      public:
        /// Adds or replaces a block. The tip follows the highest block
        /// unless set explicitly.
        void add_block(bitcoin::block blk);

        /// Adds a transaction returned by get_transaction.
        void add_transaction(bitcoin::transaction tx);

        /// Overrides the tip height.
        void set_tip(bitcoin::block_height_t tip);

        /// Makes get_block_count fail with a transient error.
        void fail_tip();

        /// Makes the next \p times fetches of a height fail transiently.
        void fail_block(bitcoin::block_height_t height, size_t times);

        /// Makes every fetch of a height fail transiently.
        void fail_block_always(bitcoin::block_height_t height);

        /// Returns the number of fetches of a height so far.
        auto block_calls(bitcoin::block_height_t height) -> size_t;

        /// Returns the number of clients created by \ref factory.
        auto clients_created() -> size_t;

        auto get_block_count() -> bitcoin::node_client::block_count_return_type;
        auto get_block(bitcoin::block_height_t height)
            -> bitcoin::node_client::block_return_type;
        auto get_transaction(const std::string& txid)
            -> bitcoin::node_client::transaction_return_type;

        /// Returns a factory creating clients backed by chain.
        static auto factory(const std::shared_ptr<fake_chain>& chain)
            -> bitcoin::node_client_factory;

      private:
        std::mutex m_mut;
        std::map<bitcoin::block_height_t, bitcoin::block> m_blocks;
        std::map<std::string, bitcoin::transaction> m_transactions;
        std::optional<bitcoin::block_height_t> m_tip;
        bool m_tip_fails{false};
        std::map<bitcoin::block_height_t, size_t> m_failures;
        std::set<bitcoin::block_height_t> m_always_fail;
        std::map<bitcoin::block_height_t, size_t> m_calls;
        size_t m_clients{};
    };

    /// Node client backed by a \ref fake_chain.
    class fake_node_client : public bitcoin::node_client {
      public:
        explicit fake_node_client(std::shared_ptr<fake_chain> chain);

        auto get_block_count() -> block_count_return_type override;
        auto get_block(bitcoin::block_height_t height)
            -> block_return_type override;
        auto get_transaction(const std::string& txid)
            -> transaction_return_type override;

      private:
        std::shared_ptr<fake_chain> m_chain;
    };
}

#endif // STAKESCAN_TESTS_UTIL_H_
