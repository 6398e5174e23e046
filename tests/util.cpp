// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include <gtest/gtest.h>

namespace stakescan::test {
    auto key(const std::string& hex) -> pubkey_t {
        auto k = pubkey_from_hex(hex);
        EXPECT_TRUE(k.has_value());
        return k.value_or(pubkey_t{});
    }

    auto make_staking_data(const pubkey_t& staker,
                           const pubkey_t& fp,
                           uint8_t version,
                           uint16_t staking_time) -> babylon::staking_data {
        auto data = babylon::staking_data();
        data.m_version = version;
        data.m_staker_key = staker;
        data.m_fp_key = fp;
        data.m_staking_time = staking_time;
        return data;
    }

    auto p2tr_script() -> buffer {
        auto ret = buffer();
        ret.push_back(0x51);
        ret.push_back(0x20);
        for(size_t i = 0; i < pubkey_len; i++) {
            ret.push_back(static_cast<unsigned char>(0xa0 + i));
        }
        return ret;
    }

    auto p2wpkh_script() -> buffer {
        static constexpr size_t key_hash_len = 20;
        auto ret = buffer();
        ret.push_back(0x00);
        ret.push_back(key_hash_len);
        for(size_t i = 0; i < key_hash_len; i++) {
            ret.push_back(static_cast<unsigned char>(i));
        }
        return ret;
    }

    auto op_return_script(const buffer& payload) -> buffer {
        static constexpr size_t max_direct_push = 0x4b;
        auto ret = buffer();
        ret.push_back(0x6a);
        if(payload.size() <= max_direct_push) {
            ret.push_back(static_cast<unsigned char>(payload.size()));
        } else {
            ret.push_back(0x4c);
            ret.push_back(static_cast<unsigned char>(payload.size()));
        }
        ret.append(payload.data(), payload.size());
        return ret;
    }

    auto plain_tx(const std::string& txid) -> bitcoin::transaction {
        auto tx = bitcoin::transaction();
        tx.m_txid = txid;
        tx.m_outputs.push_back({p2wpkh_script(), 100000});
        return tx;
    }

    auto op_return_tx(const std::string& txid,
                      const buffer& payload,
                      uint64_t amount) -> bitcoin::transaction {
        auto tx = bitcoin::transaction();
        tx.m_txid = txid;
        tx.m_outputs.push_back({p2tr_script(), amount});
        tx.m_outputs.push_back({op_return_script(payload), 0});
        tx.m_outputs.push_back({p2wpkh_script(), 12345});
        return tx;
    }

    auto stake_tx(const std::string& txid,
                  const babylon::staking_data& data,
                  uint64_t amount) -> bitcoin::transaction {
        return op_return_tx(txid, babylon::encode_payload(data), amount);
    }

    auto make_block(bitcoin::block_height_t height,
                    std::vector<bitcoin::transaction> txs) -> bitcoin::block {
        auto blk = bitcoin::block();
        blk.m_height = height;
        blk.m_hash = "hash" + std::to_string(height);
        blk.m_transactions = std::move(txs);
        return blk;
    }

    void fake_chain::add_block(bitcoin::block blk) {
        std::unique_lock l(m_mut);
        auto height = blk.m_height;
        m_blocks[height] = std::move(blk);
    }

    void fake_chain::add_transaction(bitcoin::transaction tx) {
        std::unique_lock l(m_mut);
        auto txid = tx.m_txid;
        m_transactions[txid] = std::move(tx);
    }

    void fake_chain::set_tip(bitcoin::block_height_t tip) {
        std::unique_lock l(m_mut);
        m_tip = tip;
    }

    void fake_chain::fail_tip() {
        std::unique_lock l(m_mut);
        m_tip_fails = true;
    }

    void fake_chain::fail_block(bitcoin::block_height_t height,
                                size_t times) {
        std::unique_lock l(m_mut);
        m_failures[height] = times;
    }

    void fake_chain::fail_block_always(bitcoin::block_height_t height) {
        std::unique_lock l(m_mut);
        m_always_fail.insert(height);
    }

    auto fake_chain::block_calls(bitcoin::block_height_t height) -> size_t {
        std::unique_lock l(m_mut);
        auto it = m_calls.find(height);
        return it == m_calls.end() ? 0 : it->second;
    }

    auto fake_chain::clients_created() -> size_t {
        std::unique_lock l(m_mut);
        return m_clients;
    }

    auto fake_chain::get_block_count()
        -> bitcoin::node_client::block_count_return_type {
        std::unique_lock l(m_mut);
        if(m_tip_fails) {
            return bitcoin::node_error::transient;
        }
        if(m_tip.has_value()) {
            return m_tip.value();
        }
        if(m_blocks.empty()) {
            return bitcoin::block_height_t{0};
        }
        return m_blocks.rbegin()->first;
    }

    auto fake_chain::get_block(bitcoin::block_height_t height)
        -> bitcoin::node_client::block_return_type {
        std::unique_lock l(m_mut);
        m_calls[height]++;
        if(m_always_fail.count(height) != 0) {
            return bitcoin::node_error::transient;
        }
        auto fail_it = m_failures.find(height);
        if(fail_it != m_failures.end() && fail_it->second > 0) {
            fail_it->second--;
            return bitcoin::node_error::transient;
        }
        auto it = m_blocks.find(height);
        if(it == m_blocks.end()) {
            return bitcoin::node_error::not_found;
        }
        return it->second;
    }

    auto fake_chain::get_transaction(const std::string& txid)
        -> bitcoin::node_client::transaction_return_type {
        std::unique_lock l(m_mut);
        auto it = m_transactions.find(txid);
        if(it == m_transactions.end()) {
            return bitcoin::node_error::not_found;
        }
        return it->second;
    }

    auto fake_chain::factory(const std::shared_ptr<fake_chain>& chain)
        -> bitcoin::node_client_factory {
        return [chain]() -> std::unique_ptr<bitcoin::node_client> {
            {
                std::unique_lock l(chain->m_mut);
                chain->m_clients++;
            }
            return std::make_unique<fake_node_client>(chain);
        };
    }

    fake_node_client::fake_node_client(std::shared_ptr<fake_chain> chain)
        : m_chain(std::move(chain)) {}

    auto fake_node_client::get_block_count() -> block_count_return_type {
        return m_chain->get_block_count();
    }

    auto fake_node_client::get_block(bitcoin::block_height_t height)
        -> block_return_type {
        return m_chain->get_block(height);
    }

    auto fake_node_client::get_transaction(const std::string& txid)
        -> transaction_return_type {
        return m_chain->get_transaction(txid);
    }
}
