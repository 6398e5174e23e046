// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "scanner/aggregator.hpp"
#include "util.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <stdexcept>

using stakescan::babylon::rejection_reason;

class aggregator_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_staker_a = stakescan::test::key(stakescan::test::key_g_hex);
        m_staker_b = stakescan::test::key(stakescan::test::key_2g_hex);
        m_fp1 = stakescan::test::key(stakescan::test::key_3g_hex);
        m_fp2 = stakescan::test::key(stakescan::test::key_4g_hex);
    }

    static auto stake(const stakescan::pubkey_t& staker,
                      const stakescan::pubkey_t& fp,
                      uint64_t amount,
                      uint64_t height,
                      const std::string& txid,
                      uint8_t version = 0) -> stakescan::babylon::stake_record {
        auto rec = stakescan::babylon::stake_record();
        rec.m_data = stakescan::test::make_staking_data(staker, fp, version);
        rec.m_amount = amount;
        rec.m_height = height;
        rec.m_time = block_time(height);
        rec.m_txid = txid;
        return rec;
    }

    static auto block_time(uint64_t height) -> int64_t {
        return 1713500000 + static_cast<int64_t>(height) * 600;
    }

    stakescan::scanner::scan_window m_window{100, 104};
    stakescan::pubkey_t m_staker_a{};
    stakescan::pubkey_t m_staker_b{};
    stakescan::pubkey_t m_fp1{};
    stakescan::pubkey_t m_fp2{};
};

TEST_F(aggregator_test, empty_snapshot) {
    auto agg = stakescan::scanner::aggregator(m_window);
    auto report = agg.snapshot();
    ASSERT_EQ(report.m_window, m_window);
    ASSERT_EQ(report.m_total_transactions, 0);
    ASSERT_EQ(report.m_total_stakes, 0);
    ASSERT_EQ(report.m_total_rejected, 0);
    ASSERT_TRUE(report.m_finality_providers.empty());
    ASSERT_TRUE(report.m_skipped_heights.empty());
}

TEST_F(aggregator_test, ingest_builds_provider_stats) {
    auto agg = stakescan::scanner::aggregator(m_window);
    agg.ingest(stake(m_staker_a, m_fp1, 500000, 101, "01"));
    agg.ingest(stake(m_staker_b, m_fp1, 700000, 103, "02", 1));
    agg.ingest(stake(m_staker_a, m_fp1, 100000, 102, "03"));
    agg.ingest(stake(m_staker_b, m_fp2, 900000, 104, "04", 2));
    auto report = agg.snapshot();

    ASSERT_EQ(report.m_total_stakes, 4);
    ASSERT_EQ(report.m_total_amount, 2200000);
    ASSERT_EQ(report.m_stakers.size(), 2);
    ASSERT_EQ(report.m_finality_providers.size(), 2);

    const auto& fp1 = report.m_finality_providers.at(m_fp1);
    ASSERT_EQ(fp1.m_stake_count, 3);
    ASSERT_EQ(fp1.m_total_amount, 1300000);
    ASSERT_EQ(fp1.m_stakers.size(), 2);
    ASSERT_EQ(fp1.m_versions, (std::set<uint8_t>{0, 1}));
    ASSERT_EQ(fp1.m_first_height, 101);
    ASSERT_EQ(fp1.m_last_height, 103);

    const auto& fp2 = report.m_finality_providers.at(m_fp2);
    ASSERT_EQ(fp2.m_stake_count, 1);
    ASSERT_EQ(fp2.m_stakers.size(), 1);

    ASSERT_EQ(report.m_versions.size(), 3);
    ASSERT_EQ(report.m_versions.at(0).m_stake_count, 2);
    ASSERT_EQ(report.m_versions.at(0).m_total_amount, 600000);
    ASSERT_EQ(report.m_versions.at(0).m_stakers.size(), 1);
    ASSERT_EQ(report.m_versions.at(2).m_finality_providers.size(), 1);

    ASSERT_EQ(report.m_stakes.size(), 4);
    ASSERT_EQ(report.m_stakes[0].m_txid, "01");
    ASSERT_EQ(report.m_stakes[1].m_txid, "03");
    ASSERT_EQ(report.m_stakes[2].m_txid, "02");
    ASSERT_EQ(report.m_stakes[3].m_txid, "04");
}

TEST_F(aggregator_test, spans_track_blocks_and_times) {
    auto agg = stakescan::scanner::aggregator(m_window);
    agg.ingest(stake(m_staker_a, m_fp1, 500000, 103, "01"));
    agg.ingest(stake(m_staker_b, m_fp1, 700000, 101, "02", 1));
    agg.ingest(stake(m_staker_a, m_fp1, 100000, 103, "03"));
    agg.ingest(stake(m_staker_b, m_fp2, 900000, 104, "04", 1));
    auto report = agg.snapshot();

    ASSERT_EQ(report.m_span.m_blocks,
              (std::set<stakescan::bitcoin::block_height_t>{101, 103, 104}));
    ASSERT_EQ(report.m_span.m_first_time, block_time(101));
    ASSERT_EQ(report.m_span.m_last_time, block_time(104));
    ASSERT_EQ(report.m_span.duration(), 1800);

    const auto& fp1 = report.m_finality_providers.at(m_fp1).m_span;
    ASSERT_EQ(fp1.m_blocks.size(), 2);
    ASSERT_EQ(fp1.duration(), 1200);

    const auto& fp2 = report.m_finality_providers.at(m_fp2).m_span;
    ASSERT_EQ(fp2.m_blocks.size(), 1);
    ASSERT_EQ(fp2.duration(), 0);

    const auto& v1 = report.m_versions.at(1).m_span;
    ASSERT_EQ(v1.m_blocks,
              (std::set<stakescan::bitcoin::block_height_t>{101, 104}));
    ASSERT_EQ(v1.m_first_time, block_time(101));
    ASSERT_EQ(v1.m_last_time, block_time(104));
}

TEST_F(aggregator_test, same_staker_counted_once) {
    auto agg = stakescan::scanner::aggregator(m_window);
    agg.ingest(stake(m_staker_a, m_fp1, 1, 100, "01"));
    agg.ingest(stake(m_staker_a, m_fp1, 2, 101, "02"));
    auto report = agg.snapshot();
    const auto& fp1 = report.m_finality_providers.at(m_fp1);
    ASSERT_EQ(fp1.m_stake_count, 2);
    ASSERT_EQ(fp1.m_total_amount, 3);
    ASSERT_EQ(fp1.m_stakers.size(), 1);
}

TEST_F(aggregator_test, block_results_and_skips) {
    auto agg = stakescan::scanner::aggregator(m_window);
    auto res = stakescan::scanner::block_result();
    res.m_height = 100;
    res.m_transactions = 12;
    res.m_babylon_tagged = 3;
    res.m_stakes.push_back(stake(m_staker_a, m_fp1, 500000, 100, "01"));
    res.m_rejections[rejection_reason::bad_magic] = 4;
    res.m_rejections[rejection_reason::malformed_key] = 1;
    agg.submit(res);

    res = stakescan::scanner::block_result();
    res.m_height = 101;
    res.m_transactions = 3;
    res.m_rejections[rejection_reason::bad_magic] = 1;
    agg.submit(res);

    agg.record_skipped(102);
    agg.record_skipped(102);

    auto report = agg.snapshot();
    ASSERT_EQ(report.m_total_transactions, 15);
    ASSERT_EQ(report.m_babylon_tagged, 3);
    ASSERT_EQ(report.m_total_stakes, 1);
    ASSERT_EQ(report.m_total_rejected, 6);
    ASSERT_EQ(report.m_rejections.at(rejection_reason::bad_magic), 5);
    ASSERT_EQ(report.m_rejections.at(rejection_reason::malformed_key), 1);
    ASSERT_EQ(report.m_skipped_heights,
              (std::set<stakescan::bitcoin::block_height_t>{102}));
}

TEST_F(aggregator_test, order_independent) {
    auto results = std::vector<stakescan::scanner::block_result>(4);
    for(size_t i = 0; i < results.size(); i++) {
        results[i].m_height = 100 + i;
        results[i].m_transactions = 10 + i;
        results[i].m_babylon_tagged = i;
    }
    results[0].m_stakes.push_back(stake(m_staker_a, m_fp1, 5, 100, "a0"));
    results[1].m_stakes.push_back(stake(m_staker_b, m_fp1, 7, 101, "a1", 1));
    results[1].m_stakes.push_back(stake(m_staker_a, m_fp2, 9, 101, "a2"));
    results[2].m_rejections[rejection_reason::too_short] = 2;
    results[3].m_stakes.push_back(stake(m_staker_b, m_fp2, 11, 103, "a3", 2));
    results[3].m_rejections[rejection_reason::bad_magic] = 1;

    auto order = std::vector<size_t>{0, 1, 2, 3};
    std::optional<stakescan::scanner::scan_report> expected;
    do {
        auto agg = stakescan::scanner::aggregator(m_window);
        for(auto i : order) {
            agg.submit(results[i]);
        }
        agg.record_skipped(104);
        auto report = agg.snapshot();
        if(!expected.has_value()) {
            expected = report;
        } else {
            ASSERT_EQ(report, expected.value());
        }
    } while(std::next_permutation(order.begin(), order.end()));

    ASSERT_EQ(expected->m_total_stakes, 4);
    ASSERT_EQ(expected->m_finality_providers.at(m_fp1).m_first_height, 100);
    ASSERT_EQ(expected->m_finality_providers.at(m_fp2).m_last_height, 103);
}

TEST_F(aggregator_test, snapshot_is_terminal) {
    auto agg = stakescan::scanner::aggregator(m_window);
    agg.ingest(stake(m_staker_a, m_fp1, 1, 100, "01"));
    auto report = agg.snapshot();
    ASSERT_EQ(report.m_total_stakes, 1);

    ASSERT_THROW(agg.ingest(stake(m_staker_a, m_fp1, 1, 100, "02")),
                 std::logic_error);
    ASSERT_THROW(agg.submit(stakescan::scanner::block_result()),
                 std::logic_error);
    ASSERT_THROW(agg.record_skipped(100), std::logic_error);
    ASSERT_THROW(agg.snapshot(), std::logic_error);
}
