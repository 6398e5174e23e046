// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "report/report_writer.hpp"
#include "util.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using stakescan::babylon::rejection_reason;

class report_writer_test : public ::testing::Test {
  protected:
    void SetUp() override {
        auto staker_a = stakescan::test::key(stakescan::test::key_g_hex);
        auto staker_b = stakescan::test::key(stakescan::test::key_2g_hex);
        auto fp = stakescan::test::key(stakescan::test::key_3g_hex);

        auto agg = stakescan::scanner::aggregator({849951, 850000});
        auto res = stakescan::scanner::block_result();
        res.m_height = 849960;
        res.m_transactions = 2500;
        res.m_babylon_tagged = 3;
        auto rec = stakescan::babylon::stake_record();
        rec.m_data = stakescan::test::make_staking_data(staker_a, fp, 0);
        rec.m_amount = 500000;
        rec.m_height = 849960;
        rec.m_txid = "aa";
        res.m_stakes.push_back(rec);
        rec.m_data = stakescan::test::make_staking_data(staker_b, fp, 1);
        rec.m_amount = 1500000;
        rec.m_txid = "bb";
        res.m_stakes.push_back(rec);
        res.m_rejections[rejection_reason::malformed_key] = 1;
        res.m_rejections[rejection_reason::bad_magic] = 40;
        agg.submit(res);
        agg.record_skipped(849999);
        m_report = agg.snapshot();
    }

    static auto parse(const std::string& text) -> Json::Value {
        auto builder = Json::CharReaderBuilder();
        auto root = Json::Value();
        auto in = std::istringstream(text);
        EXPECT_TRUE(Json::parseFromStream(builder, in, &root, nullptr));
        return root;
    }

    stakescan::scanner::scan_report m_report;
};

TEST_F(report_writer_test, to_json_fields) {
    auto doc = stakescan::report::to_json(m_report);

    ASSERT_EQ(doc["scan_window"]["start_height"].asUInt64(), 849951);
    ASSERT_EQ(doc["scan_window"]["end_height"].asUInt64(), 850000);
    ASSERT_EQ(doc["total_transactions"].asUInt64(), 2500);
    ASSERT_EQ(doc["babylon_tagged"].asUInt64(), 3);
    ASSERT_EQ(doc["total_stakes"].asUInt64(), 2);
    ASSERT_EQ(doc["total_rejected"].asUInt64(), 41);
    ASSERT_EQ(doc["total_staked_amount"].asUInt64(), 2000000);
    ASSERT_EQ(doc["distinct_stakers"].asUInt64(), 2);
    ASSERT_EQ(doc["blocks_skipped"].asUInt64(), 1);
    ASSERT_EQ(doc["skipped_heights"].size(), 1);
    ASSERT_EQ(doc["skipped_heights"][0].asUInt64(), 849999);

    const auto& rej = doc["rejections"];
    ASSERT_EQ(rej.size(), stakescan::babylon::all_rejection_reasons.size());
    ASSERT_EQ(rej["bad_magic"].asUInt64(), 40);
    ASSERT_EQ(rej["malformed_key"].asUInt64(), 1);
    ASSERT_EQ(rej["too_short"].asUInt64(), 0);

    const auto& fp = doc["finality_providers"][stakescan::test::key_3g_hex];
    ASSERT_TRUE(fp.isObject());
    ASSERT_EQ(fp["stake_count"].asUInt64(), 2);
    ASSERT_EQ(fp["total_staked_amount"].asUInt64(), 2000000);
    ASSERT_EQ(fp["distinct_staker_count"].asUInt64(), 2);
    ASSERT_EQ(fp["first_height"].asUInt64(), 849960);
    ASSERT_EQ(fp["last_height"].asUInt64(), 849960);
    ASSERT_EQ(fp["versions"].size(), 2);

    ASSERT_EQ(doc["versions"]["0"]["stake_count"].asUInt64(), 1);
    ASSERT_EQ(doc["versions"]["1"]["total_staked_amount"].asUInt64(),
              1500000);

    const auto& stakes = doc["stakes"];
    ASSERT_EQ(stakes.size(), 2);
    ASSERT_EQ(stakes[0]["txid"].asString(), "aa");
    ASSERT_EQ(stakes[0]["staker_public_key"].asString(),
              stakescan::test::key_g_hex);
    ASSERT_EQ(stakes[0]["finality_provider"].asString(),
              stakescan::test::key_3g_hex);
    ASSERT_EQ(stakes[0]["staking_time"].asUInt(), 64000);
    ASSERT_EQ(stakes[1]["amount"].asUInt64(), 1500000);
}

TEST_F(report_writer_test, time_range_and_average) {
    auto staker = stakescan::test::key(stakescan::test::key_g_hex);
    auto fp = stakescan::test::key(stakescan::test::key_3g_hex);
    auto agg = stakescan::scanner::aggregator({100, 110});
    auto add_block = [&](stakescan::bitcoin::block_height_t height,
                         int64_t time,
                         std::vector<uint64_t> amounts) {
        auto res = stakescan::scanner::block_result();
        res.m_height = height;
        res.m_transactions = amounts.size();
        for(auto amount : amounts) {
            auto rec = stakescan::babylon::stake_record();
            rec.m_data = stakescan::test::make_staking_data(staker, fp);
            rec.m_amount = amount;
            rec.m_height = height;
            rec.m_time = time;
            rec.m_txid = std::to_string(height) + "-" + std::to_string(amount);
            res.m_stakes.push_back(rec);
        }
        agg.submit(res);
    };
    add_block(104, 1713504000, {500000, 700000});
    add_block(101, 1713501000, {600000});
    auto doc = stakescan::report::to_json(agg.snapshot());

    ASSERT_EQ(doc["unique_blocks"].asUInt64(), 2);
    ASSERT_EQ(doc["time_range"]["first_timestamp"].asInt64(), 1713501000);
    ASSERT_EQ(doc["time_range"]["last_timestamp"].asInt64(), 1713504000);
    ASSERT_EQ(doc["time_range"]["duration_seconds"].asInt64(), 3000);

    const auto& fp_doc = doc["finality_providers"][stakescan::test::key_3g_hex];
    ASSERT_EQ(fp_doc["average_stake"].asUInt64(), 600000);
    ASSERT_EQ(fp_doc["unique_blocks"].asUInt64(), 2);
    ASSERT_EQ(fp_doc["time_range"]["duration_seconds"].asInt64(), 3000);

    const auto& ver = doc["versions"]["0"];
    ASSERT_EQ(ver["unique_blocks"].asUInt64(), 2);
    ASSERT_EQ(ver["time_range"]["first_timestamp"].asInt64(), 1713501000);
}

TEST_F(report_writer_test, empty_time_range) {
    auto agg = stakescan::scanner::aggregator({1, 5});
    auto doc = stakescan::report::to_json(agg.snapshot());
    ASSERT_EQ(doc["unique_blocks"].asUInt64(), 0);
    ASSERT_TRUE(doc["time_range"]["first_timestamp"].isNull());
    ASSERT_TRUE(doc["time_range"]["last_timestamp"].isNull());
    ASSERT_EQ(doc["time_range"]["duration_seconds"].asInt64(), 0);
    ASSERT_TRUE(doc["finality_providers"].empty());
}

TEST_F(report_writer_test, serialize_is_parseable_and_stable) {
    auto text = stakescan::report::serialize(m_report);
    ASSERT_EQ(text, stakescan::report::serialize(m_report));
    ASSERT_EQ(text.back(), '\n');
    auto doc = parse(text);
    ASSERT_TRUE(doc.isObject());
    ASSERT_EQ(doc["total_stakes"].asUInt64(), 2);
    ASSERT_EQ(doc.getMemberNames(),
              stakescan::report::to_json(m_report).getMemberNames());
    // Keys are emitted in name order.
    ASSERT_LT(text.find("\"babylon_tagged\""),
              text.find("\"blocks_skipped\""));
    ASSERT_LT(text.find("\"stakes\""), text.find("\"total_rejected\""));
}

TEST_F(report_writer_test, write_file) {
    const auto path = std::filesystem::temp_directory_path()
                    / "stakescan_report_test.json";
    auto err = stakescan::report::write_report(m_report, path.string());
    ASSERT_FALSE(err.has_value());

    auto in = std::ifstream(path);
    auto contents = std::stringstream();
    contents << in.rdbuf();
    std::filesystem::remove(path);
    ASSERT_EQ(contents.str(), stakescan::report::serialize(m_report));
}

TEST_F(report_writer_test, write_unwritable_path) {
    auto err = stakescan::report::write_report(
        m_report,
        "/nonexistent/dir/report.json");
    ASSERT_TRUE(err.has_value());
}

TEST_F(report_writer_test, log_summary) {
    auto log = stakescan::logging::log(stakescan::logging::log_level::info,
                                       false,
                                       std::make_unique<std::stringstream>());
    auto out = std::make_unique<std::stringstream>();
    auto* out_ptr = out.get();
    log.set_logfile(std::move(out));
    stakescan::report::log_summary(m_report, log);
    log.flush();

    const auto text = out_ptr->str();
    ASSERT_NE(text.find("Valid stakes: 2 rejected: 41"), std::string::npos);
    ASSERT_NE(text.find(stakescan::test::key_3g_hex), std::string::npos);
    ASSERT_NE(text.find("Blocks skipped: 1"), std::string::npos);
}
