// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "transaction.hpp"

#include <cmath>
#include <tuple>

namespace stakescan::bitcoin {
    auto output::operator==(const output& rhs) const -> bool {
        return std::tie(m_script, m_value)
            == std::tie(rhs.m_script, rhs.m_value);
    }

    auto transaction::operator==(const transaction& rhs) const -> bool {
        return std::tie(m_txid, m_outputs)
            == std::tie(rhs.m_txid, rhs.m_outputs);
    }

    auto btc_to_satoshi(double btc) -> std::optional<uint64_t> {
        if(!std::isfinite(btc) || btc < 0.0) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(
            std::llround(btc * static_cast<double>(coin)));
    }

    auto transaction_from_json(const Json::Value& json)
        -> std::optional<transaction> {
        if(!json.isObject() || !json["txid"].isString()
           || !json["vout"].isArray()) {
            return std::nullopt;
        }

        auto tx = transaction();
        tx.m_txid = json["txid"].asString();
        tx.m_outputs.reserve(json["vout"].size());
        for(const auto& vout : json["vout"]) {
            if(!vout.isObject()) {
                return std::nullopt;
            }
            const auto& spk = vout["scriptPubKey"];
            if(!vout["value"].isNumeric() || !spk.isObject()
               || !spk["hex"].isString()) {
                return std::nullopt;
            }

            auto out = output();
            auto value = btc_to_satoshi(vout["value"].asDouble());
            if(!value.has_value()) {
                return std::nullopt;
            }
            out.m_value = value.value();

            const auto script_hex = spk["hex"].asString();
            if(!script_hex.empty()) {
                auto script = buffer::from_hex(script_hex);
                if(!script.has_value()) {
                    return std::nullopt;
                }
                out.m_script = std::move(script.value());
            }

            tx.m_outputs.emplace_back(std::move(out));
        }

        return tx;
    }

    auto block_from_json(const Json::Value& json) -> std::optional<block> {
        if(!json.isObject() || !json["height"].isUInt64()
           || !json["hash"].isString() || !json["tx"].isArray()) {
            return std::nullopt;
        }

        auto blk = block();
        blk.m_height = json["height"].asUInt64();
        blk.m_hash = json["hash"].asString();
        blk.m_time = json["time"].isInt64() ? json["time"].asInt64() : 0;
        blk.m_transactions.reserve(json["tx"].size());
        for(const auto& tx_json : json["tx"]) {
            auto tx = transaction_from_json(tx_json);
            if(!tx.has_value()) {
                return std::nullopt;
            }
            blk.m_transactions.emplace_back(std::move(tx.value()));
        }

        return blk;
    }
}
