// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "staking_payload.hpp"

#include <cstring>
#include <tuple>

namespace stakescan::babylon {
    namespace {
        auto read_key(const buffer& payload, size_t offset) -> pubkey_t {
            auto key = pubkey_t();
            std::memcpy(key.data(), payload.data_at(offset), key.size());
            return key;
        }

        auto check_key(const pubkey_t& key) -> bool {
            return !is_zero(key) && is_valid_xonly(key);
        }
    }

    auto staking_data::operator==(const staking_data& rhs) const -> bool {
        return std::tie(m_tag,
                        m_version,
                        m_staker_key,
                        m_fp_key,
                        m_staking_time)
            == std::tie(rhs.m_tag,
                        rhs.m_version,
                        rhs.m_staker_key,
                        rhs.m_fp_key,
                        rhs.m_staking_time);
    }

    auto stake_record::operator==(const stake_record& rhs) const -> bool {
        return std::tie(m_data, m_amount, m_txid, m_height, m_time)
            == std::tie(rhs.m_data,
                        rhs.m_amount,
                        rhs.m_txid,
                        rhs.m_height,
                        rhs.m_time);
    }

    auto to_string(rejection_reason reason) -> std::string {
        switch(reason) {
            case rejection_reason::too_short:
                return "too_short";
            case rejection_reason::bad_magic:
                return "bad_magic";
            case rejection_reason::unsupported_version:
                return "unsupported_version";
            case rejection_reason::wrong_length:
                return "wrong_length";
            case rejection_reason::malformed_key:
                return "malformed_key";
            case rejection_reason::missing_staking_output:
                return "missing_staking_output";
            case rejection_reason::outside_params:
                return "outside_params";
        }
        return "unknown";
    }

    auto has_magic_tag(const buffer& payload) -> bool {
        return payload.size() >= tag_len
            && std::memcmp(payload.data(), magic_tag.data(), tag_len) == 0;
    }

    auto decode_payload(const buffer& payload) -> decode_result {
        if(payload.size() < payload_len) {
            return rejection_reason::too_short;
        }
        if(!has_magic_tag(payload)) {
            return rejection_reason::bad_magic;
        }

        auto data = staking_data();
        data.m_version = payload.byte_at(version_offset);
        if(data.m_version > max_version) {
            return rejection_reason::unsupported_version;
        }
        if(payload.size() > payload_len) {
            return rejection_reason::wrong_length;
        }

        data.m_staker_key = read_key(payload, staker_key_offset);
        data.m_fp_key = read_key(payload, fp_key_offset);
        data.m_staking_time = static_cast<uint16_t>(
            (payload.byte_at(staking_time_offset) << 8U)
            | payload.byte_at(staking_time_offset + 1));

        if(!check_key(data.m_staker_key) || !check_key(data.m_fp_key)) {
            return rejection_reason::malformed_key;
        }

        return data;
    }

    auto encode_payload(const staking_data& data) -> buffer {
        auto ret = buffer();
        ret.append(data.m_tag.data(), data.m_tag.size());
        ret.push_back(data.m_version);
        ret.append(data.m_staker_key.data(), data.m_staker_key.size());
        ret.append(data.m_fp_key.data(), data.m_fp_key.size());
        ret.push_back(static_cast<unsigned char>(data.m_staking_time >> 8U));
        ret.push_back(static_cast<unsigned char>(data.m_staking_time & 0xffU));
        return ret;
    }

    auto decode_stake(const bitcoin::transaction& tx,
                      bitcoin::block_height_t height,
                      const bitcoin::op_return_payload& payload,
                      const global_params* params) -> stake_result {
        auto decoded = decode_payload(payload.m_data);
        if(auto* reason = std::get_if<rejection_reason>(&decoded)) {
            return *reason;
        }

        if(tx.m_outputs.size() <= staking_output_index
           || !bitcoin::is_p2tr(tx.m_outputs[staking_output_index].m_script)) {
            return rejection_reason::missing_staking_output;
        }

        auto rec = stake_record();
        rec.m_data = std::get<staking_data>(decoded);
        rec.m_amount = tx.m_outputs[staking_output_index].m_value;
        rec.m_txid = tx.m_txid;
        rec.m_height = height;

        if(params != nullptr) {
            const auto vp = params->params_for(height, rec.m_data.m_version);
            if(!vp.has_value() || vp->m_version != rec.m_data.m_version) {
                return rejection_reason::outside_params;
            }
            if(rec.m_amount < vp->m_min_staking_amount
               || rec.m_amount > vp->m_max_staking_amount) {
                return rejection_reason::outside_params;
            }
            if(rec.m_data.m_staking_time < vp->m_min_staking_time
               || rec.m_data.m_staking_time > vp->m_max_staking_time) {
                return rejection_reason::outside_params;
            }
        }

        return rec;
    }
}
