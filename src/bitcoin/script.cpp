// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script.hpp"

#include <tuple>

namespace stakescan::bitcoin {
    namespace {
        constexpr auto to_byte(opcode op) -> unsigned char {
            return static_cast<unsigned char>(op);
        }

        /// Reads the push prefix starting at offset. Returns the offset of
        /// the pushed data and its declared length, or std::nullopt if the
        /// byte at offset is not a push opcode or its length field is
        /// truncated.
        auto read_push(const buffer& script, size_t offset)
            -> std::optional<std::pair<size_t, uint64_t>> {
            const auto op = script.byte_at(offset);
            if(op <= to_byte(opcode::max_direct_push)) {
                return std::make_pair(offset + 1, uint64_t{op});
            }

            size_t width{};
            switch(op) {
                case to_byte(opcode::op_pushdata1):
                    width = 1;
                    break;
                case to_byte(opcode::op_pushdata2):
                    width = 2;
                    break;
                case to_byte(opcode::op_pushdata4):
                    width = 4;
                    break;
                default:
                    return std::nullopt;
            }

            if(script.size() - offset - 1 < width) {
                return std::nullopt;
            }

            // Push lengths are little-endian.
            uint64_t len{};
            for(size_t i = 0; i < width; i++) {
                len |= uint64_t{script.byte_at(offset + 1 + i)} << (8 * i);
            }
            return std::make_pair(offset + 1 + width, len);
        }
    }

    auto op_return_payload::operator==(const op_return_payload& rhs) const
        -> bool {
        return std::tie(m_output_index, m_data)
            == std::tie(rhs.m_output_index, rhs.m_data);
    }

    auto classify_output(const output& out, size_t index) -> output_class {
        const auto& script = out.m_script;
        if(script.empty() || script.byte_at(0) != to_byte(opcode::op_return)) {
            return not_op_return{};
        }

        auto payload = op_return_payload{index, buffer()};
        if(script.size() == 1) {
            return payload;
        }

        const auto push = read_push(script, 1);
        if(!push.has_value()) {
            payload.m_data = script.slice(1, script.size() - 1);
            return payload;
        }

        const auto [data_offset, declared_len] = push.value();
        payload.m_data
            = script.slice(data_offset, static_cast<size_t>(declared_len));
        return payload;
    }

    auto extract_op_return(const transaction& tx)
        -> std::optional<op_return_payload> {
        for(size_t i = 0; i < tx.m_outputs.size(); i++) {
            auto cls = classify_output(tx.m_outputs[i], i);
            if(auto* payload = std::get_if<op_return_payload>(&cls)) {
                return std::move(*payload);
            }
        }
        return std::nullopt;
    }

    auto is_p2tr(const buffer& script) -> bool {
        return script.size() == p2tr_script_len
            && script.byte_at(0) == to_byte(opcode::op_1)
            && script.byte_at(1) == 0x20;
    }
}
