// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_BITCOIN_SCRIPT_H_
#define STAKESCAN_SRC_BITCOIN_SCRIPT_H_

#include "transaction.hpp"

#include <optional>
#include <variant>

namespace stakescan::bitcoin {
    /// Script opcodes the scanner interprets.
    enum class opcode : uint8_t {
        op_0 = 0x00,
        /// Largest opcode that pushes its own value as a byte count.
        max_direct_push = 0x4b,
        op_pushdata1 = 0x4c,
        op_pushdata2 = 0x4d,
        op_pushdata4 = 0x4e,
        op_1 = 0x51,
        op_return = 0x6a,
    };

    /// Length of a taproot (segwit v1) output script: OP_1 PUSH32 <key>.
    static constexpr size_t p2tr_script_len = 34;

    /// Classification of an output that does not start with OP_RETURN.
    struct not_op_return {};

    /// Data carried by an OP_RETURN output.
    struct op_return_payload {
        auto operator==(const op_return_payload& rhs) const -> bool;

        /// Index of the output within its transaction.
        size_t m_output_index{};
        /// Bytes after the OP_RETURN opcode and its push-length prefix.
        buffer m_data;
    };

    /// Result of classifying a single output script.
    using output_class = std::variant<not_op_return, op_return_payload>;

    /// Classifies an output. An output is an OP_RETURN output iff the first
    /// script byte is OP_RETURN. The payload is the data of the push
    /// following the opcode, limited to the declared push length and to
    /// the bytes actually present. A bare OP_RETURN gives an empty payload;
    /// a non-push opcode after OP_RETURN gives the raw remaining bytes.
    /// \param out output to classify.
    /// \param index index of the output in its transaction.
    /// \return classification of the output.
    auto classify_output(const output& out, size_t index) -> output_class;

    /// Locates the first OP_RETURN output of a transaction and extracts its
    /// payload. Later OP_RETURN outputs are ignored.
    /// \param tx transaction to examine.
    /// \return the payload, or std::nullopt if no output starts with
    ///         OP_RETURN.
    auto extract_op_return(const transaction& tx)
        -> std::optional<op_return_payload>;

    /// Checks whether an output script is a taproot (segwit v1) output.
    /// \param script output script.
    /// \return true for OP_1 followed by a 32-byte push.
    auto is_p2tr(const buffer& script) -> bool;
}

#endif // STAKESCAN_SRC_BITCOIN_SCRIPT_H_
