// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_BABYLON_STAKING_PAYLOAD_H_
#define STAKESCAN_SRC_BABYLON_STAKING_PAYLOAD_H_

#include "bitcoin/script.hpp"
#include "params.hpp"
#include "util/common/keys.hpp"

#include <array>
#include <string>
#include <variant>

/// Babylon phase-1 staking transactions and their OP_RETURN payload.
namespace stakescan::babylon {
    /// Length of the magic tag at the start of every payload.
    static constexpr size_t tag_len = 4;

    /// Magic tag type.
    using tag_t = std::array<unsigned char, tag_len>;

    /// Magic tag, "bbn1".
    static constexpr tag_t magic_tag = {0x62, 0x62, 0x6e, 0x31};

    /// Byte offsets of the payload fields.
    static constexpr size_t version_offset = tag_len;
    static constexpr size_t staker_key_offset = version_offset + 1;
    static constexpr size_t fp_key_offset = staker_key_offset + pubkey_len;
    static constexpr size_t staking_time_offset = fp_key_offset + pubkey_len;

    /// Length of a payload of any recognized version.
    static constexpr size_t payload_len = staking_time_offset + 2;

    /// Highest recognized protocol version. Versions 0 through this value
    /// share the same layout.
    static constexpr uint8_t max_version = 2;

    /// Index of the output carrying the stake.
    static constexpr size_t staking_output_index = 0;

    /// Fields carried by a staking payload.
    struct staking_data {
        auto operator==(const staking_data& rhs) const -> bool;

        /// Magic tag.
        tag_t m_tag{magic_tag};
        /// Protocol version.
        uint8_t m_version{};
        /// Staker x-only public key.
        pubkey_t m_staker_key{};
        /// Finality provider x-only public key.
        pubkey_t m_fp_key{};
        /// Staking time in blocks.
        uint16_t m_staking_time{};
    };

    /// A decoded stake and where it was found.
    struct stake_record {
        auto operator==(const stake_record& rhs) const -> bool;

        /// Decoded payload fields.
        staking_data m_data;
        /// Value of the staking output, in satoshis.
        uint64_t m_amount{};
        /// ID of the staking transaction.
        std::string m_txid;
        /// Height of the block containing the transaction.
        bitcoin::block_height_t m_height{};
        /// Timestamp of the block containing the transaction. Filled in by
        /// the scanner, 0 when unknown.
        int64_t m_time{};
    };

    /// Reasons a Babylon-tagged payload or its transaction is not accepted
    /// as a stake.
    enum class rejection_reason : uint8_t {
        /// Payload shorter than the fixed layout.
        too_short,
        /// Payload does not start with the magic tag.
        bad_magic,
        /// Version byte is not recognized.
        unsupported_version,
        /// Payload longer than the fixed layout.
        wrong_length,
        /// A key is all-zero or not a valid x-only key.
        malformed_key,
        /// Output 0 is absent or is not a taproot output.
        missing_staking_output,
        /// Stake violates the configured global parameters.
        outside_params
    };

    /// Every rejection reason, in enum order.
    static constexpr std::array<rejection_reason, 7> all_rejection_reasons
        = {rejection_reason::too_short,
           rejection_reason::bad_magic,
           rejection_reason::unsupported_version,
           rejection_reason::wrong_length,
           rejection_reason::malformed_key,
           rejection_reason::missing_staking_output,
           rejection_reason::outside_params};

    /// Returns the snake_case name of a rejection reason.
    /// \param reason reason to name.
    /// \return reason name.
    auto to_string(rejection_reason reason) -> std::string;

    /// Result of decoding a payload.
    using decode_result = std::variant<staking_data, rejection_reason>;

    /// Result of decoding a staking transaction.
    using stake_result = std::variant<stake_record, rejection_reason>;

    /// Checks whether a payload begins with the magic tag, regardless of its
    /// length or content.
    /// \param payload OP_RETURN payload.
    /// \return true if the first bytes equal the magic tag.
    auto has_magic_tag(const buffer& payload) -> bool;

    /// Validates and decodes a staking payload. Checks are applied in
    /// order: too short, magic tag, version, excess length, then key
    /// validity. Never throws.
    /// \param payload OP_RETURN payload.
    /// \return the decoded fields, or the first failed check.
    auto decode_payload(const buffer& payload) -> decode_result;

    /// Encodes payload fields in the fixed layout. The staking time is
    /// written big-endian.
    /// \param data fields to encode.
    /// \return payload of \ref payload_len bytes.
    auto encode_payload(const staking_data& data) -> buffer;

    /// Decodes a staking transaction. The payload is decoded first, then
    /// the staking output is checked, then the global parameters if given.
    /// \param tx transaction carrying the payload.
    /// \param height height of the block containing tx.
    /// \param payload OP_RETURN payload extracted from tx.
    /// \param params global parameters to check against, or nullptr to skip
    ///               parameter checks.
    /// \return the stake, or the reason it was rejected.
    auto decode_stake(const bitcoin::transaction& tx,
                      bitcoin::block_height_t height,
                      const bitcoin::op_return_payload& payload,
                      const global_params* params) -> stake_result;
}

#endif // STAKESCAN_SRC_BABYLON_STAKING_PAYLOAD_H_
