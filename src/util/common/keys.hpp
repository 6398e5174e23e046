// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_UTIL_COMMON_KEYS_H_
#define STAKESCAN_SRC_UTIL_COMMON_KEYS_H_

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace stakescan {
    /// Size of BIP-340 x-only public keys, in bytes.
    static constexpr size_t pubkey_len = 32;

    /// An x-only public key.
    using pubkey_t = std::array<unsigned char, pubkey_len>;

    /// Converts a public key to a lower-case hexadecimal string.
    /// \param key public key to convert.
    /// \return hex representation of the key.
    auto to_string(const pubkey_t& key) -> std::string;

    /// Parses a hexadecimal representation of a public key.
    /// \param hex string of exactly 64 hex digits.
    /// \return the key, or std::nullopt if the string is malformed.
    auto pubkey_from_hex(const std::string& hex) -> std::optional<pubkey_t>;

    /// Checks whether every byte of the key is zero.
    /// \param key public key to check.
    /// \return true if the key is all-zero.
    auto is_zero(const pubkey_t& key) -> bool;

    /// Checks that the key is a valid BIP-340 x-only public key, i.e. the
    /// x coordinate of a point on the secp256k1 curve.
    /// \param key public key to check.
    /// \return true if libsecp256k1 accepts the key.
    auto is_valid_xonly(const pubkey_t& key) -> bool;
}

#endif // STAKESCAN_SRC_UTIL_COMMON_KEYS_H_
