// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "keys.hpp"

#include "buffer.hpp"

#include <algorithm>
#include <memory>
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>

namespace stakescan {
    namespace {
        using secp256k1_context_destroy_type = void (*)(secp256k1_context*);

        // Key parsing only reads from the context, so one shared instance
        // is safe to use from every scanner thread.
        const std::unique_ptr<secp256k1_context,
                              secp256k1_context_destroy_type>
            secp_context{secp256k1_context_create(SECP256K1_CONTEXT_NONE),
                         &secp256k1_context_destroy};
    }

    auto to_string(const pubkey_t& key) -> std::string {
        return to_hex(key.data(), key.size());
    }

    auto pubkey_from_hex(const std::string& hex) -> std::optional<pubkey_t> {
        if(hex.size() != pubkey_len * 2) {
            return std::nullopt;
        }
        auto buf = buffer::from_hex(hex);
        if(!buf.has_value()) {
            return std::nullopt;
        }
        auto ret = pubkey_t();
        std::copy_n(buf->c_ptr(), pubkey_len, ret.begin());
        return ret;
    }

    auto is_zero(const pubkey_t& key) -> bool {
        return std::all_of(key.begin(), key.end(), [](unsigned char b) {
            return b == 0;
        });
    }

    auto is_valid_xonly(const pubkey_t& key) -> bool {
        secp256k1_xonly_pubkey pubkey{};
        return secp256k1_xonly_pubkey_parse(secp_context.get(),
                                            &pubkey,
                                            key.data())
            == 1;
    }
}
