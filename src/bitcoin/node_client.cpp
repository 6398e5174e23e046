// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node_client.hpp"

namespace stakescan::bitcoin {
    auto to_string(node_error err) -> std::string {
        switch(err) {
            case node_error::not_found:
                return "not found";
            case node_error::transient:
                return "transient failure";
        }
        return "unknown";
    }
}
