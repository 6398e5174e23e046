// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_BABYLON_PARAMS_H_
#define STAKESCAN_SRC_BABYLON_PARAMS_H_

#include "bitcoin/transaction.hpp"

#include <json/json.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stakescan::babylon {
    /// Staking parameters of one global parameters version.
    struct version_params {
        auto operator==(const version_params& rhs) const -> bool;

        /// Parameters version number.
        uint32_t m_version{};
        /// First height at which the version applies.
        bitcoin::block_height_t m_activation_height{};
        /// Last height at which the version applies, if bounded.
        std::optional<bitcoin::block_height_t> m_cap_height;
        /// Smallest accepted stake, in satoshis.
        uint64_t m_min_staking_amount{};
        /// Largest accepted stake, in satoshis.
        uint64_t m_max_staking_amount{};
        /// Shortest accepted staking time, in blocks.
        uint64_t m_min_staking_time{};
        /// Longest accepted staking time, in blocks.
        uint64_t m_max_staking_time{};

        /// Checks whether the version applies at the given height.
        /// \param height block height.
        /// \return true if height is within [activation, cap].
        [[nodiscard]] auto applies_at(bitcoin::block_height_t height) const
            -> bool;
    };

    /// Versioned global staking parameters, in the global-params.json
    /// format published for Babylon phase-1.
    class global_params {
      public:
        /// Field names read from each entry of the "versions" array.
        static constexpr auto versions_key = "versions";
        static constexpr auto version_key = "version";
        static constexpr auto activation_height_key = "activation_height";
        static constexpr auto cap_height_key = "cap_height";
        static constexpr auto min_staking_amount_key = "min_staking_amount";
        static constexpr auto max_staking_amount_key = "max_staking_amount";
        static constexpr auto min_staking_time_key = "min_staking_time";
        static constexpr auto max_staking_time_key = "max_staking_time";

        global_params() = default;

        /// Constructs a parameter set from a list of versions.
        /// \param versions versions, in file order.
        explicit global_params(std::vector<version_params> versions);

        /// Reads parameters from a parsed JSON document. Unknown fields are
        /// ignored.
        /// \param json document root.
        /// \return the parameters, or an error message naming the offending
        ///         field.
        static auto from_json(const Json::Value& json)
            -> std::variant<global_params, std::string>;

        /// Reads parameters from a JSON file.
        /// \param path path to the file.
        /// \return the parameters, or an error message.
        static auto load(const std::string& path)
            -> std::variant<global_params, std::string>;

        /// Finds the parameters applying to a stake. Prefers the first
        /// version numbered like the stake that applies at the height,
        /// otherwise the latest version in file order that applies at the
        /// height.
        /// \param height height of the block containing the stake.
        /// \param version protocol version of the stake.
        /// \return the applicable parameters, or std::nullopt if no version
        ///         applies at the height.
        [[nodiscard]] auto params_for(bitcoin::block_height_t height,
                                      uint32_t version) const
            -> std::optional<version_params>;

        /// Returns every version in file order.
        [[nodiscard]] auto versions() const
            -> const std::vector<version_params>&;

      private:
        std::vector<version_params> m_versions;
    };
}

#endif // STAKESCAN_SRC_BABYLON_PARAMS_H_
