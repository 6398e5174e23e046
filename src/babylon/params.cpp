// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "params.hpp"

#include <fstream>
#include <limits>
#include <tuple>

namespace stakescan::babylon {
    namespace {
        auto read_uint(const Json::Value& entry,
                       const char* key,
                       size_t idx) -> std::variant<uint64_t, std::string> {
            const auto& v = entry[key];
            if(!v.isUInt64()) {
                return "Missing or invalid " + std::string(key)
                     + " in parameters version entry " + std::to_string(idx);
            }
            return v.asUInt64();
        }
    }

    auto version_params::operator==(const version_params& rhs) const -> bool {
        return std::tie(m_version,
                        m_activation_height,
                        m_cap_height,
                        m_min_staking_amount,
                        m_max_staking_amount,
                        m_min_staking_time,
                        m_max_staking_time)
            == std::tie(rhs.m_version,
                        rhs.m_activation_height,
                        rhs.m_cap_height,
                        rhs.m_min_staking_amount,
                        rhs.m_max_staking_amount,
                        rhs.m_min_staking_time,
                        rhs.m_max_staking_time);
    }

    auto version_params::applies_at(bitcoin::block_height_t height) const
        -> bool {
        if(height < m_activation_height) {
            return false;
        }
        return !m_cap_height.has_value() || height <= m_cap_height.value();
    }

    global_params::global_params(std::vector<version_params> versions)
        : m_versions(std::move(versions)) {}

    auto global_params::from_json(const Json::Value& json)
        -> std::variant<global_params, std::string> {
        if(!json.isObject() || !json[versions_key].isArray()) {
            return "Parameters document has no " + std::string(versions_key)
                 + " array";
        }

        auto versions = std::vector<version_params>();
        const auto& entries = json[versions_key];
        for(Json::ArrayIndex i = 0; i < entries.size(); i++) {
            const auto& entry = entries[i];
            if(!entry.isObject()) {
                return "Parameters version entry " + std::to_string(i)
                     + " is not an object";
            }

            auto vp = version_params();
            auto fields = std::vector<std::pair<const char*, uint64_t*>>{
                {activation_height_key, &vp.m_activation_height},
                {min_staking_amount_key, &vp.m_min_staking_amount},
                {max_staking_amount_key, &vp.m_max_staking_amount},
                {min_staking_time_key, &vp.m_min_staking_time},
                {max_staking_time_key, &vp.m_max_staking_time}};
            auto ver = read_uint(entry, version_key, i);
            if(std::holds_alternative<std::string>(ver)) {
                return std::get<std::string>(ver);
            }
            if(std::get<uint64_t>(ver)
               > std::numeric_limits<uint32_t>::max()) {
                return "Version out of range in parameters version entry "
                     + std::to_string(i);
            }
            vp.m_version = static_cast<uint32_t>(std::get<uint64_t>(ver));
            for(auto& [key, dest] : fields) {
                auto val = read_uint(entry, key, i);
                if(std::holds_alternative<std::string>(val)) {
                    return std::get<std::string>(val);
                }
                *dest = std::get<uint64_t>(val);
            }
            if(entry.isMember(cap_height_key)) {
                auto cap = read_uint(entry, cap_height_key, i);
                if(std::holds_alternative<std::string>(cap)) {
                    return std::get<std::string>(cap);
                }
                vp.m_cap_height = std::get<uint64_t>(cap);
            }

            if(vp.m_min_staking_amount > vp.m_max_staking_amount) {
                return "min_staking_amount exceeds max_staking_amount in "
                       "parameters version entry "
                     + std::to_string(i);
            }
            if(vp.m_min_staking_time > vp.m_max_staking_time) {
                return "min_staking_time exceeds max_staking_time in "
                       "parameters version entry "
                     + std::to_string(i);
            }

            versions.push_back(vp);
        }

        return global_params(std::move(versions));
    }

    auto global_params::load(const std::string& path)
        -> std::variant<global_params, std::string> {
        auto file = std::ifstream(path);
        if(!file.good()) {
            return "Unable to open global parameters file " + path;
        }

        auto builder = Json::CharReaderBuilder();
        auto root = Json::Value();
        auto errs = std::string();
        if(!Json::parseFromStream(builder, file, &root, &errs)) {
            return "Unable to parse global parameters file " + path + ": "
                 + errs;
        }

        return from_json(root);
    }

    auto global_params::params_for(bitcoin::block_height_t height,
                                   uint32_t version) const
        -> std::optional<version_params> {
        for(const auto& vp : m_versions) {
            if(vp.m_version == version && vp.applies_at(height)) {
                return vp;
            }
        }

        for(auto it = m_versions.rbegin(); it != m_versions.rend(); it++) {
            if(it->applies_at(height)) {
                return *it;
            }
        }

        return std::nullopt;
    }

    auto global_params::versions() const -> const std::vector<version_params>& {
        return m_versions;
    }
}
