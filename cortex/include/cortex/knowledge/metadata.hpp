#pragma once
// Pattern metadata: typed extra fields checked against a schema on write

#include "../status.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cortex {

using json = nlohmann::json;

enum class MetadataType { Bool, Integer, Real, String, StringList };

using MetadataValue = std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;
using Metadata = std::map<std::string, MetadataValue>;

inline const char* metadata_type_name(MetadataType t) {
    switch (t) {
        case MetadataType::Bool:       return "bool";
        case MetadataType::Integer:    return "integer";
        case MetadataType::Real:       return "real";
        case MetadataType::String:     return "string";
        case MetadataType::StringList: return "string_list";
    }
    return "unknown";
}

inline MetadataType metadata_type_of(const MetadataValue& v) {
    return static_cast<MetadataType>(v.index());
}

struct MetadataSchema {
    std::map<std::string, MetadataType> fields;
    bool strict = false;    // Unknown keys rejected

    // Fields every pattern may carry
    static MetadataSchema defaults() {
        MetadataSchema s;
        s.fields = {
            {"language", MetadataType::String},
            {"files", MetadataType::StringList},
            {"observations", MetadataType::Integer},
            {"success_rate", MetadataType::Real},
            {"verified", MetadataType::Bool},
            {"origin", MetadataType::String},
        };
        return s;
    }

    Status validate(const Metadata& metadata) const {
        for (const auto& [key, value] : metadata) {
            if (key.empty()) return Status::validation("metadata key is empty");
            auto it = fields.find(key);
            if (it == fields.end()) {
                if (strict) return Status::validation("unknown metadata key '" + key + "'");
                continue;
            }
            MetadataType actual = metadata_type_of(value);
            // Integers are accepted where reals are declared
            if (actual != it->second &&
                !(it->second == MetadataType::Real && actual == MetadataType::Integer)) {
                return Status::validation("metadata '" + key + "' must be " +
                                          metadata_type_name(it->second) + ", got " +
                                          metadata_type_name(actual));
            }
        }
        return Status::ok();
    }
};

inline json metadata_to_json(const Metadata& metadata) {
    json out = json::object();
    for (const auto& [key, value] : metadata) {
        std::visit([&out, &key](const auto& v) { out[key] = v; }, value);
    }
    return out;
}

inline Result<Metadata> metadata_from_json(const json& j) {
    Metadata out;
    if (j.is_null()) return out;
    if (!j.is_object()) return Status::validation("metadata must be an object");

    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& v = it.value();
        if (v.is_boolean()) {
            out[it.key()] = v.get<bool>();
        } else if (v.is_number_integer()) {
            out[it.key()] = v.get<int64_t>();
        } else if (v.is_number()) {
            out[it.key()] = v.get<double>();
        } else if (v.is_string()) {
            out[it.key()] = v.get<std::string>();
        } else if (v.is_array()) {
            std::vector<std::string> list;
            for (const auto& item : v) {
                if (!item.is_string()) {
                    return Status::validation("metadata '" + it.key() + "' list must hold strings");
                }
                list.push_back(item.get<std::string>());
            }
            out[it.key()] = std::move(list);
        } else {
            return Status::validation("metadata '" + it.key() + "' has unsupported type");
        }
    }
    return out;
}

} // namespace cortex
