#include "model/document.hpp"
#include "core/utils.hpp"

namespace sqlorm {

std::string scalar_to_string(const Map& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

std::vector<std::string> parse_key_list(const Map& value) {
    std::vector<std::string> keys;
    if (value.is_string()) {
        for (auto& part : utils::split(value.get_ref<const std::string&>(), ',')) {
            auto key = utils::trim(part);
            if (!key.empty()) {
                keys.emplace_back(std::move(key));
            }
        }
    } else if (value.is_array()) {
        for (const auto& entry : value) {
            if (entry.is_string() || entry.is_number()) {
                keys.emplace_back(scalar_to_string(entry));
            }
        }
    } else if (value.is_number()) {
        keys.emplace_back(value.dump());
    }
    return keys;
}

std::vector<std::string> parse_str_array(const Map* value) {
    std::vector<std::string> result;
    if (!value) return result;

    if (value->is_array()) {
        for (const auto& entry : *value) {
            if (entry.is_string()) {
                result.emplace_back(entry.get<std::string>());
            }
        }
    } else if (value->is_string()) {
        result = parse_key_list(*value);
    }
    return result;
}

} // namespace sqlorm
