#include "common/config_helpers.hpp"

#include "common/config_store.hpp"
#include "spdlog/spdlog.h"

#include <stdexcept>

namespace matchwire::config {

int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue) {
    for (const char* path : paths) {
        if (const auto* value = ConfigStore::Get(path)) {
            if (value->is_number_integer()) {
                return value->get<int>();
            }
            if (value->is_string()) {
                try {
                    return std::stoi(value->get<std::string>());
                } catch (const std::logic_error &) {
                    spdlog::warn("Config '{}' string value is not a valid integer", path);
                }
            } else {
                spdlog::warn("Config '{}' cannot be interpreted as integer", path);
            }
        }
    }
    return defaultValue;
}

std::string ReadStringConfig(const char *path, const std::string &defaultValue) {
    if (const auto* value = ConfigStore::Get(path)) {
        if (value->is_string()) {
            return value->get<std::string>();
        }
    }
    return defaultValue;
}

std::vector<std::string> ReadStringListConfig(const char *path, const std::vector<std::string> &defaultValue) {
    const auto* value = ConfigStore::Get(path);
    if (!value) {
        return defaultValue;
    }
    if (!value->is_array()) {
        spdlog::warn("Config '{}' is not an array of strings", path);
        return defaultValue;
    }
    std::vector<std::string> result;
    for (const auto &entry : *value) {
        if (entry.is_string()) {
            result.push_back(entry.get<std::string>());
        }
    }
    return result;
}

} // namespace matchwire::config
