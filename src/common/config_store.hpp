#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace matchwire::config {

struct ConfigFileSpec {
    std::filesystem::path path;
    std::string label;
    spdlog::level::level_enum missingLevel = spdlog::level::warn;
    bool required = false;
    bool resolveRelativeToDataRoot = true;
};

// Process wide layered configuration. Layers are merged in order: built-in
// defaults, then each file spec, then the user config file. Later layers
// override earlier ones key by key.
class ConfigStore {
public:
    static void Initialize(const matchwire::json::Value &builtinDefaults,
                           const std::vector<ConfigFileSpec> &fileSpecs,
                           const std::filesystem::path &userConfigPath);
    static bool Initialized();

    // Dotted lookup, e.g. "network.RequestTimeoutSeconds". Returns nullptr
    // when any segment is missing. Pointers stay valid until Reset.
    static const matchwire::json::Value *Get(std::string_view path);

    static void Reset();
};

void MergeJsonObjects(matchwire::json::Value &destination, const matchwire::json::Value &source);

} // namespace matchwire::config
