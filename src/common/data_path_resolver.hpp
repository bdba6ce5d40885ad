#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace matchwire::data {

struct DataPathSpec {
    std::string appName = "matchwire";
    std::string dataDirEnvVar = "MATCHWIRE_DATA_DIR";
};

void SetDataPathSpec(DataPathSpec spec);
DataPathSpec GetDataPathSpec();

std::filesystem::path ExecutableDirectory();

// Bundled data: $<dataDirEnvVar> when set, otherwise <exe dir>/data.
std::filesystem::path DataRoot();
std::filesystem::path Resolve(const std::filesystem::path &relativePath);

// Per-user directory holding the user config and the region cache:
// $XDG_CONFIG_HOME/<app> or ~/.config/<app>. Throws Error(Filesystem) when
// neither variable is set or the directory cannot be created.
std::filesystem::path LocalDirectory();
std::filesystem::path EnsureLocalDirectory();

// Creates the file with `initialContents` when it is missing or empty.
std::filesystem::path EnsureLocalFile(const std::string &fileName, std::string_view initialContents);

std::optional<matchwire::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                                   const std::string &label,
                                                   spdlog::level::level_enum missingLevel);

} // namespace matchwire::data
