#include "common/data_path_resolver.hpp"

#include "common/errors.hpp"
#include "common/file_utils.hpp"

#include <array>
#include <climits>
#include <cstdlib>
#include <mutex>
#include <system_error>
#include <unistd.h>

namespace {

std::mutex g_specMutex;
matchwire::data::DataPathSpec g_spec;

std::filesystem::path Normalize(const std::filesystem::path &path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path : canonical;
}

const char *NonEmptyEnv(const std::string &name) {
    const char *value = std::getenv(name.c_str());
    return (value && *value) ? value : nullptr;
}

} // namespace

namespace matchwire::data {

void SetDataPathSpec(DataPathSpec spec) {
    std::lock_guard<std::mutex> lock(g_specMutex);
    g_spec = std::move(spec);
}

DataPathSpec GetDataPathSpec() {
    std::lock_guard<std::mutex> lock(g_specMutex);
    return g_spec;
}

std::filesystem::path ExecutableDirectory() {
    std::array<char, PATH_MAX> buffer{};
    const ssize_t length = ::readlink("/proc/self/exe", buffer.data(), buffer.size());
    if (length <= 0 || static_cast<std::size_t>(length) >= buffer.size()) {
        std::error_code ec;
        return std::filesystem::current_path(ec);
    }
    return std::filesystem::path(std::string(buffer.data(), static_cast<std::size_t>(length))).parent_path();
}

std::filesystem::path DataRoot() {
    const auto spec = GetDataPathSpec();
    if (const char *overridden = NonEmptyEnv(spec.dataDirEnvVar)) {
        return Normalize(overridden);
    }
    return Normalize(ExecutableDirectory() / "data");
}

std::filesystem::path Resolve(const std::filesystem::path &relativePath) {
    return Normalize(relativePath.is_absolute() ? relativePath : DataRoot() / relativePath);
}

std::filesystem::path LocalDirectory() {
    const auto spec = GetDataPathSpec();
    std::filesystem::path base;
    if (const char *xdg = NonEmptyEnv("XDG_CONFIG_HOME")) {
        base = xdg;
    } else if (const char *home = NonEmptyEnv("HOME")) {
        base = std::filesystem::path(home) / ".config";
    } else {
        throw MATCHWIRE_ERROR(ErrorKind::Filesystem, "Neither XDG_CONFIG_HOME nor HOME is set");
    }
    return Normalize(base / spec.appName);
}

std::filesystem::path EnsureLocalDirectory() {
    const auto dir = LocalDirectory();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw MATCHWIRE_ERROR(ErrorKind::Filesystem, "Failed to create " + dir.string() + ": " + ec.message());
    }
    return dir;
}

std::filesystem::path EnsureLocalFile(const std::string &fileName, std::string_view initialContents) {
    const auto path = EnsureLocalDirectory() / fileName;
    const auto existing = file::ReadFileText(path);
    if (!existing || existing->find_first_not_of(" \t\r\n") == std::string::npos) {
        file::WriteFileAtomically(path, initialContents);
    }
    return path;
}

std::optional<matchwire::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                                   const std::string &label,
                                                   spdlog::level::level_enum missingLevel) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::log(missingLevel, "Config: {} not found at {}", label, path.string());
        return std::nullopt;
    }
    const auto text = file::ReadFileText(path);
    if (!text) {
        spdlog::error("Config: failed to read {} ({})", label, path.string());
        return std::nullopt;
    }
    try {
        return json::Parse(*text);
    } catch (const json::Value::exception &ex) {
        spdlog::error("Config: failed to parse {}: {}", label, ex.what());
        return std::nullopt;
    }
}

} // namespace matchwire::data
