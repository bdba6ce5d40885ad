#include "common/config_store.hpp"

#include "common/data_path_resolver.hpp"

#include <mutex>

namespace {

struct StoreState {
    std::mutex mutex;
    bool initialized = false;
    matchwire::json::Value merged = matchwire::json::Object();
};

StoreState g_store;

const matchwire::json::Value *findPath(const matchwire::json::Value &root, std::string_view path) {
    const matchwire::json::Value *node = &root;
    while (!path.empty()) {
        const auto dot = path.find('.');
        const std::string key(path.substr(0, dot));
        if (key.empty() || !node->is_object()) {
            return nullptr;
        }
        const auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
        path = (dot == std::string_view::npos) ? std::string_view{} : path.substr(dot + 1);
    }
    return node;
}

// Returns false when the layer should be skipped.
bool mergeFileLayer(matchwire::json::Value &merged,
                    const std::filesystem::path &path,
                    const std::string &label,
                    spdlog::level::level_enum missingLevel) {
    auto layer = matchwire::data::LoadJsonFile(path, label, missingLevel);
    if (!layer) {
        return false;
    }
    if (!layer->is_object()) {
        spdlog::warn("Config: {} ({}) is not a JSON object, ignoring it", label, path.string());
        return false;
    }
    matchwire::config::MergeJsonObjects(merged, *layer);
    spdlog::debug("Config: applied {} from {}", label, path.string());
    return true;
}

} // namespace

namespace matchwire::config {

void MergeJsonObjects(matchwire::json::Value &destination, const matchwire::json::Value &source) {
    if (!destination.is_object() || !source.is_object()) {
        destination = source;
        return;
    }
    for (const auto &[key, value] : source.items()) {
        auto existing = destination.find(key);
        if (existing != destination.end() && existing->is_object() && value.is_object()) {
            MergeJsonObjects(*existing, value);
        } else {
            destination[key] = value;
        }
    }
}

void ConfigStore::Initialize(const matchwire::json::Value &builtinDefaults,
                             const std::vector<ConfigFileSpec> &fileSpecs,
                             const std::filesystem::path &userConfigPath) {
    matchwire::json::Value merged = builtinDefaults.is_object() ? builtinDefaults : matchwire::json::Object();

    for (const auto &spec : fileSpecs) {
        const auto path = (spec.resolveRelativeToDataRoot && spec.path.is_relative())
            ? matchwire::data::Resolve(spec.path)
            : spec.path;
        const std::string label = spec.label.empty() ? path.string() : spec.label;
        if (!mergeFileLayer(merged, path, label, spec.missingLevel) && spec.required) {
            spdlog::error("Config: required {} could not be loaded", label);
        }
    }

    if (!userConfigPath.empty()) {
        mergeFileLayer(merged, userConfigPath, "user config", spdlog::level::debug);
    }

    std::lock_guard<std::mutex> lock(g_store.mutex);
    g_store.merged = std::move(merged);
    g_store.initialized = true;
}

bool ConfigStore::Initialized() {
    std::lock_guard<std::mutex> lock(g_store.mutex);
    return g_store.initialized;
}

const matchwire::json::Value *ConfigStore::Get(std::string_view path) {
    std::lock_guard<std::mutex> lock(g_store.mutex);
    if (!g_store.initialized || path.empty()) {
        return nullptr;
    }
    return findPath(g_store.merged, path);
}

void ConfigStore::Reset() {
    std::lock_guard<std::mutex> lock(g_store.mutex);
    g_store.merged = matchwire::json::Object();
    g_store.initialized = false;
}

} // namespace matchwire::config
