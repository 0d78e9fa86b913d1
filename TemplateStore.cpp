// TemplateStore.cpp
#include "TemplateStore.hpp"
#include "Log.hpp"
#include <fstream>

namespace SignalFlow {

std::optional<GraphDocument> DirectoryTemplateStore::load(const std::string& name) {
    if (name.empty() || name.find("..") != std::string::npos || name.find('/') != std::string::npos) {
        logWarn("template store: refusing template name '{}'", name);
        return std::nullopt;
    }
    std::string path = dir + "/" + name + ".json";
    std::ifstream f(path);
    if (!f.good()) {
        logWarn("template store: '{}' not found at {}", name, path);
        return std::nullopt;
    }
    try {
        nlohmann::json j;
        f >> j;
        return parseGraphDocument(j);
    } catch (const nlohmann::json::exception& e) {
        logWarn("template store: failed to parse {}: {}", path, e.what());
        return std::nullopt;
    }
}

std::optional<GraphDocument> MemoryTemplateStore::load(const std::string& name) {
    auto it = docs.find(name);
    if (it == docs.end()) return std::nullopt;
    return it->second;
}

} // namespace SignalFlow
