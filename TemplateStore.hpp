// TemplateStore.hpp
//
// Source of reusable templates (subgraphs) referenced by FlowNode instances.
// A template is a GraphDocument whose nodes include InputNode/OutputNode
// boundary markers.
#pragma once
#include "GraphTypes.hpp"
#include <map>
#include <optional>
#include <string>

namespace SignalFlow {

class TemplateStore {
public:
    virtual ~TemplateStore() = default;
    // nullopt when the template does not exist or cannot be parsed
    virtual std::optional<GraphDocument> load(const std::string& name) = 0;
};

// Reads "<dir>/<name>.json"
class DirectoryTemplateStore : public TemplateStore {
public:
    explicit DirectoryTemplateStore(std::string directory) : dir(std::move(directory)) {}
    std::optional<GraphDocument> load(const std::string& name) override;

private:
    std::string dir;
};

class MemoryTemplateStore : public TemplateStore {
public:
    void add(const std::string& name, GraphDocument doc) { docs[name] = std::move(doc); }
    std::optional<GraphDocument> load(const std::string& name) override;

private:
    std::map<std::string, GraphDocument> docs;
};

} // namespace SignalFlow
