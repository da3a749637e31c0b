#include "module_hierarchy.hpp"

namespace logwindow {

void ModuleHierarchy::observe(const std::string& path) {
    if (path.empty()) return;
    if (!seen_.insert(path).second) return;

    std::string parent = kHierarchyRoot;
    std::string prefix;
    size_t pos = 0;

    while (pos <= path.size()) {
        size_t dot = path.find('.', pos);
        if (dot == std::string::npos) dot = path.size();

        if (dot > pos) {
            if (!prefix.empty()) prefix += '.';
            prefix.append(path, pos, dot - pos);
            hierarchy_[parent].insert(prefix);
            parent = prefix;
        }
        pos = dot + 1;
    }
}

void ModuleHierarchy::clear() {
    hierarchy_.clear();
    seen_.clear();
}

nlohmann::json hierarchy_to_json(const HierarchyMap& hierarchy) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [parent, children] : hierarchy) {
        j[parent] = children;
    }
    return j;
}

} // namespace logwindow
