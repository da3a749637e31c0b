#pragma once

#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace logwindow {

// parent path -> immediate child paths; top level parent is "root"
using HierarchyMap = std::map<std::string, std::set<std::string>>;

constexpr const char* kHierarchyRoot = "root";

// Tree of dotted category paths seen since the last reset. Grows only;
// entries are not removed when the records that introduced them are evicted.
// Not synchronized, the owning cache holds the lock.
class ModuleHierarchy {
public:
    // Adds the edges root->a, a->a.b, a.b->a.b.c for "a.b.c".
    // Each distinct path is processed once.
    void observe(const std::string& path);

    void clear();

    bool empty() const { return hierarchy_.empty(); }
    size_t path_count() const { return seen_.size(); }

    HierarchyMap snapshot() const { return hierarchy_; }

private:
    HierarchyMap hierarchy_;
    std::unordered_set<std::string> seen_;
};

nlohmann::json hierarchy_to_json(const HierarchyMap& hierarchy);

} // namespace logwindow
