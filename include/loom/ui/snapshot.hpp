#pragma once

/// @file snapshot.hpp
/// @brief Serializable picture of a view graph's persistent state
///
/// A snapshot records, per node, the view name, the node's own state (only
/// stateful views have any) and the snapshots of its children. Building a
/// graph from a snapshot restores state wherever the view at a position has
/// the same name as the recorded one.

#include <loom/core/error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace loom_ui {

struct NodeSnapshot {
    std::string name;
    nlohmann::json state;
    std::vector<NodeSnapshot> children;

    /// Child snapshot at `index` if it was recorded for a view named `view_name`
    [[nodiscard]] const NodeSnapshot* child(std::size_t index, const std::string& view_name) const {
        if (index >= children.size() || children[index].name != view_name) {
            return nullptr;
        }
        return &children[index];
    }

    /// Number of nodes in this subtree
    [[nodiscard]] std::size_t node_count() const {
        std::size_t count = 1;
        for (const auto& c : children) {
            count += c.node_count();
        }
        return count;
    }

    bool operator==(const NodeSnapshot&) const = default;
};

void to_json(nlohmann::json& j, const NodeSnapshot& snapshot);
void from_json(const nlohmann::json& j, NodeSnapshot& snapshot);

/// Parse a snapshot document
[[nodiscard]] loom_core::Result<NodeSnapshot> parse_snapshot(const std::string& json_text);

/// Write a snapshot as pretty-printed JSON
[[nodiscard]] loom_core::Result<void> save_snapshot(const NodeSnapshot& snapshot, const std::string& path);

/// Read a snapshot written by `save_snapshot`
[[nodiscard]] loom_core::Result<NodeSnapshot> load_snapshot(const std::string& path);

} // namespace loom_ui
