/// @file snapshot.cpp
/// @brief Snapshot serialization

#include <loom/ui/snapshot.hpp>

#include <loom/core/log.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace loom_ui {

using loom_core::Err;
using loom_core::GraphError;
using loom_core::Ok;
using loom_core::ResourceError;
using loom_core::Result;

void to_json(nlohmann::json& j, const NodeSnapshot& snapshot) {
    j = nlohmann::json{
        {"name", snapshot.name},
        {"state", snapshot.state},
        {"children", snapshot.children},
    };
}

void from_json(const nlohmann::json& j, NodeSnapshot& snapshot) {
    j.at("name").get_to(snapshot.name);
    snapshot.state = j.value("state", nlohmann::json());
    snapshot.children.clear();
    if (j.contains("children")) {
        j.at("children").get_to(snapshot.children);
    }
}

Result<NodeSnapshot> parse_snapshot(const std::string& json_text) {
    try {
        auto j = nlohmann::json::parse(json_text);
        return Ok(j.get<NodeSnapshot>());
    } catch (const nlohmann::json::parse_error& ex) {
        return Err<NodeSnapshot>(GraphError::invalid_snapshot(ex.what()));
    } catch (const nlohmann::json::exception& ex) {
        return Err<NodeSnapshot>(GraphError::invalid_snapshot(ex.what()));
    }
}

Result<void> save_snapshot(const NodeSnapshot& snapshot, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return Err(ResourceError::unreadable(path, "cannot open for writing"));
    }

    file << nlohmann::json(snapshot).dump(2);
    if (!file) {
        return Err(ResourceError::unreadable(path, "write failed"));
    }

    loom_core::log_structured(spdlog::level::debug, "loom.graph", "Saved snapshot", {
        {"root", snapshot.name},
        {"nodes", std::to_string(snapshot.node_count())},
        {"path", path},
    });
    return Ok();
}

Result<NodeSnapshot> load_snapshot(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<NodeSnapshot>(ResourceError::not_found(path));
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto result = parse_snapshot(contents.str());
    if (result.is_err()) {
        result.error().with_context("path", path);
        loom_core::debug::record_error(result.error());
        loom_core::graph_logger()->warn("Could not load snapshot: {}", loom_core::build_error_chain(result.error()));
    }
    return result;
}

} // namespace loom_ui
