#pragma once

#include "analysis/topology.hpp"

#include <filesystem>
#include <string>

namespace hopmap::artifacts {

// Graphviz text for the graph. Labelled nodes show `id\nhostname`,
// placeholders are dashed, terminals are drawn as boxes.
std::string FormatTopologyDot(const analysis::TopologyGraph& graph);

// Emits `<output_dir>/topology.dot`.
bool WriteTopologyDot(const analysis::TopologyGraph& graph, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

// Emits `<output_dir>/topology.json` with `nodes`, `edges`, `labels` and
// `terminals`.
bool WriteTopologyJson(const analysis::TopologyGraph& graph,
                       const std::filesystem::path& output_dir,
                       std::filesystem::path& written_path, std::string& error);

} // namespace hopmap::artifacts
