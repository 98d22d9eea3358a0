#include "artifacts/topology_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace hopmap::artifacts {

namespace {

using JsonValue = core::json::Value;

std::string DotEscape(std::string_view raw) {
  std::string escaped;
  for (const char c : raw) {
    if (c == '"' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

std::string DotQuote(std::string_view raw) {
  return "\"" + DotEscape(raw) + "\"";
}

std::string NodeLabel(const analysis::TopologyGraph& graph, const std::string& node) {
  const auto label = graph.labels.find(node);
  if (label == graph.labels.end()) {
    return DotQuote(node);
  }
  return "\"" + DotEscape(node) + "\\n" + DotEscape(label->second) + "\"";
}

bool Publish(const fs::path& output_dir, const std::string& file_name, const std::string& text,
             fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }
  written_path = output_dir / file_name;
  return core::WriteTextFileAtomic(written_path, text, error);
}

} // namespace

std::string FormatTopologyDot(const analysis::TopologyGraph& graph) {
  std::ostringstream out;
  out << "digraph hopmap {\n";
  out << "  rankdir=LR;\n";
  out << "  node [shape=ellipse];\n";
  for (const auto& node : graph.nodes) {
    out << "  " << DotQuote(node) << " [label=" << NodeLabel(graph, node);
    if (analysis::IsPlaceholderNode(node)) {
      out << ", style=dashed";
    } else if (graph.terminals.find(node) != graph.terminals.end()) {
      out << ", shape=box";
    }
    out << "];\n";
  }
  for (const auto& edge : graph.edges) {
    out << "  " << DotQuote(edge.from) << " -> " << DotQuote(edge.to) << ";\n";
  }
  out << "}\n";
  return out.str();
}

bool WriteTopologyDot(const analysis::TopologyGraph& graph, const fs::path& output_dir,
                      fs::path& written_path, std::string& error) {
  return Publish(output_dir, "topology.dot", FormatTopologyDot(graph), written_path, error);
}

bool WriteTopologyJson(const analysis::TopologyGraph& graph, const fs::path& output_dir,
                       fs::path& written_path, std::string& error) {
  JsonValue root = JsonValue::MakeObject();

  JsonValue nodes = JsonValue::MakeArray();
  for (const auto& node : graph.nodes) {
    nodes.array_value.push_back(JsonValue::MakeString(node));
  }
  root.object_value["nodes"] = std::move(nodes);

  JsonValue edges = JsonValue::MakeArray();
  for (const auto& edge : graph.edges) {
    JsonValue pair = JsonValue::MakeArray();
    pair.array_value.push_back(JsonValue::MakeString(edge.from));
    pair.array_value.push_back(JsonValue::MakeString(edge.to));
    edges.array_value.push_back(std::move(pair));
  }
  root.object_value["edges"] = std::move(edges);

  JsonValue labels = JsonValue::MakeObject();
  for (const auto& [node, hostname] : graph.labels) {
    labels.object_value[node] = JsonValue::MakeString(hostname);
  }
  root.object_value["labels"] = std::move(labels);

  JsonValue terminals = JsonValue::MakeObject();
  for (const auto& [node, target] : graph.terminals) {
    terminals.object_value[node] = JsonValue::MakeString(target);
  }
  root.object_value["terminals"] = std::move(terminals);

  return Publish(output_dir, "topology.json", core::json::Serialize(root, 2) + "\n",
                 written_path, error);
}

} // namespace hopmap::artifacts
