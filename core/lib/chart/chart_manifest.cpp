// chartscan/chart/chart_manifest.cpp - Chart manifest implementation
//
#include "chartscan/chart/chart_manifest.hpp"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace chartscan
{

namespace
{

std::string scalar_or_empty(const YAML::Node & node, const char * key)
{
  const YAML::Node child = node[key];
  if (child && child.IsScalar()) {
    return child.Scalar();
  }
  return {};
}

ChartDependency parse_dependency(const YAML::Node & node)
{
  ChartDependency dep;
  if (node.IsMap()) {
    dep.name = scalar_or_empty(node, "name");
    dep.version = scalar_or_empty(node, "version");
    dep.repository = scalar_or_empty(node, "repository");
  }
  return dep;
}

}  // namespace

ManifestLoadResult load_chart_manifest(const std::filesystem::path & chart_dir)
{
  const std::filesystem::path manifest_path = chart_dir / k_chart_manifest_file_name;

  std::ifstream in(manifest_path, std::ios::binary);
  if (!in.is_open()) {
    return ManifestLoadResult::fail(
      ErrorKind::ConfigError, "open " + manifest_path.string() + ": " + std::strerror(errno));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  YAML::Node root;
  try {
    root = YAML::Load(buffer.str());
  } catch (const YAML::Exception & e) {
    return ManifestLoadResult::fail(
      ErrorKind::ParseError, "failed to parse YAML: " + std::string(e.what()));
  }

  ChartManifest manifest;
  if (!root || root.IsNull()) {
    return ManifestLoadResult::ok(std::move(manifest));
  }
  if (!root.IsMap()) {
    return ManifestLoadResult::fail(
      ErrorKind::ParseError, "Chart.yaml must be a mapping at the top level");
  }

  manifest.name = scalar_or_empty(root, "name");
  manifest.version = scalar_or_empty(root, "version");

  const YAML::Node deps = root["dependencies"];
  if (deps && deps.IsSequence()) {
    for (const auto & dep : deps) {
      manifest.dependencies.push_back(parse_dependency(dep));
    }
  }

  return ManifestLoadResult::ok(std::move(manifest));
}

std::optional<std::string> read_chart_name(const std::filesystem::path & chart_dir)
{
  const ManifestLoadResult loaded = load_chart_manifest(chart_dir);
  if (!loaded.success || loaded.manifest.name.empty()) {
    return std::nullopt;
  }
  return loaded.manifest.name;
}

}  // namespace chartscan
