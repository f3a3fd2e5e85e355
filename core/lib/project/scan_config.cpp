// chartscan/project/scan_config.cpp - Scan configuration implementation
//
#include "chartscan/project/scan_config.hpp"

#include <yaml-cpp/yaml.h>

#include <system_error>

namespace fs = std::filesystem;

namespace chartscan
{

namespace
{

fs::path resolve_against(const fs::path & base_dir, const fs::path & p)
{
  if (p.is_absolute()) {
    return p.lexically_normal();
  }
  return (base_dir / p).lexically_normal();
}

/// Parse a `valuesFiles` list
bool parse_values_files(
  const YAML::Node & node, const fs::path & base_dir, std::vector<fs::path> & out,
  std::string & error)
{
  if (node.IsNull()) {
    return true;
  }
  if (!node.IsSequence()) {
    error = "must be a list";
    return false;
  }
  for (const auto & entry : node) {
    if (!entry.IsScalar()) {
      error = "entries must be strings";
      return false;
    }
    out.push_back(resolve_against(base_dir, entry.as<std::string>()));
  }
  return true;
}

}  // namespace

ScanConfigLoadResult load_scan_config(const fs::path & config_path)
{
  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ScanConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ScanConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ScanConfig config;
  config.config_dir = fs::absolute(config_path, ec).parent_path();
  if (ec) {
    return ScanConfigLoadResult::fail(
      "cannot resolve " + config_path.string() + ": " + ec.message());
  }

  if (root.IsNull()) {
    return ScanConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ScanConfigLoadResult::fail("configuration must be a map");
  }

  try {
    // 'chartPath'
    if (root["chartPath"]) {
      const std::string chart_path = root["chartPath"].as<std::string>();
      if (!chart_path.empty()) {
        config.chart_path = resolve_against(config.config_dir, chart_path);
      }
    }

    // 'valuesFiles'
    if (root["valuesFiles"]) {
      std::string error;
      if (!parse_values_files(root["valuesFiles"], config.config_dir, config.values_files, error)) {
        return ScanConfigLoadResult::fail("valuesFiles " + error);
      }
    }

    // 'format'
    if (root["format"]) {
      const std::string name = root["format"].as<std::string>();
      config.format = parse_output_format(name);
      if (!config.format) {
        return ScanConfigLoadResult::fail(
          "invalid format: '" + name + "' (must be 'pretty', 'json', 'yaml' or 'junit')");
      }
    }

    // 'environments'
    if (root["environments"]) {
      const YAML::Node envs = root["environments"];
      if (!envs.IsMap() && !envs.IsNull()) {
        return ScanConfigLoadResult::fail("environments must be a map");
      }
      for (const auto & kv : envs) {
        const std::string name = kv.first.as<std::string>();
        EnvironmentConfig env;
        if (!kv.second.IsNull()) {
          if (!kv.second.IsMap()) {
            return ScanConfigLoadResult::fail("environment '" + name + "' must be a map");
          }
          if (kv.second["valuesFiles"]) {
            std::string error;
            if (!parse_values_files(
                  kv.second["valuesFiles"], config.config_dir, env.values_files, error)) {
              return ScanConfigLoadResult::fail(
                "environments." + name + ".valuesFiles " + error);
            }
          }
        }
        config.environments.emplace(name, std::move(env));
      }
    }
  } catch (const YAML::Exception & e) {
    return ScanConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ScanConfigLoadResult::ok(std::move(config));
}

std::optional<fs::path> find_scan_config(const fs::path & start_dir)
{
  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_scan_config_file_name;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }

    // Repository root
    if (fs::exists(current / ".git", ec)) {
      break;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

ResolveResult resolve_scan_options(const ScanConfig & config, const ScanOverrides & overrides)
{
  ResolvedScanOptions opts;
  opts.values_files = config.values_files;
  opts.chart_path = config.chart_path;
  if (config.format) {
    opts.format = *config.format;
  }

  if (overrides.environment && !overrides.environment->empty()) {
    const auto it = config.environments.find(*overrides.environment);
    if (it == config.environments.end()) {
      return ResolveResult::fail(
        "environment " + *overrides.environment + " not found in " + k_scan_config_file_name);
    }
    opts.values_files = it->second.values_files;
  }

  if (!overrides.values_files.empty()) {
    opts.values_files.clear();
    for (const auto & f : overrides.values_files) {
      std::error_code ec;
      fs::path abs = fs::absolute(f, ec);
      opts.values_files.push_back(ec ? f : abs.lexically_normal());
    }
  }
  if (overrides.format) {
    opts.format = *overrides.format;
  }

  return ResolveResult::ok(std::move(opts));
}

}  // namespace chartscan
