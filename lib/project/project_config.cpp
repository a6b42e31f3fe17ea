// envres/project/project_config.cpp - Project configuration implementation
//
#include "envres/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace envres
{

namespace
{

/// Parse the 'resolver' section into cfg; returns an error message on failure
std::optional<std::string> parse_resolver(const YAML::Node & node, ResolverConfig & cfg)
{
  if (!node.IsMap()) {
    return "resolver must be a map";
  }

  if (node["descriptors"]) {
    cfg.descriptors = node["descriptors"].as<std::string>();
  }

  if (node["output_dir"]) {
    cfg.output_dir = node["output_dir"].as<std::string>();
  }

  if (node["format"]) {
    const auto name = node["format"].as<std::string>();
    auto format = parse_format(name);
    if (!format) {
      return "invalid resolver.format: '" + name + "' (must be 'json' or 'yaml')";
    }
    cfg.format = *format;
  }

  if (node["jobs"]) {
    const auto jobs = node["jobs"].as<int>();
    if (jobs < 1) {
      return "resolver.jobs must be at least 1";
    }
    cfg.jobs = static_cast<unsigned>(jobs);
  }

  if (node["max_timeout_seconds"]) {
    const auto max = node["max_timeout_seconds"].as<int64_t>();
    if (max < 1) {
      return "resolver.max_timeout_seconds must be at least 1";
    }
    cfg.max_timeout_seconds = max;
  }

  return std::nullopt;
}

}  // namespace

std::optional<DocumentFormat> parse_format(const std::string & name)
{
  if (name == "json") {
    return DocumentFormat::Json;
  }
  if (name == "yaml" || name == "yml") {
    return DocumentFormat::Yaml;
  }
  return std::nullopt;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'project' section
    if (root["project"]) {
      const auto & proj = root["project"];
      if (proj["name"]) {
        config.project.name = proj["name"].as<std::string>();
      }
    }

    // Parse 'resolver' section
    if (root["resolver"]) {
      if (auto error = parse_resolver(root["resolver"], config.resolver)) {
        return ConfigLoadResult::fail(*error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace envres
