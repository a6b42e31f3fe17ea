// envres/project/project_config.hpp - Project configuration (envres.yaml)
//
// Parses and validates envres.yaml project configuration files.
// Used by the CLI to locate the descriptor document and output settings.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "envres/loader/document_loader.hpp"
#include "envres/model/descriptor.hpp"

namespace envres
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Resolver configuration section.
 */
struct ResolverConfig
{
  /// Descriptor document (relative to envres.yaml)
  std::filesystem::path descriptors = "deploy.json";

  /// Output directory for resolved descriptors
  std::filesystem::path output_dir = "resolved";

  /// Output format: "json" | "yaml"
  DocumentFormat format = DocumentFormat::Json;

  /// Worker threads for resolving environments
  unsigned jobs = 1;

  /// Platform ceiling for resourceLimits.timeoutSeconds
  int64_t max_timeout_seconds = k_default_max_timeout_seconds;
};

/**
 * Project metadata section.
 */
struct ProjectInfo
{
  std::string name;
};

/**
 * Complete project configuration (envres.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;
  ResolverConfig resolver;

  /// Directory containing envres.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Absolute path of the descriptor document
  [[nodiscard]] std::filesystem::path descriptors_path() const
  {
    return project_root / resolver.descriptors;
  }

  /// Absolute path of the output directory
  [[nodiscard]] std::filesystem::path output_path() const
  {
    return project_root / resolver.output_dir;
  }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an envres.yaml file.
 *
 * @param config_path Path to envres.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to envres.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Parse an output format name ("json", "yaml", "yml").
 */
[[nodiscard]] std::optional<DocumentFormat> parse_format(const std::string & name);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "envres.yaml";

}  // namespace envres
