// envres/model/descriptor.hpp - Environment descriptor data model
//
// EnvironmentOverlay is the validated, partial form of one environment block
// (every field optional). EnvironmentDescriptor is the concrete form produced
// by the merger and completed by the reference resolver.
//
#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envres
{

/// Untyped nested value as read from the interchange document (order preserving)
using RawValue = nlohmann::ordered_json;

using StringMap = std::map<std::string, std::string>;

/// Pass-through fields that are not part of the schema
using ExtensionMap = std::map<std::string, RawValue>;

// ============================================================================
// Wire keys
// ============================================================================

namespace keys
{
inline constexpr const char * k_region = "region";
inline constexpr const char * k_project = "project";
inline constexpr const char * k_runtime_version = "runtimeVersion";
inline constexpr const char * k_storage_bucket_ref = "storageBucketRef";
inline constexpr const char * k_secrets_location_ref = "secretsLocationRef";
inline constexpr const char * k_domain = "domain";
inline constexpr const char * k_certificate_ref = "certificateRef";
inline constexpr const char * k_environment_variables = "environmentVariables";
inline constexpr const char * k_network = "network";
inline constexpr const char * k_subnet_ids = "subnetIds";
inline constexpr const char * k_security_group_ids = "securityGroupIds";
inline constexpr const char * k_resource_limits = "resourceLimits";
inline constexpr const char * k_memory_size_mb = "memorySizeMB";
inline constexpr const char * k_timeout_seconds = "timeoutSeconds";
inline constexpr const char * k_observability = "observability";
inline constexpr const char * k_log_level = "logLevel";
inline constexpr const char * k_tracing_enabled = "tracingEnabled";
inline constexpr const char * k_keep_warm = "keepWarm";
inline constexpr const char * k_excluded_packages = "excludedPackages";
inline constexpr const char * k_build_metadata = "buildMetadata";
}  // namespace keys

/// Upstream platform ceiling for timeoutSeconds
inline constexpr int64_t k_default_max_timeout_seconds = 900;

// ============================================================================
// Structured values
// ============================================================================

enum class LogLevel : uint8_t {
  Debug,
  Info,
  Warn,
  Error,
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;
[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

struct NetworkConfig
{
  std::optional<std::vector<std::string>> subnet_ids;
  std::optional<std::vector<std::string>> security_group_ids;

  bool operator==(const NetworkConfig &) const = default;
};

struct ObservabilityConfig
{
  std::optional<LogLevel> log_level;
  std::optional<bool> tracing_enabled;

  bool operator==(const ObservabilityConfig &) const = default;
};

struct ResourceLimits
{
  int64_t memory_size_mb = 0;
  int64_t timeout_seconds = 0;

  bool operator==(const ResourceLimits &) const = default;
};

struct ResourceLimitsOverlay
{
  std::optional<int64_t> memory_size_mb;
  std::optional<int64_t> timeout_seconds;

  bool operator==(const ResourceLimitsOverlay &) const = default;
};

// ============================================================================
// Resolved references (location only, never content)
// ============================================================================

/// Parsed `<scheme>://<bucket>/<key>`
struct SecretsLocation
{
  std::string scheme;
  std::string bucket;
  std::string key;

  [[nodiscard]] std::string uri() const { return scheme + "://" + bucket + "/" + key; }

  bool operator==(const SecretsLocation &) const = default;
};

/// Parsed `arn:<partition>:acm:<region>:<account>:certificate/<id>`
struct CertificateHandle
{
  std::string partition;
  std::string region;
  std::string account_id;
  std::string certificate_id;

  bool operator==(const CertificateHandle &) const = default;
};

struct StorageBucket
{
  std::string name;

  bool operator==(const StorageBucket &) const = default;
};

// ============================================================================
// Overlay (validated raw block)
// ============================================================================

struct EnvironmentOverlay
{
  std::string name;

  std::optional<std::string> region;
  std::optional<std::string> project;
  std::optional<std::string> runtime_version;
  std::optional<std::string> storage_bucket_ref;
  std::optional<std::string> secrets_location_ref;
  std::optional<std::string> domain;
  std::optional<std::string> certificate_ref;

  std::optional<StringMap> environment_variables;
  std::optional<NetworkConfig> network;
  std::optional<ResourceLimitsOverlay> resource_limits;
  std::optional<ObservabilityConfig> observability;
  std::optional<bool> keep_warm;
  std::optional<std::vector<std::string>> excluded_packages;
  std::optional<StringMap> build_metadata;

  ExtensionMap extensions;

  bool operator==(const EnvironmentOverlay &) const = default;
};

// ============================================================================
// Descriptor
// ============================================================================

/**
 * One named deployment profile after the defaults merge.
 *
 * Required fields are plain values; optional fields stay optional and are
 * omitted from the emitted document when unset. The reference handles are
 * empty until resolve_references() has run.
 */
struct EnvironmentDescriptor
{
  std::string name;

  std::string region;
  std::string project;
  std::string runtime_version;
  std::string storage_bucket_ref;
  std::string secrets_location_ref;
  std::optional<std::string> domain;
  std::optional<std::string> certificate_ref;

  StringMap environment_variables;
  std::optional<NetworkConfig> network;
  ResourceLimits resource_limits;
  std::optional<ObservabilityConfig> observability;
  std::optional<bool> keep_warm;
  std::optional<std::vector<std::string>> excluded_packages;
  StringMap build_metadata;

  ExtensionMap extensions;

  std::optional<StorageBucket> storage_bucket;
  std::optional<SecretsLocation> secrets_location;
  std::optional<CertificateHandle> certificate;

  /// True once the reference resolver has filled in every applicable handle
  [[nodiscard]] bool references_resolved() const noexcept
  {
    return storage_bucket.has_value() && secrets_location.has_value() &&
           (!certificate_ref.has_value() || certificate.has_value());
  }

  bool operator==(const EnvironmentDescriptor &) const = default;
};

}  // namespace envres
