// envres/merge/merger.cpp - Defaults/override merge implementation
#include "envres/merge/merger.hpp"

#include <fmt/core.h>

#include <string>

namespace envres
{

namespace
{

template <typename T>
std::optional<T> pick(const std::optional<T> & base, const std::optional<T> & over)
{
  return over ? over : base;
}

template <typename Map>
std::optional<Map> union_maps(const std::optional<Map> & base, const std::optional<Map> & over)
{
  if (!base) return over;
  if (!over) return base;
  Map merged = *base;
  for (const auto & [key, value] : *over) {
    merged.insert_or_assign(key, value);
  }
  return merged;
}

std::optional<NetworkConfig> merge_network(
  const std::optional<NetworkConfig> & base, const std::optional<NetworkConfig> & over)
{
  if (!base) return over;
  if (!over) return base;
  NetworkConfig n;
  n.subnet_ids = pick(base->subnet_ids, over->subnet_ids);
  n.security_group_ids = pick(base->security_group_ids, over->security_group_ids);
  return n;
}

std::optional<ObservabilityConfig> merge_observability(
  const std::optional<ObservabilityConfig> & base, const std::optional<ObservabilityConfig> & over)
{
  if (!base) return over;
  if (!over) return base;
  ObservabilityConfig c;
  c.log_level = pick(base->log_level, over->log_level);
  c.tracing_enabled = pick(base->tracing_enabled, over->tracing_enabled);
  return c;
}

ResourceLimitsOverlay merge_limits(
  const std::optional<ResourceLimitsOverlay> & base,
  const std::optional<ResourceLimitsOverlay> & over)
{
  ResourceLimitsOverlay l;
  const ResourceLimitsOverlay empty;
  const auto & b = base ? *base : empty;
  const auto & o = over ? *over : empty;
  l.memory_size_mb = pick(b.memory_size_mb, o.memory_size_mb);
  l.timeout_seconds = pick(b.timeout_seconds, o.timeout_seconds);
  return l;
}

}  // namespace

Result<EnvironmentDescriptor> merge(
  const EnvironmentOverlay & defaults, const EnvironmentOverlay & overrides)
{
  const std::string & env = overrides.name;

  // Required scalars, in the order they are reported
  struct Required
  {
    const char * key;
    const std::optional<std::string> & base;
    const std::optional<std::string> & over;
    std::string * target;
  };

  EnvironmentDescriptor d;
  d.name = env;

  const Required required[] = {
    {keys::k_region, defaults.region, overrides.region, &d.region},
    {keys::k_project, defaults.project, overrides.project, &d.project},
    {keys::k_runtime_version, defaults.runtime_version, overrides.runtime_version,
     &d.runtime_version},
    {keys::k_storage_bucket_ref, defaults.storage_bucket_ref, overrides.storage_bucket_ref,
     &d.storage_bucket_ref},
    {keys::k_secrets_location_ref, defaults.secrets_location_ref, overrides.secrets_location_ref,
     &d.secrets_location_ref},
  };

  for (const auto & r : required) {
    auto value = pick(r.base, r.over);
    if (!value) {
      return fail(
        ErrorKind::MissingField, codes::k_missing_field, env, r.key,
        fmt::format("required field '{}' is set neither in defaults nor in '{}'", r.key, env));
    }
    *r.target = std::move(*value);
  }

  const ResourceLimitsOverlay limits = merge_limits(defaults.resource_limits, overrides.resource_limits);
  if (!limits.memory_size_mb) {
    return fail(
      ErrorKind::MissingField, codes::k_missing_field, env, "resourceLimits.memorySizeMB",
      fmt::format(
        "required field 'resourceLimits.memorySizeMB' is set neither in defaults nor in '{}'",
        env));
  }
  if (!limits.timeout_seconds) {
    return fail(
      ErrorKind::MissingField, codes::k_missing_field, env, "resourceLimits.timeoutSeconds",
      fmt::format(
        "required field 'resourceLimits.timeoutSeconds' is set neither in defaults nor in '{}'",
        env));
  }
  d.resource_limits.memory_size_mb = *limits.memory_size_mb;
  d.resource_limits.timeout_seconds = *limits.timeout_seconds;

  d.domain = pick(defaults.domain, overrides.domain);
  d.certificate_ref = pick(defaults.certificate_ref, overrides.certificate_ref);
  d.keep_warm = pick(defaults.keep_warm, overrides.keep_warm);
  d.excluded_packages = pick(defaults.excluded_packages, overrides.excluded_packages);

  d.environment_variables =
    union_maps(defaults.environment_variables, overrides.environment_variables).value_or(StringMap{});
  d.build_metadata =
    union_maps(defaults.build_metadata, overrides.build_metadata).value_or(StringMap{});

  d.network = merge_network(defaults.network, overrides.network);
  d.observability = merge_observability(defaults.observability, overrides.observability);

  d.extensions = defaults.extensions;
  for (const auto & [key, value] : overrides.extensions) {
    d.extensions.insert_or_assign(key, value);
  }

  return d;
}

EnvironmentOverlay to_overlay(const EnvironmentDescriptor & d)
{
  EnvironmentOverlay o;
  o.name = d.name;
  o.region = d.region;
  o.project = d.project;
  o.runtime_version = d.runtime_version;
  o.storage_bucket_ref = d.storage_bucket_ref;
  o.secrets_location_ref = d.secrets_location_ref;
  o.domain = d.domain;
  o.certificate_ref = d.certificate_ref;
  if (!d.environment_variables.empty()) {
    o.environment_variables = d.environment_variables;
  }
  o.network = d.network;
  o.resource_limits =
    ResourceLimitsOverlay{d.resource_limits.memory_size_mb, d.resource_limits.timeout_seconds};
  o.observability = d.observability;
  o.keep_warm = d.keep_warm;
  o.excluded_packages = d.excluded_packages;
  if (!d.build_metadata.empty()) {
    o.build_metadata = d.build_metadata;
  }
  o.extensions = d.extensions;
  return o;
}

}  // namespace envres
