// envres/emit/descriptor_emitter.cpp - Descriptor serialization
#include "envres/emit/descriptor_emitter.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <string>

namespace envres
{

namespace
{

RawValue string_list(const std::vector<std::string> & items)
{
  RawValue arr = RawValue::array();
  for (const auto & s : items) {
    arr.push_back(s);
  }
  return arr;
}

RawValue string_map(const StringMap & map)
{
  RawValue obj = RawValue::object();
  for (const auto & [key, value] : map) {
    obj[key] = value;
  }
  return obj;
}

void emit_yaml(YAML::Emitter & out, const RawValue & v)
{
  using value_t = nlohmann::json::value_t;
  switch (v.type()) {
    case value_t::object:
      out << YAML::BeginMap;
      for (const auto & item : v.items()) {
        out << YAML::Key << item.key() << YAML::Value;
        emit_yaml(out, item.value());
      }
      out << YAML::EndMap;
      break;
    case value_t::array:
      out << YAML::BeginSeq;
      for (const auto & item : v) {
        emit_yaml(out, item);
      }
      out << YAML::EndSeq;
      break;
    case value_t::string:
      // Always quoted so that "1" or "true" stay strings when read back
      out << YAML::DoubleQuoted << v.get_ref<const std::string &>();
      break;
    case value_t::boolean:
      out << v.get<bool>();
      break;
    case value_t::number_integer:
      out << v.get<int64_t>();
      break;
    case value_t::number_unsigned:
      out << v.get<uint64_t>();
      break;
    case value_t::number_float:
      // nlohmann keeps a decimal point on integral values ("1.0"), which
      // yaml-cpp drops; without it the value reads back as an integer.
      if (std::isfinite(v.get<double>())) {
        out << v.dump();
      } else {
        out << v.get<double>();
      }
      break;
    case value_t::null:
    case value_t::binary:
    case value_t::discarded:
      out << YAML::Null;
      break;
  }
}

}  // namespace

ImmutableDescriptor emit(EnvironmentDescriptor descriptor)
{
  return ImmutableDescriptor(std::move(descriptor));
}

RawValue to_raw(const EnvironmentDescriptor & d)
{
  RawValue j = RawValue::object();
  j[keys::k_region] = d.region;
  j[keys::k_project] = d.project;
  j[keys::k_runtime_version] = d.runtime_version;
  j[keys::k_storage_bucket_ref] = d.storage_bucket_ref;
  j[keys::k_secrets_location_ref] = d.secrets_location_ref;
  if (d.domain) {
    j[keys::k_domain] = *d.domain;
  }
  if (d.certificate_ref) {
    j[keys::k_certificate_ref] = *d.certificate_ref;
  }

  if (d.network) {
    RawValue net = RawValue::object();
    if (d.network->subnet_ids) {
      net[keys::k_subnet_ids] = string_list(*d.network->subnet_ids);
    }
    if (d.network->security_group_ids) {
      net[keys::k_security_group_ids] = string_list(*d.network->security_group_ids);
    }
    j[keys::k_network] = std::move(net);
  }

  j[keys::k_resource_limits] = RawValue{
    {keys::k_memory_size_mb, d.resource_limits.memory_size_mb},
    {keys::k_timeout_seconds, d.resource_limits.timeout_seconds},
  };

  if (d.observability) {
    RawValue obs = RawValue::object();
    if (d.observability->log_level) {
      obs[keys::k_log_level] = std::string(to_string(*d.observability->log_level));
    }
    if (d.observability->tracing_enabled) {
      obs[keys::k_tracing_enabled] = *d.observability->tracing_enabled;
    }
    j[keys::k_observability] = std::move(obs);
  }

  if (d.keep_warm) {
    j[keys::k_keep_warm] = *d.keep_warm;
  }
  j[keys::k_environment_variables] = string_map(d.environment_variables);
  j[keys::k_build_metadata] = string_map(d.build_metadata);
  if (d.excluded_packages) {
    j[keys::k_excluded_packages] = string_list(*d.excluded_packages);
  }

  for (const auto & [key, value] : d.extensions) {
    j[key] = value;
  }
  return j;
}

RawValue to_deployment_raw(const ImmutableDescriptor & descriptor)
{
  const EnvironmentDescriptor & d = descriptor.get();
  RawValue j = to_raw(d);

  RawValue refs = RawValue::object();
  if (d.storage_bucket) {
    refs["storageBucket"] = RawValue{{"name", d.storage_bucket->name}};
  }
  if (d.secrets_location) {
    refs["secretsLocation"] = RawValue{
      {"scheme", d.secrets_location->scheme},
      {"bucket", d.secrets_location->bucket},
      {"key", d.secrets_location->key},
    };
  }
  if (d.certificate) {
    refs["certificate"] = RawValue{
      {"partition", d.certificate->partition},
      {"region", d.certificate->region},
      {"accountId", d.certificate->account_id},
      {"certificateId", d.certificate->certificate_id},
    };
  }
  j["resolvedReferences"] = std::move(refs);
  return j;
}

std::string render(const RawValue & value, DocumentFormat format)
{
  if (format == DocumentFormat::Json) {
    return value.dump(2) + "\n";
  }

  YAML::Emitter out;
  emit_yaml(out, value);
  return std::string(out.c_str()) + "\n";
}

std::string serialize_document(
  const std::vector<ImmutableDescriptor> & descriptors, DocumentFormat format)
{
  RawValue doc = RawValue::object();
  for (const auto & d : descriptors) {
    doc[d.name()] = to_raw(d.get());
  }
  return render(doc, format);
}

std::string serialize(const ImmutableDescriptor & descriptor, DocumentFormat format)
{
  return serialize_document({descriptor}, format);
}

}  // namespace envres
