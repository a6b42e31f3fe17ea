// envres/schema/schema_validator.cpp - Schema validation implementation
#include "envres/schema/schema_validator.hpp"

#include <fmt/core.h>

#include <array>
#include <limits>
#include <string>
#include <string_view>

#include "envres/schema/field_rules.hpp"

namespace envres
{

namespace
{

enum class FieldType {
  String,
  Integer,
  Boolean,
  Object,
  StringList,
  StringMap,
};

struct FieldSpec
{
  const char * key;
  FieldType type;
};

constexpr std::array<FieldSpec, 14> k_top_level_fields{{
  {keys::k_region, FieldType::String},
  {keys::k_project, FieldType::String},
  {keys::k_runtime_version, FieldType::String},
  {keys::k_storage_bucket_ref, FieldType::String},
  {keys::k_secrets_location_ref, FieldType::String},
  {keys::k_domain, FieldType::String},
  {keys::k_certificate_ref, FieldType::String},
  {keys::k_environment_variables, FieldType::StringMap},
  {keys::k_network, FieldType::Object},
  {keys::k_resource_limits, FieldType::Object},
  {keys::k_observability, FieldType::Object},
  {keys::k_keep_warm, FieldType::Boolean},
  {keys::k_excluded_packages, FieldType::StringList},
  {keys::k_build_metadata, FieldType::StringMap},
}};

constexpr std::array<FieldSpec, 2> k_network_fields{{
  {keys::k_subnet_ids, FieldType::StringList},
  {keys::k_security_group_ids, FieldType::StringList},
}};

constexpr std::array<FieldSpec, 2> k_resource_limit_fields{{
  {keys::k_memory_size_mb, FieldType::Integer},
  {keys::k_timeout_seconds, FieldType::Integer},
}};

constexpr std::array<FieldSpec, 2> k_observability_fields{{
  {keys::k_log_level, FieldType::String},
  {keys::k_tracing_enabled, FieldType::Boolean},
}};

constexpr std::array<const char *, 5> k_required_fields{{
  keys::k_region,
  keys::k_project,
  keys::k_runtime_version,
  keys::k_storage_bucket_ref,
  keys::k_secrets_location_ref,
}};

constexpr std::array<const char *, 2> k_required_limits{{
  keys::k_memory_size_mb,
  keys::k_timeout_seconds,
}};

std::string join_path(std::string_view base, std::string_view key)
{
  if (base.empty()) {
    return std::string(key);
  }
  return fmt::format("{}.{}", base, key);
}

const char * type_name(FieldType type)
{
  switch (type) {
    case FieldType::String:
      return "string";
    case FieldType::Integer:
      return "integer";
    case FieldType::Boolean:
      return "boolean";
    case FieldType::Object:
      return "object";
    case FieldType::StringList:
      return "list of strings";
    case FieldType::StringMap:
      return "map of strings";
  }
  return "value";
}

bool is_known_top_level(std::string_view key)
{
  for (const auto & f : k_top_level_fields) {
    if (key == f.key) {
      return true;
    }
  }
  return false;
}

int64_t as_int64(const RawValue & v)
{
  if (v.is_number_unsigned()) {
    const auto u = v.get<uint64_t>();
    constexpr auto k_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return u > k_max ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(u);
  }
  return v.get<int64_t>();
}

std::vector<std::string> as_string_list(const RawValue & v)
{
  std::vector<std::string> out;
  out.reserve(v.size());
  for (const auto & item : v) {
    out.push_back(item.get<std::string>());
  }
  return out;
}

StringMap as_string_map(const RawValue & v)
{
  StringMap out;
  for (const auto & item : v.items()) {
    out[item.key()] = item.value().get<std::string>();
  }
  return out;
}

const RawValue * find_field(const RawValue & obj, const char * key)
{
  if (!obj.is_object()) {
    return nullptr;
  }
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &*it;
}

/**
 * Runs the ordered checks over one raw block.
 */
class BlockChecker
{
public:
  BlockChecker(const RawEnvironment & raw, const ValidationOptions & options)
  : raw_(raw), body_(raw.body), options_(options)
  {
  }

  Result<void> check_required() const
  {
    for (const char * key : k_required_fields) {
      if (find_field(body_, key) == nullptr) {
        return error(codes::k_required, key, fmt::format("required field '{}' is missing", key));
      }
    }

    const RawValue * limits = find_field(body_, keys::k_resource_limits);
    if (limits != nullptr && !limits->is_object()) {
      return {};  // reported as a type error by check_types()
    }
    for (const char * key : k_required_limits) {
      const std::string path = join_path(keys::k_resource_limits, key);
      if (limits == nullptr || find_field(*limits, key) == nullptr) {
        return error(codes::k_required, path, fmt::format("required field '{}' is missing", path));
      }
    }
    return {};
  }

  Result<void> check_types() const
  {
    for (const auto & spec : k_top_level_fields) {
      if (const RawValue * v = find_field(body_, spec.key)) {
        if (auto r = check_type(*v, spec.type, spec.key); !r) {
          return r;
        }
      }
    }

    if (auto r = check_nested(keys::k_network, k_network_fields); !r) {
      return r;
    }
    if (auto r = check_nested(keys::k_resource_limits, k_resource_limit_fields); !r) {
      return r;
    }
    return check_nested(keys::k_observability, k_observability_fields);
  }

  Result<void> check_values() const
  {
    if (const RawValue * v = find_field(body_, keys::k_region)) {
      const auto & region = v->get_ref<const std::string &>();
      if (!rules::is_valid_region(region)) {
        return error(
          codes::k_malformed, keys::k_region, fmt::format("'{}' is not a known region code", region));
      }
    }

    for (const char * key : {keys::k_project, keys::k_runtime_version}) {
      if (const RawValue * v = find_field(body_, key)) {
        if (v->get_ref<const std::string &>().empty()) {
          return error(codes::k_malformed, key, fmt::format("'{}' must not be empty", key));
        }
      }
    }

    if (const RawValue * v = find_field(body_, keys::k_domain)) {
      const auto & domain = v->get_ref<const std::string &>();
      if (!rules::is_valid_hostname(domain)) {
        return error(
          codes::k_malformed, keys::k_domain,
          fmt::format("'{}' is not a valid fully-qualified hostname", domain));
      }
    }

    for (const char * key : {keys::k_environment_variables, keys::k_build_metadata}) {
      if (const RawValue * v = find_field(body_, key)) {
        for (const auto & item : v->items()) {
          if (item.key().empty()) {
            return error(codes::k_malformed, key, "keys must not be empty");
          }
        }
      }
    }

    if (const RawValue * v = find_field(body_, keys::k_excluded_packages)) {
      for (size_t i = 0; i < v->size(); ++i) {
        if ((*v)[i].get_ref<const std::string &>().empty()) {
          return error(
            codes::k_malformed, fmt::format("{}[{}]", keys::k_excluded_packages, i),
            "pattern must not be empty");
        }
      }
    }

    if (const RawValue * net = find_field(body_, keys::k_network)) {
      if (auto r = check_id_list(*net, keys::k_subnet_ids, rules::is_valid_subnet_id, "subnet"); !r) {
        return r;
      }
      if (auto r = check_id_list(
            *net, keys::k_security_group_ids, rules::is_valid_security_group_id, "security group");
          !r) {
        return r;
      }
    }

    if (const RawValue * limits = find_field(body_, keys::k_resource_limits)) {
      if (const RawValue * mem = find_field(*limits, keys::k_memory_size_mb)) {
        const int64_t value = as_int64(*mem);
        if (value <= 0) {
          return error(
            codes::k_range, join_path(keys::k_resource_limits, keys::k_memory_size_mb),
            fmt::format("memorySizeMB must be greater than 0 (got {})", value));
        }
      }
      if (const RawValue * timeout = find_field(*limits, keys::k_timeout_seconds)) {
        const int64_t value = as_int64(*timeout);
        if (value <= 0 || value > options_.max_timeout_seconds) {
          return error(
            codes::k_range, join_path(keys::k_resource_limits, keys::k_timeout_seconds),
            fmt::format(
              "timeoutSeconds must be in 1..{} (got {})", options_.max_timeout_seconds, value));
        }
      }
    }

    if (const RawValue * obs = find_field(body_, keys::k_observability)) {
      if (const RawValue * level = find_field(*obs, keys::k_log_level)) {
        const auto & text = level->get_ref<const std::string &>();
        if (!parse_log_level(text)) {
          return error(
            codes::k_malformed, join_path(keys::k_observability, keys::k_log_level),
            fmt::format("'{}' is not one of DEBUG, INFO, WARN, ERROR", text));
        }
      }
    }

    return {};
  }

  Result<void> check_cross_field() const
  {
    if (find_field(body_, keys::k_domain) != nullptr &&
        find_field(body_, keys::k_certificate_ref) == nullptr) {
      return error(
        codes::k_cross_field, keys::k_certificate_ref,
        "certificateRef is required when domain is set");
    }
    return {};
  }

  Result<void> check_unique_keys() const
  {
    if (!raw_.duplicate_keys.empty()) {
      const std::string & path = raw_.duplicate_keys.front();
      return error(codes::k_duplicate_key, path, fmt::format("duplicate key '{}'", path));
    }
    return {};
  }

  EnvironmentOverlay build() const
  {
    EnvironmentOverlay o;
    o.name = raw_.name;

    auto str = [&](const char * key) -> std::optional<std::string> {
      if (const RawValue * v = find_field(body_, key)) {
        return v->get<std::string>();
      }
      return std::nullopt;
    };

    o.region = str(keys::k_region);
    o.project = str(keys::k_project);
    o.runtime_version = str(keys::k_runtime_version);
    o.storage_bucket_ref = str(keys::k_storage_bucket_ref);
    o.secrets_location_ref = str(keys::k_secrets_location_ref);
    o.domain = str(keys::k_domain);
    o.certificate_ref = str(keys::k_certificate_ref);

    if (const RawValue * v = find_field(body_, keys::k_environment_variables)) {
      o.environment_variables = as_string_map(*v);
    }
    if (const RawValue * v = find_field(body_, keys::k_build_metadata)) {
      o.build_metadata = as_string_map(*v);
    }
    if (const RawValue * v = find_field(body_, keys::k_excluded_packages)) {
      o.excluded_packages = as_string_list(*v);
    }
    if (const RawValue * v = find_field(body_, keys::k_keep_warm)) {
      o.keep_warm = v->get<bool>();
    }

    if (const RawValue * net = find_field(body_, keys::k_network)) {
      NetworkConfig n;
      if (const RawValue * v = find_field(*net, keys::k_subnet_ids)) {
        n.subnet_ids = as_string_list(*v);
      }
      if (const RawValue * v = find_field(*net, keys::k_security_group_ids)) {
        n.security_group_ids = as_string_list(*v);
      }
      o.network = std::move(n);
    }

    if (const RawValue * limits = find_field(body_, keys::k_resource_limits)) {
      ResourceLimitsOverlay l;
      if (const RawValue * v = find_field(*limits, keys::k_memory_size_mb)) {
        l.memory_size_mb = as_int64(*v);
      }
      if (const RawValue * v = find_field(*limits, keys::k_timeout_seconds)) {
        l.timeout_seconds = as_int64(*v);
      }
      o.resource_limits = l;
    }

    if (const RawValue * obs = find_field(body_, keys::k_observability)) {
      ObservabilityConfig c;
      if (const RawValue * v = find_field(*obs, keys::k_log_level)) {
        c.log_level = parse_log_level(v->get_ref<const std::string &>());
      }
      if (const RawValue * v = find_field(*obs, keys::k_tracing_enabled)) {
        c.tracing_enabled = v->get<bool>();
      }
      o.observability = c;
    }

    for (const auto & item : body_.items()) {
      if (!is_known_top_level(item.key())) {
        o.extensions[item.key()] = item.value();
      }
    }

    return o;
  }

private:
  std::unexpected<ResolveError> error(
    const char * code, const std::string & path, std::string message) const
  {
    return fail(ErrorKind::Validation, code, raw_.name, path, std::move(message));
  }

  Result<void> check_type(const RawValue & v, FieldType type, const std::string & path) const
  {
    auto mismatch = [&]() {
      return error(
        codes::k_type, path, fmt::format("expected {}, got {}", type_name(type), v.type_name()));
    };

    switch (type) {
      case FieldType::String:
        if (!v.is_string()) return mismatch();
        break;
      case FieldType::Integer:
        if (!v.is_number_integer()) return mismatch();
        break;
      case FieldType::Boolean:
        if (!v.is_boolean()) return mismatch();
        break;
      case FieldType::Object:
        if (!v.is_object()) return mismatch();
        break;
      case FieldType::StringList:
        if (!v.is_array()) return mismatch();
        for (size_t i = 0; i < v.size(); ++i) {
          if (!v[i].is_string()) {
            return error(
              codes::k_type, fmt::format("{}[{}]", path, i),
              fmt::format("expected string, got {}", v[i].type_name()));
          }
        }
        break;
      case FieldType::StringMap:
        if (!v.is_object()) return mismatch();
        for (const auto & item : v.items()) {
          if (!item.value().is_string()) {
            return error(
              codes::k_type, join_path(path, item.key()),
              fmt::format("expected string, got {}", item.value().type_name()));
          }
        }
        break;
    }
    return {};
  }

  template <size_t N>
  Result<void> check_nested(const char * parent, const std::array<FieldSpec, N> & fields) const
  {
    const RawValue * obj = find_field(body_, parent);
    if (obj == nullptr) {
      return {};
    }

    for (const auto & item : obj->items()) {
      bool known = false;
      for (const auto & f : fields) {
        known = known || item.key() == f.key;
      }
      if (!known) {
        return error(
          codes::k_malformed, join_path(parent, item.key()),
          fmt::format("unknown field '{}' in '{}'", item.key(), parent));
      }
    }

    for (const auto & spec : fields) {
      if (const RawValue * v = find_field(*obj, spec.key)) {
        if (auto r = check_type(*v, spec.type, join_path(parent, spec.key)); !r) {
          return r;
        }
      }
    }
    return {};
  }

  using IdPredicate = bool (*)(std::string_view);

  Result<void> check_id_list(
    const RawValue & network, const char * key, IdPredicate is_valid, const char * what) const
  {
    const RawValue * ids = find_field(network, key);
    if (ids == nullptr) {
      return {};
    }
    const std::string path = join_path(keys::k_network, key);
    if (ids->empty()) {
      return error(codes::k_range, path, fmt::format("{} must contain at least one id", key));
    }
    for (size_t i = 0; i < ids->size(); ++i) {
      const auto & id = (*ids)[i].get_ref<const std::string &>();
      if (!is_valid(id)) {
        return error(
          codes::k_malformed, fmt::format("{}[{}]", path, i),
          fmt::format("'{}' is not a well-formed {} id", id, what));
      }
    }
    return {};
  }

  const RawEnvironment & raw_;
  const RawValue & body_;
  const ValidationOptions & options_;
};

}  // namespace

Result<EnvironmentOverlay> SchemaValidator::validate(const RawEnvironment & raw) const
{
  if (!raw.body.is_object()) {
    return fail(
      ErrorKind::Validation, codes::k_type, raw.name, "",
      fmt::format("environment block must be an object, got {}", raw.body.type_name()));
  }

  const BlockChecker checker(raw, options_);

  if (options_.mode == ValidationMode::Complete) {
    if (auto r = checker.check_required(); !r) {
      return std::unexpected(std::move(r.error()));
    }
  }
  if (auto r = checker.check_types(); !r) {
    return std::unexpected(std::move(r.error()));
  }
  if (auto r = checker.check_values(); !r) {
    return std::unexpected(std::move(r.error()));
  }
  if (options_.mode == ValidationMode::Complete) {
    if (auto r = checker.check_cross_field(); !r) {
      return std::unexpected(std::move(r.error()));
    }
  }
  if (auto r = checker.check_unique_keys(); !r) {
    return std::unexpected(std::move(r.error()));
  }

  return checker.build();
}

Result<void> SchemaValidator::check_invariants(const EnvironmentDescriptor & d) const
{
  if (d.domain && !d.certificate_ref) {
    return fail(
      ErrorKind::Validation, codes::k_cross_field, d.name, keys::k_certificate_ref,
      "certificateRef is required when domain is set");
  }

  const auto & limits = d.resource_limits;
  if (limits.memory_size_mb <= 0) {
    return fail(
      ErrorKind::Validation, codes::k_range, d.name,
      join_path(keys::k_resource_limits, keys::k_memory_size_mb),
      fmt::format("memorySizeMB must be greater than 0 (got {})", limits.memory_size_mb));
  }
  if (limits.timeout_seconds <= 0 || limits.timeout_seconds > options_.max_timeout_seconds) {
    return fail(
      ErrorKind::Validation, codes::k_range, d.name,
      join_path(keys::k_resource_limits, keys::k_timeout_seconds),
      fmt::format(
        "timeoutSeconds must be in 1..{} (got {})", options_.max_timeout_seconds,
        limits.timeout_seconds));
  }

  for (const auto & [key, value] : d.environment_variables) {
    if (key.empty()) {
      return fail(
        ErrorKind::Validation, codes::k_malformed, d.name, keys::k_environment_variables,
        "keys must not be empty");
    }
  }

  return {};
}

}  // namespace envres
