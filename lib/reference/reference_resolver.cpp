// envres/reference/reference_resolver.cpp - Reference resolution implementation
#include "envres/reference/reference_resolver.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "envres/schema/field_rules.hpp"

namespace envres
{

namespace
{

std::unexpected<ResolveError> malformed(
  std::string_view environment, const char * field, std::string message)
{
  return fail(
    ErrorKind::Reference, codes::k_reference, std::string(environment), field, std::move(message));
}

std::vector<std::string_view> split(std::string_view s, char sep)
{
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    const size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

bool all_digits(std::string_view s)
{
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

Result<SecretsLocation> parse_secrets_location(std::string_view uri, std::string_view environment)
{
  const size_t sep = uri.find("://");
  if (sep == std::string_view::npos) {
    return malformed(
      environment, keys::k_secrets_location_ref,
      fmt::format("'{}' is not of the form <scheme>://<bucket>/<key>", uri));
  }

  const std::string_view scheme = uri.substr(0, sep);
  if (!rules::is_valid_scheme(scheme)) {
    return malformed(
      environment, keys::k_secrets_location_ref,
      fmt::format("'{}' has an invalid scheme '{}'", uri, scheme));
  }

  const std::string_view rest = uri.substr(sep + 3);
  const size_t slash = rest.find('/');
  if (slash == std::string_view::npos) {
    return malformed(
      environment, keys::k_secrets_location_ref, fmt::format("'{}' has no object key", uri));
  }

  const std::string_view bucket = rest.substr(0, slash);
  const std::string_view key = rest.substr(slash + 1);
  if (!rules::is_valid_bucket_name(bucket)) {
    return malformed(
      environment, keys::k_secrets_location_ref,
      fmt::format("'{}' is not a valid bucket name", bucket));
  }
  if (key.empty() || key.front() == '/') {
    return malformed(
      environment, keys::k_secrets_location_ref, fmt::format("'{}' has an empty object key", uri));
  }

  return SecretsLocation{std::string(scheme), std::string(bucket), std::string(key)};
}

Result<CertificateHandle> parse_certificate_ref(std::string_view ref, std::string_view environment)
{
  // arn:<partition>:acm:<region>:<account>:certificate/<id>
  const auto parts = split(ref, ':');
  if (parts.size() != 6 || parts[0] != "arn") {
    return malformed(
      environment, keys::k_certificate_ref,
      fmt::format("'{}' is not a certificate resource identifier", ref));
  }

  const std::string_view partition = parts[1];
  const std::string_view service = parts[2];
  const std::string_view region = parts[3];
  const std::string_view account = parts[4];
  const std::string_view resource = parts[5];

  if (partition.empty() || partition.substr(0, 3) != "aws") {
    return malformed(
      environment, keys::k_certificate_ref, fmt::format("unknown partition '{}'", partition));
  }
  if (service != "acm") {
    return malformed(
      environment, keys::k_certificate_ref,
      fmt::format("'{}' does not identify a certificate (service '{}')", ref, service));
  }
  if (!rules::is_valid_region(region)) {
    return malformed(
      environment, keys::k_certificate_ref, fmt::format("invalid region '{}' in '{}'", region, ref));
  }
  if (account.size() != 12 || !all_digits(account)) {
    return malformed(
      environment, keys::k_certificate_ref,
      fmt::format("account '{}' must be 12 digits", account));
  }

  constexpr std::string_view k_prefix = "certificate/";
  if (resource.substr(0, k_prefix.size()) != k_prefix) {
    return malformed(
      environment, keys::k_certificate_ref,
      fmt::format("resource '{}' must start with 'certificate/'", resource));
  }
  const std::string_view id = resource.substr(k_prefix.size());
  const bool id_ok = !id.empty() && std::all_of(id.begin(), id.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
  });
  if (!id_ok) {
    return malformed(
      environment, keys::k_certificate_ref, fmt::format("invalid certificate id '{}'", id));
  }

  return CertificateHandle{
    std::string(partition), std::string(region), std::string(account), std::string(id)};
}

Result<StorageBucket> parse_storage_bucket(std::string_view name, std::string_view environment)
{
  if (!rules::is_valid_bucket_name(name)) {
    return malformed(
      environment, keys::k_storage_bucket_ref,
      fmt::format("'{}' is not a valid bucket name", name));
  }
  return StorageBucket{std::string(name)};
}

Result<EnvironmentDescriptor> resolve_references(EnvironmentDescriptor d)
{
  auto bucket = parse_storage_bucket(d.storage_bucket_ref, d.name);
  if (!bucket) {
    return std::unexpected(std::move(bucket.error()));
  }

  auto secrets = parse_secrets_location(d.secrets_location_ref, d.name);
  if (!secrets) {
    return std::unexpected(std::move(secrets.error()));
  }

  std::optional<CertificateHandle> certificate;
  if (d.certificate_ref) {
    auto cert = parse_certificate_ref(*d.certificate_ref, d.name);
    if (!cert) {
      return std::unexpected(std::move(cert.error()));
    }
    certificate = std::move(*cert);
  }

  d.storage_bucket = std::move(*bucket);
  d.secrets_location = std::move(*secrets);
  d.certificate = std::move(certificate);
  return d;
}

}  // namespace envres
