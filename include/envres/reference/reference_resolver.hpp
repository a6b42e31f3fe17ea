// envres/reference/reference_resolver.hpp - Location-style field resolution
//
// Resolves the shape of reference fields into typed handles. Nothing is
// fetched: the secrets bundle and the certificate are only located.
//
#pragma once

#include <string_view>

#include "envres/basic/error.hpp"
#include "envres/model/descriptor.hpp"

namespace envres
{

/**
 * Parse `<scheme>://<bucket>/<key>`.
 *
 * The scheme is [a-z][a-z0-9+.-]*, the bucket must be a valid bucket name and
 * the key must be non-empty. The key may contain further '/' separators.
 *
 * @param environment Used for error reporting only
 */
[[nodiscard]] Result<SecretsLocation> parse_secrets_location(
  std::string_view uri, std::string_view environment = {});

/**
 * Parse `arn:<partition>:acm:<region>:<account>:certificate/<id>`.
 *
 * The account is 12 digits, the region follows the region-code pattern and the
 * id is a non-empty run of [A-Za-z0-9-].
 */
[[nodiscard]] Result<CertificateHandle> parse_certificate_ref(
  std::string_view ref, std::string_view environment = {});

[[nodiscard]] Result<StorageBucket> parse_storage_bucket(
  std::string_view name, std::string_view environment = {});

/**
 * Resolve every reference field of a merged descriptor.
 *
 * The returned descriptor equals the input with storage_bucket,
 * secrets_location and (when certificateRef is set) certificate filled in.
 * Resolving an already-resolved descriptor yields the same descriptor.
 */
[[nodiscard]] Result<EnvironmentDescriptor> resolve_references(EnvironmentDescriptor descriptor);

}  // namespace envres
