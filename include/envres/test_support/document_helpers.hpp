// envres/test_support/document_helpers.hpp - helpers for unit/integration tests
//
// Build raw environment blocks and documents from inline JSON text so tests
// can drive each pipeline stage without touching the filesystem.
//
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "envres/loader/document_loader.hpp"

namespace envres::test_support
{

/// A complete, valid environment block (every required field present)
inline constexpr std::string_view k_complete_block = R"({
  "region": "us-east-1",
  "project": "billing-service",
  "runtimeVersion": "nodejs20.x",
  "storageBucketRef": "billing-artifacts-dev",
  "secretsLocationRef": "s3://billing-secrets/dev/secrets.json",
  "resourceLimits": { "memorySizeMB": 512, "timeoutSeconds": 30 }
})";

/// Parse a JSON document; throws when the text does not load
[[nodiscard]] inline RawDocument parse_json(std::string_view text)
{
  DocumentLoadResult r = parse_document(text, DocumentFormat::Json);
  if (!r.success) {
    throw std::runtime_error("test document failed to load: " + r.error);
  }
  return std::move(r.document);
}

/// Wrap a JSON body as a named environment block
[[nodiscard]] inline RawEnvironment raw_env(std::string name, std::string_view body)
{
  RawEnvironment env;
  env.name = std::move(name);
  env.body = RawValue::parse(body);
  return env;
}

/// A complete block with `patch` applied (RFC 7386 merge patch)
[[nodiscard]] inline RawEnvironment complete_env(std::string name, std::string_view patch = "{}")
{
  RawEnvironment env = raw_env(std::move(name), k_complete_block);
  env.body.merge_patch(RawValue::parse(patch));
  return env;
}

}  // namespace envres::test_support
