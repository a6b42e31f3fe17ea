// test_resolver.cpp - End-to-end tests for the resolution driver
//
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "envres/basic/error.hpp"
#include "envres/driver/resolver.hpp"
#include "envres/test_support/document_helpers.hpp"

namespace fs = std::filesystem;
using envres::test_support::parse_json;

namespace
{

const envres::Diagnostic * find_diag(const envres::DiagnosticBag & bag, const std::string & env)
{
  for (const auto & d : bag) {
    if (d.environment == env) {
      return &d;
    }
  }
  return nullptr;
}

constexpr std::string_view k_base_defaults = R"(
  "defaults": {
    "region": "us-east-1",
    "project": "billing-service",
    "runtimeVersion": "nodejs20.x",
    "resourceLimits": { "memorySizeMB": 512, "timeoutSeconds": 30 },
    "environmentVariables": { "A": "1" }
  })";

std::string document_with(std::string_view environments)
{
  return "{" + std::string(k_base_defaults) + ",\n" + std::string(environments) + "}";
}

constexpr std::string_view k_dev = R"(
  "dev": {
    "storageBucketRef": "billing-dev-artifacts",
    "secretsLocationRef": "s3://billing-dev-secrets/dev/secrets.json",
    "environmentVariables": { "B": "2" }
  })";

// =============================================================================
// Successful resolution
// =============================================================================

TEST(ResolverTest, ResolvesFixtureDocument)
{
  const auto result =
    envres::Resolver::resolve_file(fs::path(ENVRES_FIXTURES_DIR) / "deploy.json", {});

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());

  const std::vector<std::string> expected = {"dev", "staging", "production"};
  EXPECT_EQ(result.registry->names(), expected);

  const auto dev = result.registry->lookup("dev");
  ASSERT_TRUE(dev.has_value());
  EXPECT_EQ(
    (*dev)->environment_variables,
    (envres::StringMap{{"A", "1"}, {"B", "2"}, {"LOG_FORMAT", "json"}}));
  EXPECT_TRUE((*dev)->observability->log_level == envres::LogLevel::Debug);
  EXPECT_EQ((*dev)->observability->tracing_enabled, false);
  EXPECT_EQ((*dev)->extensions.at("alertChannel"), "#billing-dev");

  const auto staging = result.registry->lookup("staging");
  ASSERT_TRUE(staging.has_value());
  EXPECT_EQ((*staging)->region, "eu-west-1");
  EXPECT_EQ((*staging)->build_metadata.at("team"), "payments");

  const auto prod = result.registry->lookup("production");
  ASSERT_TRUE(prod.has_value());
  EXPECT_EQ((*prod)->environment_variables.at("A"), "9");
  EXPECT_EQ((*prod)->resource_limits.timeout_seconds, 60);
  EXPECT_EQ(*(*prod)->excluded_packages, (std::vector<std::string>{"docs/**"}));
  ASSERT_TRUE(prod->certificate().has_value());
  EXPECT_EQ(prod->certificate()->certificate_id, "0a1b2c3d-4e5f-6789-abcd-ef0123456789");
}

TEST(ResolverTest, ResolvedDescriptorsSatisfyInvariants)
{
  const auto result =
    envres::Resolver::resolve_file(fs::path(ENVRES_FIXTURES_DIR) / "deploy.json", {});
  ASSERT_TRUE(result.success);

  const envres::SchemaValidator validator;
  for (const auto & d : result.registry->all()) {
    EXPECT_TRUE(d->references_resolved()) << d.name();
    EXPECT_TRUE(validator.check_invariants(d.get()).has_value()) << d.name();
    EXPECT_FALSE(d->region.empty());
    EXPECT_LE(d->resource_limits.timeout_seconds, envres::k_default_max_timeout_seconds);
  }
}

TEST(ResolverTest, YamlFixtureMatchesJsonSemantics)
{
  const auto result =
    envres::Resolver::resolve_file(fs::path(ENVRES_FIXTURES_DIR) / "deploy.yaml", {});
  ASSERT_TRUE(result.success);

  const auto dev = result.registry->lookup("dev");
  ASSERT_TRUE(dev.has_value());
  EXPECT_EQ((*dev)->environment_variables, (envres::StringMap{{"A", "1"}, {"B", "2"}}));
  EXPECT_EQ((*dev)->keep_warm, false);

  const auto prod = result.registry->lookup("production");
  ASSERT_TRUE(prod.has_value());
  EXPECT_EQ((*prod)->environment_variables, (envres::StringMap{{"A", "9"}}));
  EXPECT_EQ((*prod)->resource_limits.memory_size_mb, 512);
  EXPECT_EQ((*prod)->resource_limits.timeout_seconds, 60);
}

TEST(ResolverTest, ReResolveIsIdempotent)
{
  const auto result =
    envres::Resolver::resolve_file(fs::path(ENVRES_FIXTURES_DIR) / "deploy.json", {});
  ASSERT_TRUE(result.success);

  for (const auto & d : result.registry->all()) {
    const auto again = envres::Resolver::re_resolve(d, {});
    ASSERT_TRUE(again.has_value()) << again.error().describe();
    EXPECT_EQ(*again, d) << d.name();
  }
}

TEST(ResolverTest, ParallelJobsMatchSequential)
{
  envres::ResolveOptions parallel;
  parallel.jobs = 4;

  const fs::path fixture = fs::path(ENVRES_FIXTURES_DIR) / "deploy.json";
  const auto seq = envres::Resolver::resolve_file(fixture, {});
  const auto par = envres::Resolver::resolve_file(fixture, parallel);

  ASSERT_TRUE(seq.success);
  ASSERT_TRUE(par.success);
  EXPECT_EQ(seq.registry->names(), par.registry->names());
  for (const auto & d : seq.registry->all()) {
    const auto other = par.registry->lookup(d.name());
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(*other, d);
  }
}

TEST(ResolverTest, SelectedEnvironmentsOnly)
{
  envres::ResolveOptions opts;
  opts.environments = {"production", "production"};

  const auto result =
    envres::Resolver::resolve_file(fs::path(ENVRES_FIXTURES_DIR) / "deploy.json", opts);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.registry->size(), 1u);
  EXPECT_TRUE(result.registry->lookup("production").has_value());
}

TEST(ResolverTest, EmptyDocumentWarns)
{
  const auto result = envres::Resolver::resolve_document(parse_json("{}"), {});
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.registry->empty());
  EXPECT_TRUE(result.diagnostics.has_warnings());
}

TEST(ResolverTest, DocumentWithoutDefaults)
{
  const auto doc = parse_json(R"({
  "dev": {
    "region": "us-east-1",
    "project": "billing-service",
    "runtimeVersion": "nodejs20.x",
    "storageBucketRef": "billing-dev-artifacts",
    "secretsLocationRef": "s3://billing-dev-secrets/dev/secrets.json",
    "resourceLimits": { "memorySizeMB": 256, "timeoutSeconds": 10 }
  }
})");
  const auto result = envres::Resolver::resolve_document(doc, {});
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.registry->lookup("dev")->get().environment_variables.empty());
}

// =============================================================================
// Failures
// =============================================================================

TEST(ResolverTest, FailuresAreIsolatedPerEnvironment)
{
  const auto result =
    envres::Resolver::resolve_file(fs::path(ENVRES_FIXTURES_DIR) / "invalid.json", {});

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.registry->names(), (std::vector<std::string>{"dev"}));

  const auto * qa = find_diag(result.diagnostics, "qa");
  ASSERT_NE(qa, nullptr);
  EXPECT_EQ(qa->code, envres::codes::k_missing_field);
  EXPECT_EQ(qa->field_path, "region");
  ASSERT_FALSE(qa->notes.empty());
  EXPECT_EQ(qa->notes.front(), "MissingFieldError");

  const auto * prod = find_diag(result.diagnostics, "production");
  ASSERT_NE(prod, nullptr);
  EXPECT_EQ(prod->code, envres::codes::k_range);
  EXPECT_EQ(prod->field_path, "resourceLimits.timeoutSeconds");
  EXPECT_EQ(prod->notes.front(), "ValidationError");
}

TEST(ResolverTest, MissingRegionIsMissingFieldError)
{
  const auto doc = parse_json(R"({
  "defaults": {
    "project": "billing-service",
    "runtimeVersion": "nodejs20.x",
    "storageBucketRef": "billing-artifacts",
    "secretsLocationRef": "s3://billing-secrets/secrets.json",
    "resourceLimits": { "memorySizeMB": 512, "timeoutSeconds": 30 }
  },
  "dev": {}
})");

  const auto r = envres::Resolver::resolve_environment(&*doc.defaults, *doc.find("dev"), {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, envres::ErrorKind::MissingField);
  EXPECT_EQ(r.error().field_path, "region");
}

TEST(ResolverTest, DomainWithoutCertificateIsValidationError)
{
  const auto doc = parse_json(document_with(R"(
  "production": {
    "storageBucketRef": "billing-prod-artifacts",
    "secretsLocationRef": "s3://billing-prod-secrets/prod/secrets.json",
    "domain": "billing.example.com"
  })"));

  const auto r =
    envres::Resolver::resolve_environment(&*doc.defaults, *doc.find("production"), {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, envres::ErrorKind::Validation);
  EXPECT_EQ(r.error().code, envres::codes::k_cross_field);
}

TEST(ResolverTest, CertificateFromDefaultsSatisfiesDomain)
{
  const auto doc = parse_json(R"({
  "defaults": {
    "region": "us-east-1",
    "project": "billing-service",
    "runtimeVersion": "nodejs20.x",
    "resourceLimits": { "memorySizeMB": 512, "timeoutSeconds": 30 },
    "certificateRef": "arn:aws:acm:us-east-1:123456789012:certificate/shared"
  },
  "production": {
    "storageBucketRef": "billing-prod-artifacts",
    "secretsLocationRef": "s3://billing-prod-secrets/prod/secrets.json",
    "domain": "billing.example.com"
  }
})");

  const auto result = envres::Resolver::resolve_document(doc, {});
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.registry->lookup("production")->certificate()->certificate_id, "shared");
}

TEST(ResolverTest, TimeoutAboveCeilingIsValidationError)
{
  const auto doc = parse_json(document_with(R"(
  "production": {
    "storageBucketRef": "billing-prod-artifacts",
    "secretsLocationRef": "s3://billing-prod-secrets/prod/secrets.json",
    "resourceLimits": { "timeoutSeconds": 901 }
  })"));

  const auto r =
    envres::Resolver::resolve_environment(&*doc.defaults, *doc.find("production"), {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, envres::ErrorKind::Validation);
  EXPECT_EQ(r.error().code, envres::codes::k_range);
}

TEST(ResolverTest, MaxTimeoutOptionApplies)
{
  envres::ResolveOptions opts;
  opts.max_timeout_seconds = 45;

  const auto doc = parse_json(document_with(R"(
  "dev": {
    "storageBucketRef": "billing-dev-artifacts",
    "secretsLocationRef": "s3://billing-dev-secrets/dev/secrets.json",
    "resourceLimits": { "timeoutSeconds": 60 }
  })"));
  const auto result = envres::Resolver::resolve_document(doc, opts);
  EXPECT_FALSE(result.success);
  const auto * dev = find_diag(result.diagnostics, "dev");
  ASSERT_NE(dev, nullptr);
  EXPECT_EQ(dev->code, envres::codes::k_range);
}

TEST(ResolverTest, MalformedSecretsLocationIsReferenceError)
{
  const auto doc = parse_json(document_with(R"(
  "dev": {
    "storageBucketRef": "billing-dev-artifacts",
    "secretsLocationRef": "not-a-uri"
  })"));

  const auto r = envres::Resolver::resolve_environment(&*doc.defaults, *doc.find("dev"), {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, envres::ErrorKind::Reference);
  EXPECT_EQ(r.error().field_path, "secretsLocationRef");
}

TEST(ResolverTest, DuplicateEnvironmentKeepsFirst)
{
  const auto doc = parse_json(document_with(R"(
  "dev": {
    "region": "us-west-2",
    "storageBucketRef": "billing-dev-artifacts",
    "secretsLocationRef": "s3://billing-dev-secrets/dev/secrets.json"
  },
  "dev": {
    "region": "eu-west-1",
    "storageBucketRef": "billing-dev-artifacts",
    "secretsLocationRef": "s3://billing-dev-secrets/dev/secrets.json"
  })"));

  for (unsigned jobs : {1u, 4u}) {
    envres::ResolveOptions opts;
    opts.jobs = jobs;
    const auto result = envres::Resolver::resolve_document(doc, opts);

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.registry->size(), 1u);
    EXPECT_EQ(result.registry->lookup("dev")->get().region, "us-west-2");

    const auto * dup = find_diag(result.diagnostics, "dev");
    ASSERT_NE(dup, nullptr);
    EXPECT_EQ(dup->code, envres::codes::k_duplicate_name);
    EXPECT_EQ(dup->notes.front(), "DuplicateNameError");
  }
}

TEST(ResolverTest, DuplicateKeyInsideBlockIsValidationError)
{
  const auto doc = parse_json(document_with(R"(
  "dev": {
    "storageBucketRef": "billing-dev-artifacts",
    "secretsLocationRef": "s3://billing-dev-secrets/dev/secrets.json",
    "environmentVariables": { "B": "2", "B": "3" }
  })"));

  const auto r = envres::Resolver::resolve_environment(&*doc.defaults, *doc.find("dev"), {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, envres::codes::k_duplicate_key);
  EXPECT_EQ(r.error().field_path, "environmentVariables.B");
}

TEST(ResolverTest, UnknownRequestedEnvironmentIsNotFound)
{
  envres::ResolveOptions opts;
  opts.environments = {"dev", "qa"};

  const auto result = envres::Resolver::resolve_document(parse_json(document_with(k_dev)), opts);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.registry->lookup("dev").has_value());

  const auto * qa = find_diag(result.diagnostics, "qa");
  ASSERT_NE(qa, nullptr);
  EXPECT_EQ(qa->code, envres::codes::k_not_found);
  ASSERT_TRUE(qa->help_message.has_value());
  EXPECT_EQ(*qa->help_message, "declared environments: dev");
}

TEST(ResolverTest, InvalidDefaultsFailTheRun)
{
  const auto doc = parse_json(R"({
  "defaults": { "region": "nowhere" },
  "dev": {}
})");

  const auto result = envres::Resolver::resolve_document(doc, {});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.registry->empty());
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics.all().front().environment, "defaults");
  EXPECT_EQ(result.diagnostics.all().front().code, envres::codes::k_malformed);
}

TEST(ResolverTest, UnreadableFileIsLoadError)
{
  const auto result = envres::Resolver::resolve_file("/nonexistent/envres/deploy.json", {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics.all().front().code, envres::codes::k_load);
  EXPECT_TRUE(result.registry->empty());
}

}  // namespace
