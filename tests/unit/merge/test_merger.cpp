// test_merger.cpp - Tests for the defaults/override merge
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "envres/basic/error.hpp"
#include "envres/merge/merger.hpp"

namespace
{

envres::EnvironmentOverlay full_defaults()
{
  envres::EnvironmentOverlay d;
  d.name = "defaults";
  d.region = "us-east-1";
  d.project = "billing-service";
  d.runtime_version = "nodejs20.x";
  d.storage_bucket_ref = "billing-artifacts";
  d.secrets_location_ref = "s3://billing-secrets/secrets.json";
  d.resource_limits = envres::ResourceLimitsOverlay{512, 30};
  return d;
}

envres::EnvironmentOverlay named(const std::string & name)
{
  envres::EnvironmentOverlay o;
  o.name = name;
  return o;
}

TEST(MergerTest, OverrideWinsForScalars)
{
  auto over = named("staging");
  over.region = "eu-west-1";

  const auto r = envres::merge(full_defaults(), over);
  ASSERT_TRUE(r.has_value()) << r.error().describe();
  EXPECT_EQ(r->name, "staging");
  EXPECT_EQ(r->region, "eu-west-1");
  EXPECT_EQ(r->project, "billing-service");
}

TEST(MergerTest, EnvironmentVariablesUnionWithOverrideWinning)
{
  auto defaults = full_defaults();
  defaults.environment_variables = envres::StringMap{{"A", "1"}};

  auto dev = named("dev");
  dev.environment_variables = envres::StringMap{{"B", "2"}};
  const auto merged_dev = envres::merge(defaults, dev);
  ASSERT_TRUE(merged_dev.has_value());
  EXPECT_EQ(merged_dev->environment_variables, (envres::StringMap{{"A", "1"}, {"B", "2"}}));

  auto prod = named("production");
  prod.environment_variables = envres::StringMap{{"A", "9"}};
  const auto merged_prod = envres::merge(defaults, prod);
  ASSERT_TRUE(merged_prod.has_value());
  EXPECT_EQ(merged_prod->environment_variables, (envres::StringMap{{"A", "9"}}));
}

TEST(MergerTest, AbsentMapsMergeToEmpty)
{
  const auto r = envres::merge(full_defaults(), named("dev"));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->environment_variables.empty());
  EXPECT_TRUE(r->build_metadata.empty());
}

TEST(MergerTest, SequencesReplaceWholesale)
{
  auto defaults = full_defaults();
  defaults.excluded_packages = std::vector<std::string>{"aws-sdk/**", "test/**"};

  auto prod = named("production");
  prod.excluded_packages = std::vector<std::string>{"docs/**"};

  const auto r = envres::merge(defaults, prod);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->excluded_packages.has_value());
  EXPECT_EQ(*r->excluded_packages, (std::vector<std::string>{"docs/**"}));

  const auto inherited = envres::merge(defaults, named("dev"));
  ASSERT_TRUE(inherited.has_value());
  EXPECT_EQ(inherited->excluded_packages->size(), 2u);
}

TEST(MergerTest, NestedStructsMergeFieldWise)
{
  auto defaults = full_defaults();
  defaults.observability = envres::ObservabilityConfig{envres::LogLevel::Info, false};
  defaults.network = envres::NetworkConfig{std::vector<std::string>{"subnet-0a1b2c3d"}, std::nullopt};

  auto dev = named("dev");
  dev.observability = envres::ObservabilityConfig{envres::LogLevel::Debug, std::nullopt};
  dev.network = envres::NetworkConfig{std::nullopt, std::vector<std::string>{"sg-12345678"}};
  dev.resource_limits = envres::ResourceLimitsOverlay{std::nullopt, 60};

  const auto r = envres::merge(defaults, dev);
  ASSERT_TRUE(r.has_value()) << r.error().describe();

  ASSERT_TRUE(r->observability.has_value());
  EXPECT_TRUE(r->observability->log_level == envres::LogLevel::Debug);
  EXPECT_EQ(r->observability->tracing_enabled, false);

  ASSERT_TRUE(r->network.has_value());
  EXPECT_EQ(r->network->subnet_ids->front(), "subnet-0a1b2c3d");
  EXPECT_EQ(r->network->security_group_ids->front(), "sg-12345678");

  EXPECT_EQ(r->resource_limits.memory_size_mb, 512);
  EXPECT_EQ(r->resource_limits.timeout_seconds, 60);
}

TEST(MergerTest, ExtensionsMergeKeyWise)
{
  auto defaults = full_defaults();
  defaults.extensions["alertChannel"] = "#ops";
  defaults.extensions["owner"] = "payments";

  auto dev = named("dev");
  dev.extensions["alertChannel"] = "#billing-dev";

  const auto r = envres::merge(defaults, dev);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->extensions.at("alertChannel"), "#billing-dev");
  EXPECT_EQ(r->extensions.at("owner"), "payments");
}

TEST(MergerTest, MissingRegionIsMissingFieldError)
{
  auto defaults = full_defaults();
  defaults.region.reset();

  const auto r = envres::merge(defaults, named("qa"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, envres::ErrorKind::MissingField);
  EXPECT_EQ(r.error().code, envres::codes::k_missing_field);
  EXPECT_EQ(r.error().environment, "qa");
  EXPECT_EQ(r.error().field_path, "region");
}

TEST(MergerTest, RegionFromOverrideSatisfiesRequirement)
{
  auto defaults = full_defaults();
  defaults.region.reset();
  auto dev = named("dev");
  dev.region = "us-west-2";

  const auto r = envres::merge(defaults, dev);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->region, "us-west-2");
}

TEST(MergerTest, MissingLimitIsMissingFieldError)
{
  auto defaults = full_defaults();
  defaults.resource_limits = envres::ResourceLimitsOverlay{512, std::nullopt};

  const auto r = envres::merge(defaults, named("dev"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, envres::ErrorKind::MissingField);
  EXPECT_EQ(r.error().field_path, "resourceLimits.timeoutSeconds");
}

TEST(MergerTest, EmptyDefaultsNeedCompleteOverride)
{
  const auto r = envres::merge(named("defaults"), named("dev"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().field_path, "region");
}

TEST(MergerTest, OptionalFieldsStayUnsetWithoutDefaults)
{
  const auto r = envres::merge(full_defaults(), named("dev"));
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->domain.has_value());
  EXPECT_FALSE(r->certificate_ref.has_value());
  EXPECT_FALSE(r->keep_warm.has_value());
  EXPECT_FALSE(r->observability.has_value());
  EXPECT_FALSE(r->network.has_value());
  EXPECT_FALSE(r->references_resolved());
}

TEST(MergerTest, ToOverlayMergesBackToSameDescriptor)
{
  auto defaults = full_defaults();
  defaults.environment_variables = envres::StringMap{{"A", "1"}};
  auto prod = named("production");
  prod.domain = "billing.example.com";
  prod.certificate_ref = "arn:aws:acm:us-east-1:123456789012:certificate/abc";
  prod.keep_warm = true;

  const auto merged = envres::merge(defaults, prod);
  ASSERT_TRUE(merged.has_value());

  const auto again = envres::merge(named("defaults"), envres::to_overlay(*merged));
  ASSERT_TRUE(again.has_value()) << again.error().describe();
  EXPECT_EQ(*again, *merged);
}

}  // namespace
