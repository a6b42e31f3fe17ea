// test_environment_registry.cpp - Tests for the named environment registry
//
#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "envres/basic/error.hpp"
#include "envres/registry/environment_registry.hpp"

namespace
{

envres::ImmutableDescriptor make(const std::string & name, const std::string & region)
{
  envres::EnvironmentDescriptor d;
  d.name = name;
  d.region = region;
  d.project = "billing-service";
  d.runtime_version = "nodejs20.x";
  d.storage_bucket_ref = "billing-artifacts";
  d.secrets_location_ref = "s3://billing-secrets/secrets.json";
  d.resource_limits = {512, 30};
  return envres::emit(std::move(d));
}

TEST(EnvironmentRegistryTest, RegisterAndLookup)
{
  envres::EnvironmentRegistry registry;
  ASSERT_TRUE(registry.register_descriptor(make("dev", "us-east-1")).has_value());

  const auto found = registry.lookup("dev");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->name(), "dev");
  EXPECT_EQ((*found)->region, "us-east-1");
  EXPECT_TRUE(registry.contains("dev"));
  EXPECT_EQ(registry.size(), 1u);
}

TEST(EnvironmentRegistryTest, DuplicateNameKeepsFirst)
{
  envres::EnvironmentRegistry registry;
  ASSERT_TRUE(registry.register_descriptor(make("dev", "us-east-1")).has_value());

  const auto second = registry.register_descriptor(make("dev", "eu-west-1"));
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().kind, envres::ErrorKind::DuplicateName);
  EXPECT_EQ(second.error().code, envres::codes::k_duplicate_name);
  EXPECT_EQ(second.error().environment, "dev");

  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.lookup("dev")->get().region, "us-east-1");
}

TEST(EnvironmentRegistryTest, UnknownNameIsNotFound)
{
  envres::EnvironmentRegistry registry;
  const auto r = registry.lookup("staging");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, envres::ErrorKind::NotFound);
  EXPECT_EQ(r.error().code, envres::codes::k_not_found);
  EXPECT_FALSE(registry.contains("staging"));
}

TEST(EnvironmentRegistryTest, KeepsRegistrationOrder)
{
  envres::EnvironmentRegistry registry;
  for (const char * name : {"production", "dev", "staging"}) {
    ASSERT_TRUE(registry.register_descriptor(make(name, "us-east-1")).has_value());
  }

  const std::vector<std::string> expected = {"production", "dev", "staging"};
  EXPECT_EQ(registry.names(), expected);

  const auto all = registry.all();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[1].name(), "dev");
}

TEST(EnvironmentRegistryTest, LookupSharesState)
{
  envres::EnvironmentRegistry registry;
  ASSERT_TRUE(registry.register_descriptor(make("dev", "us-east-1")).has_value());

  const auto a = registry.lookup("dev");
  const auto b = registry.lookup("dev");
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(&a->get(), &b->get());
}

TEST(EnvironmentRegistryTest, ConcurrentRegistrationAdmitsOneWinner)
{
  envres::EnvironmentRegistry registry;
  std::vector<std::thread> threads;
  std::vector<int> accepted(8, 0);

  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&registry, &accepted, i]() {
      accepted[i] = registry.register_descriptor(make("dev", "us-east-1")).has_value() ? 1 : 0;
      (void)registry.lookup("dev");
    });
  }
  for (auto & t : threads) {
    t.join();
  }

  int winners = 0;
  for (int a : accepted) {
    winners += a;
  }
  EXPECT_EQ(winners, 1);
  EXPECT_EQ(registry.size(), 1u);
}

}  // namespace
