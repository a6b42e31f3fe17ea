// test_diagnostic.cpp - Tests for DiagnosticBag and ResolveError conversion
//
#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "envres/basic/diagnostic.hpp"
#include "envres/basic/error.hpp"

namespace
{

TEST(DiagnosticBagTest, BuilderRegistersOnDestruction)
{
  envres::DiagnosticBag bag;
  {
    auto builder = bag.report_error("dev", "bad value");
    builder.with_code("E0103").with_field("resourceLimits.timeoutSeconds");
    EXPECT_TRUE(bag.empty());
  }

  ASSERT_EQ(bag.size(), 1u);
  const auto & d = bag.all().front();
  EXPECT_EQ(d.severity, envres::Severity::Error);
  EXPECT_EQ(d.code, "E0103");
  EXPECT_EQ(d.environment, "dev");
  EXPECT_EQ(d.field_path, "resourceLimits.timeoutSeconds");
  EXPECT_EQ(d.location(), "dev.resourceLimits.timeoutSeconds");
}

TEST(DiagnosticBagTest, MovedBuilderRegistersOnce)
{
  envres::DiagnosticBag bag;
  {
    auto first = bag.report_warning("", "empty document");
    auto second = std::move(first);
    second.with_note("nothing to resolve");
  }

  ASSERT_EQ(bag.size(), 1u);
  EXPECT_EQ(bag.all().front().notes.size(), 1u);
}

TEST(DiagnosticBagTest, SeverityQueries)
{
  envres::DiagnosticBag bag;
  bag.report_warning("dev", "w");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());

  bag.report_error("production", "e");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 1u);
  EXPECT_EQ(bag.warnings().size(), 1u);
}

TEST(DiagnosticBagTest, MergeAppends)
{
  envres::DiagnosticBag a;
  envres::DiagnosticBag b;
  a.report_error("dev", "a");
  b.report_error("qa", "b");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2u);
  EXPECT_EQ(a.all()[1].environment, "qa");
}

TEST(DiagnosticTest, LocationWithOnlyOneHalf)
{
  envres::Diagnostic d;
  EXPECT_EQ(d.location(), "");
  d.field_path = "region";
  EXPECT_EQ(d.location(), "region");
  d.field_path.clear();
  d.environment = "dev";
  EXPECT_EQ(d.location(), "dev");
}

TEST(ResolveErrorTest, ToDiagnosticCarriesKindAsNote)
{
  const auto err = envres::fail(
    envres::ErrorKind::MissingField, envres::codes::k_missing_field, "dev", "region",
    "required field 'region' is missing");

  const envres::Diagnostic d = err.error().to_diagnostic();
  EXPECT_EQ(d.code, "E0201");
  EXPECT_EQ(d.location(), "dev.region");
  ASSERT_EQ(d.notes.size(), 1u);
  EXPECT_EQ(d.notes.front(), "MissingFieldError");
}

TEST(ResolveErrorTest, Describe)
{
  envres::ResolveError e;
  e.environment = "production";
  e.field_path = "certificateRef";
  e.message = "certificateRef is required when domain is set";
  EXPECT_EQ(e.describe(), "production.certificateRef: certificateRef is required when domain is set");

  e.environment.clear();
  e.field_path.clear();
  EXPECT_EQ(e.describe(), e.message);
}

TEST(ResolveErrorTest, KindNames)
{
  EXPECT_EQ(envres::to_string(envres::ErrorKind::Validation), "ValidationError");
  EXPECT_EQ(envres::to_string(envres::ErrorKind::Reference), "ReferenceError");
  EXPECT_EQ(envres::to_string(envres::ErrorKind::DuplicateName), "DuplicateNameError");
  EXPECT_EQ(envres::to_string(envres::ErrorKind::NotFound), "NotFoundError");
  EXPECT_EQ(envres::to_string(envres::ErrorKind::Load), "LoadError");
}

}  // namespace
