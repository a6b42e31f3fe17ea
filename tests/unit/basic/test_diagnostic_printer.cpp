// test_diagnostic_printer.cpp - Tests for plain (uncolored) diagnostic output
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "envres/basic/diagnostic_printer.hpp"

namespace
{

TEST(DiagnosticPrinterTest, PrintsHeaderLocationAndNotes)
{
  envres::DiagnosticBag bag;
  bag.report_error("production", "timeoutSeconds must be in 1..900 (got 901)")
    .with_code("E0103")
    .with_field("resourceLimits.timeoutSeconds")
    .with_note("ValidationError");

  std::ostringstream os;
  envres::DiagnosticPrinter printer(os, false);
  printer.print_all(bag, "deploy.json");

  const std::string out = os.str();
  EXPECT_NE(
    out.find("error[E0103]: timeoutSeconds must be in 1..900 (got 901)\n"), std::string::npos)
    << out;
  EXPECT_NE(
    out.find("  --> deploy.json: production.resourceLimits.timeoutSeconds\n"), std::string::npos)
    << out;
  EXPECT_NE(out.find("      = note: ValidationError\n"), std::string::npos) << out;
}

TEST(DiagnosticPrinterTest, ErrorsPrintedBeforeWarnings)
{
  envres::DiagnosticBag bag;
  bag.report_warning("", "document declares no environments");
  bag.report_error("dev", "first error");

  std::ostringstream os;
  envres::DiagnosticPrinter printer(os, false);
  printer.print_all(bag, "deploy.json");

  const std::string out = os.str();
  const auto err_pos = out.find("error: first error");
  const auto warn_pos = out.find("warning: document declares no environments");
  ASSERT_NE(err_pos, std::string::npos) << out;
  ASSERT_NE(warn_pos, std::string::npos) << out;
  EXPECT_LT(err_pos, warn_pos);
}

TEST(DiagnosticPrinterTest, HelpLine)
{
  envres::DiagnosticBag bag;
  bag.report_error("dev", "unknown environment").with_help("run 'envres list'");

  std::ostringstream os;
  envres::DiagnosticPrinter printer(os, false);
  printer.print_all(bag, "");

  const std::string out = os.str();
  EXPECT_NE(out.find("  --> dev\n"), std::string::npos) << out;
  EXPECT_NE(out.find("      = help: run 'envres list'\n"), std::string::npos) << out;
}

}  // namespace
