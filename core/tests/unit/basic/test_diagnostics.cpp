// tests/unit/basic/test_diagnostics.cpp - DiagnosticBag and DiagnosticPrinter

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "oasgen/basic/diagnostic.hpp"
#include "oasgen/basic/diagnostic_printer.hpp"
#include "oasgen/basic/errors.hpp"

using namespace oasgen;

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(BasicDiagnostics, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(Reference::root("api.yaml"), "broken");
    builder.with_code("E100").with_note("first").with_note("second").with_help("fix it");
    EXPECT_TRUE(bag.empty());
  }

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E100");
  EXPECT_EQ(d.message, "broken");
  ASSERT_TRUE(d.location.has_value());
  EXPECT_EQ(d.location->document_path(), "api.yaml");
  ASSERT_EQ(d.notes.size(), 2U);
  EXPECT_EQ(d.notes[1], "second");
  EXPECT_EQ(d.help_message.value_or(""), "fix it");
}

TEST(BasicDiagnostics, WarningsDoNotCountAsErrors)
{
  DiagnosticBag bag;
  bag.report_warning(std::nullopt, "odd");
  EXPECT_FALSE(bag.has_errors());

  bag.report_error(std::nullopt, "bad");
  EXPECT_TRUE(bag.has_errors());
  ASSERT_EQ(bag.size(), 2U);
  EXPECT_EQ(bag.all()[0].severity, Severity::Warning);
  EXPECT_EQ(bag.all()[1].severity, Severity::Error);
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(BasicDiagnosticPrinter, PrintsHeaderLocationAndNotes)
{
  DiagnosticBag bag;
  bag
    .report_error(
      Reference("api.yaml", {"paths", "pets"}), "reference not found: common.yaml#/Pet")
    .with_code("E102")
    .with_note("while following \"$ref\": \"common.yaml#/Pet\"");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(bag.all().front());

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E102]: reference not found: common.yaml#/Pet\n"), std::string::npos);
  EXPECT_NE(text.find("  --> api.yaml#/paths/pets\n"), std::string::npos);
  EXPECT_NE(text.find("   = note: while following \"$ref\""), std::string::npos);
}

TEST(BasicDiagnosticPrinter, OmitsCodeWhenEmpty)
{
  DiagnosticBag bag;
  bag.report_warning(std::nullopt, "nothing to check").with_help("add a component");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(bag.all().front());

  const std::string text = out.str();
  EXPECT_EQ(text.rfind("warning: nothing to check\n", 0), 0U);
  EXPECT_EQ(text.find("-->"), std::string::npos);
  EXPECT_NE(text.find("   = help: add a component\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, GroupsByDocumentInFirstSeenOrder)
{
  DiagnosticBag bag;
  bag.report_error(Reference::root("b.yaml"), "b1");
  bag.report_error(Reference::root("a.yaml"), "a1");
  bag.report_error(Reference::root("b.yaml"), "b2");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  const std::string text = out.str();
  const auto b1 = text.find("error: b1");
  const auto b2 = text.find("error: b2");
  const auto a1 = text.find("error: a1");
  ASSERT_NE(b1, std::string::npos);
  ASSERT_NE(b2, std::string::npos);
  ASSERT_NE(a1, std::string::npos);
  EXPECT_LT(b1, b2);
  EXPECT_LT(b2, a1);
}

TEST(BasicDiagnosticPrinter, Summary)
{
  DiagnosticBag bag;
  bag.report_error(std::nullopt, "x");
  bag.report_error(std::nullopt, "y");
  bag.report_warning(std::nullopt, "z");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_summary(bag);
  EXPECT_EQ(out.str(), "2 errors, 1 warning\n");
}

// ============================================================================
// Error messages
// ============================================================================

TEST(BasicErrors, MessagesNameTheReference)
{
  const Reference ref("api.yaml", {"a", "b"});

  const NotFoundError not_found(ref);
  EXPECT_STREQ(not_found.what(), "reference not found: api.yaml#/a/b");
  EXPECT_EQ(not_found.reference(), ref);

  const TypeMismatchError mismatch(ref, ValueKind::Map, ValueKind::List);
  EXPECT_STREQ(mismatch.what(), "reference api.yaml#/a/b doesn't point to map (found list)");
  EXPECT_EQ(mismatch.expected(), ValueKind::Map);
  EXPECT_EQ(mismatch.actual(), ValueKind::List);

  const LoadError load("x.txt", "unsupported extension 'txt'");
  EXPECT_STREQ(load.what(), "cannot load document 'x.txt': unsupported extension 'txt'");
  EXPECT_EQ(load.path(), "x.txt");
}

TEST(BasicErrors, CircularMessageListsChain)
{
  const Reference a = Reference::root("a.yaml");
  const Reference b = Reference::root("b.yaml");
  const CircularReferenceError error(a, {a, b});

  EXPECT_STREQ(error.what(), "circular reference detected: a.yaml# -> b.yaml# -> a.yaml#");
  EXPECT_EQ(error.chain().size(), 2U);

  // Every resolution failure is catchable as the common base
  const ResolutionError & base = error;
  EXPECT_EQ(base.reference(), a);
}
