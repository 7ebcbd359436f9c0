// tests/unit/driver/test_resolver_driver.cpp - check / dump pipelines over files on disk

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "oasgen/driver/resolver_driver.hpp"

using namespace oasgen;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & path, const std::string & text)
{
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path);
  out << text;
}

ResolveOptions options_for(const TempDir & dir, const std::string & schema)
{
  ResolveOptions options;
  options.base_dir = dir.path;
  options.schema = dir.path / schema;
  return options;
}

std::vector<std::string> codes(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    out.push_back(d.code);
  }
  return out;
}

}  // namespace

// ============================================================================
// check
// ============================================================================

TEST(DriverCheck, ValidDocumentsPass)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_valid");
  write_file(
    dir.path / "api.yaml",
    "info: {title: Pets}\n"
    "pet:\n"
    "  $ref: common.yaml#/Pet\n"
    "list:\n"
    "  - $ref: '#/info'\n");
  write_file(
    dir.path / "common.yaml",
    "Pet:\n"
    "  type: object\n"
    "  properties:\n"
    "    owner:\n"
    "      $ref: '#/Owner'\n"
    "Owner: {type: object}\n");

  const ResolveResult result = ResolverDriver::check(options_for(dir, "api.yaml"));
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.documents_loaded, 2U);
  EXPECT_EQ(result.references_checked, 3U);
  EXPECT_FALSE(result.output.has_value());
}

TEST(DriverCheck, ReportsEveryFailingReference)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_broken");
  write_file(
    dir.path / "api.yaml",
    "info: {title: Pets}\n"
    "s: text\n"
    "a: {$ref: '#/missing'}\n"
    "b: {$ref: 'other.yaml#/x'}\n"
    "c: {$ref: '#/s/x'}\n"
    "d: {$ref: '#/d'}\n"
    "e: {$ref: '#/info'}\n");

  const ResolveResult result = ResolverDriver::check(options_for(dir, "api.yaml"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.references_checked, 5U);
  EXPECT_EQ(codes(result.diagnostics), (std::vector<std::string>{"E102", "E100", "E101", "E103"}));

  const Diagnostic & first = result.diagnostics.all().front();
  ASSERT_TRUE(first.location.has_value());
  EXPECT_EQ(*first.location, Reference("api.yaml", {"a"}));
  EXPECT_EQ(first.message, "reference not found: api.yaml#/missing");
  ASSERT_EQ(first.notes.size(), 1U);
  EXPECT_EQ(first.notes[0], "while following \"$ref\": \"#/missing\"");
}

TEST(DriverCheck, DepthLimitFromOptions)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_depth");
  write_file(
    dir.path / "api.yaml",
    "a: {$ref: '#/b'}\n"
    "b: {$ref: '#/c'}\n"
    "c: 1\n");

  ResolveOptions options = options_for(dir, "api.yaml");
  options.max_reference_depth = 1;

  const ResolveResult result = ResolverDriver::check(options);
  EXPECT_EQ(codes(result.diagnostics), (std::vector<std::string>{"E104"}));
}

TEST(DriverCheck, ComponentsAreChecked)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_components");
  write_file(dir.path / "api.yaml", "info: {title: Pets}\n");
  write_file(dir.path / "parts" / "extra.yaml", "x:\n  $ref: '../api.yaml#/nothing'\n");

  ResolveOptions options = options_for(dir, "api.yaml");
  options.components.push_back(dir.path / "parts" / "extra.yaml");
  options.components.push_back(dir.path / "parts" / "absent.yaml");

  const ResolveResult result = ResolverDriver::check(options);
  EXPECT_EQ(result.documents_loaded, 2U);
  ASSERT_EQ(result.diagnostics.size(), 2U);

  const Diagnostic & missing = result.diagnostics.all()[0];
  EXPECT_EQ(missing.code, "E100");
  EXPECT_EQ(*missing.location, Reference::root("parts/absent.yaml"));

  const Diagnostic & dangling = result.diagnostics.all()[1];
  EXPECT_EQ(dangling.code, "E102");
  EXPECT_EQ(*dangling.location, Reference("parts/extra.yaml", {"x"}));
  EXPECT_EQ(dangling.message, "reference not found: api.yaml#/nothing");
}

TEST(DriverCheck, AbsoluteRefIsRootedAtBaseDir)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_absolute");
  write_file(dir.path / "schemas" / "api.yaml", "pet:\n  $ref: '/common.yaml#/Pet'\n");
  write_file(dir.path / "common.yaml", "Pet: {type: object}\n");

  const ResolveResult result = ResolverDriver::check(options_for(dir, "schemas/api.yaml"));
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.documents_loaded, 2U);
}

TEST(DriverCheck, WarnsAboutRefShape)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_ref_shape");
  write_file(
    dir.path / "api.yaml",
    "info: {title: Pets}\n"
    "plain: {$ref: 42}\n"
    "described:\n"
    "  $ref: '#/info'\n"
    "  description: shadowed\n"
    "  summary: also shadowed\n");

  const ResolveResult result = ResolverDriver::check(options_for(dir, "api.yaml"));
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.references_checked, 1U);
  ASSERT_EQ(codes(result.diagnostics), (std::vector<std::string>{"W100", "W101"}));

  const Diagnostic & plain = result.diagnostics.all()[0];
  EXPECT_EQ(plain.severity, Severity::Warning);
  EXPECT_EQ(*plain.location, Reference("api.yaml", {"plain"}));
  EXPECT_TRUE(plain.help_message.has_value());

  const Diagnostic & siblings = result.diagnostics.all()[1];
  EXPECT_EQ(*siblings.location, Reference("api.yaml", {"described"}));
  EXPECT_EQ(siblings.message, "keys next to \"$ref\" are ignored: description, summary");
}

TEST(DriverCheck, MissingSchema)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_missing");
  const ResolveResult result = ResolverDriver::check(options_for(dir, "api.yaml"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(codes(result.diagnostics), (std::vector<std::string>{"E100"}));
}

TEST(DriverCheck, VerboseLogsLoads)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_verbose");
  write_file(dir.path / "api.yaml", "a: {$ref: 'b.yaml'}\n");
  write_file(dir.path / "b.yaml", "ok: true\n");

  ResolveOptions options = options_for(dir, "api.yaml");
  options.verbose = true;

  testing::internal::CaptureStderr();
  const ResolveResult result = ResolverDriver::check(options);
  const std::string log = testing::internal::GetCapturedStderr();

  EXPECT_TRUE(result.success);
  EXPECT_NE(log.find("Loading: api.yaml\n"), std::string::npos);
  EXPECT_NE(log.find("Loading: b.yaml\n"), std::string::npos);
}

// ============================================================================
// dump
// ============================================================================

TEST(DriverDump, InlinesReferences)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_dump");
  write_file(
    dir.path / "api.yaml",
    "info: {title: Pets, version: 2}\n"
    "pet:\n"
    "  $ref: common.yaml#/Pet\n");
  write_file(
    dir.path / "common.yaml",
    "Pet:\n"
    "  type: object\n"
    "  nullable: null\n"
    "  tags: [a, 1.5, true]\n");

  const ResolveResult result = ResolverDriver::dump(options_for(dir, "api.yaml"));
  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.output.has_value());

  const auto expected = nlohmann::ordered_json::parse(R"({
    "info": {"title": "Pets", "version": 2},
    "pet": {"type": "object", "nullable": null, "tags": ["a", 1.5, true]}
  })");
  EXPECT_EQ(*result.output, expected.dump(2));
}

TEST(DriverDump, Pointer)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_pointer");
  write_file(dir.path / "api.yaml", "info: {title: Pets}\n");

  ResolveOptions options = options_for(dir, "api.yaml");
  options.pointer = "/info/title";

  const ResolveResult result = ResolverDriver::dump(options);
  ASSERT_TRUE(result.output.has_value());
  EXPECT_EQ(*result.output, "\"Pets\"");
}

TEST(DriverDump, RecursiveSchemaEmitsRef)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_recursive");
  write_file(
    dir.path / "api.yaml",
    "Node:\n"
    "  properties:\n"
    "    next:\n"
    "      $ref: '#/Node'\n");

  ResolveOptions options = options_for(dir, "api.yaml");
  options.pointer = "/Node";

  const ResolveResult result = ResolverDriver::dump(options);
  ASSERT_TRUE(result.output.has_value());

  const auto expected = nlohmann::ordered_json::parse(
    R"({"properties": {"next": {"$ref": "api.yaml#/Node"}}})");
  EXPECT_EQ(*result.output, expected.dump(2));
}

TEST(DriverDump, InvalidUtf8IsReplaced)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_utf8");
  write_file(dir.path / "api.yaml", "title: \"caf\xE9\"\n");

  ResolveResult result;
  ASSERT_NO_THROW(result = ResolverDriver::dump(options_for(dir, "api.yaml")));
  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.output.has_value());
  EXPECT_NE(result.output->find("caf\xEF\xBF\xBD"), std::string::npos);
}

TEST(DriverDump, DanglingChildIsDiagnosed)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_dangling");
  write_file(dir.path / "api.yaml", "a: {$ref: '#/nowhere'}\nb: null\n");

  const ResolveResult result = ResolverDriver::dump(options_for(dir, "api.yaml"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(codes(result.diagnostics), (std::vector<std::string>{"E102"}));
}

TEST(DriverDump, FailingReferenceIsDiagnosed)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_dump_fail");
  write_file(dir.path / "api.yaml", "a: {$ref: '#/a'}\n");

  const ResolveResult result = ResolverDriver::dump(options_for(dir, "api.yaml"));
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.output.has_value());
  EXPECT_EQ(codes(result.diagnostics), (std::vector<std::string>{"E103"}));
}

// ============================================================================
// Options and document keys
// ============================================================================

TEST(DriverOptions, DocumentKeyIsRelativeAndEncoded)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_keys");
  EXPECT_EQ(ResolverDriver::document_key(dir.path, dir.path / "api.yaml"), "api.yaml");
  EXPECT_EQ(
    ResolverDriver::document_key(dir.path, dir.path / "sub" / "my api.yaml"),
    "sub/my%20api.yaml");
  EXPECT_EQ(
    ResolverDriver::document_key(dir.path / "specs", dir.path / "specs" / ".." / "x.yaml"),
    "../x.yaml");
  EXPECT_EQ(
    ResolverDriver::document_key(dir.path / "specs", dir.path / "shared" / "c.yaml"),
    "../shared/c.yaml");
}

TEST(DriverOptions, ComponentOutsideBaseDirLoads)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "oasgen_driver_outside");
  write_file(dir.path / "specs" / "api.yaml", "pet:\n  $ref: ../shared/c.yaml#/Pet\n");
  write_file(dir.path / "shared" / "c.yaml", "Pet: {type: object}\n");

  ResolveOptions options;
  options.base_dir = dir.path / "specs";
  options.schema = dir.path / "specs" / "api.yaml";
  options.components = {dir.path / "shared" / "c.yaml"};

  const ResolveResult result = ResolverDriver::check(options);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.documents_loaded, 2U);
}

TEST(DriverOptions, FromConfig)
{
  ProjectConfig config;
  config.project_root = "/proj";
  config.resolver.base_dir = "specs";
  config.resolver.schema = "api.yaml";
  config.resolver.components = {"common.yaml"};
  config.resolver.max_reference_depth = 5;

  const ResolveOptions options = ResolveOptions::from_config(config);
  EXPECT_EQ(options.base_dir, std::filesystem::path("/proj/specs"));
  EXPECT_EQ(options.schema, std::filesystem::path("/proj/specs/api.yaml"));
  ASSERT_EQ(options.components.size(), 1U);
  EXPECT_EQ(options.components[0], std::filesystem::path("/proj/specs/common.yaml"));
  EXPECT_EQ(options.max_reference_depth, 5U);
  EXPECT_EQ(options.pointer, "/");
}
