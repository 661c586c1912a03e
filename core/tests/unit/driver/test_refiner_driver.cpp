// test_refiner_driver.cpp - Driver: parse, refine, print and write

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "refiner/driver/refiner_driver.hpp"

namespace fs = std::filesystem;

namespace refiner
{

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

ProjectConfig card_config()
{
  const auto result = parse_project_config(R"(
components:
  Card:
    schema:
      count: { type: number, coerce: true }
    prune_keys: [legacy]
  Post:
    schema:
      title: { type: string, required: true }
)");
  EXPECT_TRUE(result.success) << result.error;
  return result.config;
}

DriverOptions build_options()
{
  DriverOptions options;
  options.mode = RefineMode::Build;
  return options;
}

}  // namespace

TEST(RefinerDriverTest, BuildReturnsRefinedText)
{
  const Refiner refiner(card_config());
  const auto result = refiner.refine_source(
    "import {jsx as _jsx} from \"react/jsx-runtime\";\n"
    "export default function MDXContent() {\n"
    "  return _jsx(Card, {count: \"2\", legacy: true});\n"
    "}\n",
    "post.js", build_options());

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.modified_call_sites, 1u);
  EXPECT_NE(result.output_text.find("return _jsx(Card, {count: 2});"), std::string::npos);
  EXPECT_EQ(result.output_text.rfind("import {jsx as _jsx} from \"react/jsx-runtime\";", 0), 0u);
  EXPECT_FALSE(result.written_file.has_value());
}

TEST(RefinerDriverTest, CheckModeNeverRewrites)
{
  const Refiner refiner(card_config());
  DriverOptions options;
  options.mode = RefineMode::Check;

  const auto result = refiner.refine_source("_jsx(Card, {count: \"2\"});\n", "post.js", options);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.modified_call_sites, 0u);
  EXPECT_TRUE(result.output_text.empty());
}

TEST(RefinerDriverTest, ValidationFailureBecomesDiagnostic)
{
  const Refiner refiner(card_config());
  const auto result =
    refiner.refine_source("_jsx(Post, {title: 3});\n_jsx(Post, {});\n", "post.js", build_options());

  ASSERT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1u);  // the first failure ends the module

  const Diagnostic & d = result.diagnostics.all().front();
  EXPECT_EQ(d.code, "R0201");
  EXPECT_EQ(d.message, "Invalid props for \"Post\" at \"title\": Expected string, received number");
  ASSERT_EQ(d.notes.size(), 1u);
  EXPECT_EQ(d.notes[0], "invalid value at Post.props.title");
  ASSERT_EQ(d.labels.size(), 2u);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.labels[1].message, "props");
  EXPECT_EQ(d.primary_range().get_begin().get_offset(), 0u);
}

TEST(RefinerDriverTest, PatchFailureCarriesHelp)
{
  ProjectConfig config = card_config();
  ComponentRule rule;
  rule.derive = [](const Value &, DerivedPatchBuilder & builder) {
    builder.set("slug", Value::make_string("x"));
  };
  config.rules.add("Post", rule);

  const Refiner refiner(std::move(config));
  const auto result = refiner.refine_source("_jsx(Post, {});\n", "post.js", build_options());

  ASSERT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  const Diagnostic & d = result.diagnostics.all().front();
  EXPECT_EQ(d.code, "R0401");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_NE(d.help_message->find("placeholder slot"), std::string::npos);
}

TEST(RefinerDriverTest, SyntaxErrorsStopBeforeRefinement)
{
  const Refiner refiner(card_config());
  const auto result = refiner.refine_source("_jsx(Card, {count: });\n", "bad.js", build_options());

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
  EXPECT_EQ(result.modified_call_sites, 0u);
  EXPECT_TRUE(result.output_text.empty());
}

TEST(RefinerDriverTest, RefineFileWritesOutput)
{
  const fs::path dir = make_temp_dir("refiner_driver_write");
  const fs::path input = dir / "post.js";
  const fs::path output = dir / "post.out.js";
  write_all(input, "_jsx(Card, {count: \"5\"});\n");

  const Refiner refiner(card_config());
  DriverOptions options = build_options();
  options.output_file = output;

  const auto result = refiner.refine_file(input, options);
  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.written_file.has_value());
  EXPECT_EQ(read_all(output), "_jsx(Card, {count: 5});\n");

  fs::remove_all(dir);
}

TEST(RefinerDriverTest, DryRunWritesNothing)
{
  const fs::path dir = make_temp_dir("refiner_driver_dry");
  const fs::path input = dir / "post.js";
  const fs::path output = dir / "post.out.js";
  write_all(input, "_jsx(Card, {count: \"5\"});\n");

  const Refiner refiner(card_config());
  DriverOptions options = build_options();
  options.output_file = output;
  options.dry_run = true;

  const auto result = refiner.refine_file(input, options);
  ASSERT_TRUE(result.success);
  EXPECT_FALSE(result.written_file.has_value());
  EXPECT_FALSE(fs::exists(output));
  EXPECT_EQ(result.output_text, "_jsx(Card, {count: 5});\n");

  fs::remove_all(dir);
}

TEST(RefinerDriverTest, MissingFileIsReported)
{
  const Refiner refiner(ProjectConfig{});
  const auto result = refiner.refine_file("/nonexistent/refiner/input.js", build_options());
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_NE(result.diagnostics.all()[0].message.find("file not found"), std::string::npos);
}

}  // namespace refiner
