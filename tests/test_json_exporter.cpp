// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/json_exporter.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/exceptions.h"

namespace funcmap {
namespace output {
namespace {

using json = nlohmann::json;

class JsonExporterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_.TransitTo(0x1000, 0x1000, 0x1010);
    registry_.CallTo(0x1000, 0x1010, 0x2000, 0x1020);
    registry_.ReturnFromCall(0x1000, 0x1010, 0x1020);
    registry_.ReturnFrom(0x1000, 0x1020);
    registry_.ReturnFrom(0x2000, 0x2000);

    core::Function* function = registry_.Lookup(0x1000);
    function->set_name("main");
    function->AddArgumentRegister(16);
    function->AddArgumentStackVariable(-8);
    function->set_bp_on_stack(true);
    function->set_sp_difference(4);
  }

  core::FunctionRegistry registry_;
  JsonExporter exporter_;
};

// Test report header and function list
TEST_F(JsonExporterTest, Header) {
  json report = exporter_.Export(registry_);

  EXPECT_EQ(report["version"], 1);
  EXPECT_EQ(report["function_count"], 2);
  ASSERT_TRUE(report["functions"].is_array());
  ASSERT_EQ(report["functions"].size(), 2u);
  EXPECT_EQ(report["functions"][0]["entry"], "0x00001000");
  EXPECT_EQ(report["functions"][1]["entry"], "0x00002000");
}

// Test one function's full record
TEST_F(JsonExporterTest, Function) {
  json j = exporter_.ExportFunction(*registry_.Lookup(0x1000));

  EXPECT_EQ(j["name"], "main");
  EXPECT_EQ(j["blocks"], json::array({"0x00001000", "0x00001010", "0x00001020"}));

  ASSERT_EQ(j["edges"].size(), 2u);
  EXPECT_EQ(j["edges"][0]["type"], "transition");
  EXPECT_EQ(j["edges"][1]["from"], "0x00001010");
  EXPECT_EQ(j["edges"][1]["type"], "return_from_call");

  ASSERT_EQ(j["call_sites"].size(), 1u);
  EXPECT_EQ(j["call_sites"][0]["site"], "0x00001010");
  EXPECT_EQ(j["call_sites"][0]["target"], "0x00002000");
  EXPECT_EQ(j["call_sites"][0]["return"], "0x00001020");

  EXPECT_EQ(j["return_sites"], json::array({"0x00001020"}));
  EXPECT_EQ(j["has_return"], true);

  EXPECT_EQ(j["arguments"]["registers"], json::array({16}));
  EXPECT_EQ(j["arguments"]["stack_variables"], json::array({-8}));

  EXPECT_EQ(j["frame"]["bp_on_stack"], true);
  EXPECT_EQ(j["frame"]["retaddr_on_stack"], false);
  EXPECT_EQ(j["frame"]["sp_difference"], 4);
}

// Test unnamed functions export a null name
TEST_F(JsonExporterTest, UnnamedFunction) {
  json j = exporter_.ExportFunction(*registry_.Lookup(0x2000));
  EXPECT_TRUE(j["name"].is_null());
  EXPECT_TRUE(j["call_sites"].empty());
  EXPECT_TRUE(j["arguments"]["registers"].empty());
}

// Test call graph edges
TEST_F(JsonExporterTest, CallGraph) {
  json report = exporter_.Export(registry_);

  ASSERT_EQ(report["call_graph"].size(), 1u);
  EXPECT_EQ(report["call_graph"][0]["caller"], "0x00001000");
  EXPECT_EQ(report["call_graph"][0]["callee"], "0x00002000");
}

// Test the serialized form parses back to the same document
TEST_F(JsonExporterTest, ExportString) {
  std::string text = exporter_.ExportString(registry_);
  EXPECT_EQ(json::parse(text), exporter_.Export(registry_));
}

// Test writing to disk
TEST_F(JsonExporterTest, WriteFile) {
  std::filesystem::path path =
      std::filesystem::temp_directory_path() / "funcmap_report_test.json";
  exporter_.WriteFile(registry_, path.string());

  std::ifstream file(path);
  json report = json::parse(file);
  EXPECT_EQ(report["function_count"], 2);

  std::filesystem::remove(path);
}

// Test unwritable destination
TEST_F(JsonExporterTest, WriteFileFailure) {
  EXPECT_THROW(
      exporter_.WriteFile(registry_, "/nonexistent/dir/funcmap_report.json"),
      RenderException);
}

}  // namespace
}  // namespace output
}  // namespace funcmap
