// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/function.h"

#include <gtest/gtest.h>

#include <memory>

namespace funcmap {
namespace core {
namespace {

// Test fixture for Function class
class FunctionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    function_ = std::make_unique<Function>(0x1000);
  }

  // Every reverse entry must point back at a call site returning there
  void ExpectReverseIndexConsistent() const {
    for (const auto& [retn, site] : function_->return_to_call_site()) {
      auto it = function_->call_sites().find(site);
      ASSERT_NE(it, function_->call_sites().end());
      EXPECT_EQ(it->second.return_address, retn);
    }
    // Every call site's return address has a mirror, possibly owned by
    // another site returning to the same address
    for (const auto& [site, call] : function_->call_sites()) {
      EXPECT_TRUE(function_->GetCallSiteForReturn(call.return_address))
          << "no mirror for call site " << FormatAddress(site);
    }
  }

  std::unique_ptr<Function> function_;
};

// Test a fresh function
TEST_F(FunctionTest, DefaultState) {
  EXPECT_EQ(function_->entry(), 0x1000u);
  EXPECT_FALSE(function_->name().has_value());
  EXPECT_TRUE(function_->basic_blocks().empty());
  EXPECT_TRUE(function_->endpoints().empty());
  EXPECT_TRUE(function_->GetCallSites().empty());
  EXPECT_FALSE(function_->HasReturn());
  EXPECT_TRUE(function_->arguments().registers.empty());
  EXPECT_TRUE(function_->arguments().stack_variables.empty());
  EXPECT_FALSE(function_->bp_on_stack());
  EXPECT_FALSE(function_->retaddr_on_stack());
  EXPECT_EQ(function_->sp_difference(), 0);
}

// Test AddBlock is idempotent
TEST_F(FunctionTest, AddBlock) {
  function_->AddBlock(0x1000);
  function_->AddBlock(0x1010);
  function_->AddBlock(0x1000);

  EXPECT_EQ(function_->basic_blocks(),
            (std::vector<Address>{0x1000, 0x1010}));
  EXPECT_EQ(function_->transition_graph().EdgeCount(), 0u);
}

// Test TransitTo adds a transition edge and both endpoints
TEST_F(FunctionTest, TransitTo) {
  function_->TransitTo(0x1000, 0x1010);
  function_->TransitTo(0x1000, 0x1010);

  const auto& graph = function_->transition_graph();
  EXPECT_EQ(graph.EdgeCount(), 1u);
  EXPECT_EQ(graph.GetEdgeLabel(0x1000, 0x1010), EdgeType::TRANSITION);
  EXPECT_EQ(function_->basic_blocks(),
            (std::vector<Address>{0x1000, 0x1010}));
}

// Test ReturnFromCall is tagged separately from ordinary flow
TEST_F(FunctionTest, ReturnFromCall) {
  function_->TransitTo(0x1000, 0x1010);
  function_->ReturnFromCall(0x1020, 0x1030);

  const auto& graph = function_->transition_graph();
  EXPECT_EQ(graph.GetEdgeLabel(0x1000, 0x1010), EdgeType::TRANSITION);
  EXPECT_EQ(graph.GetEdgeLabel(0x1020, 0x1030), EdgeType::RETURN_FROM_CALL);
  EXPECT_EQ(graph.EdgeCount(), 2u);
}

// Test HasReturn flips on the first return site and stays set
TEST_F(FunctionTest, HasReturn) {
  EXPECT_FALSE(function_->HasReturn());

  function_->AddReturnSite(0x1040);
  EXPECT_TRUE(function_->HasReturn());

  function_->AddReturnSite(0x1040);
  function_->AddReturnSite(0x1080);
  EXPECT_TRUE(function_->HasReturn());
  EXPECT_EQ(function_->endpoints(), (std::vector<Address>{0x1040, 0x1080}));
}

// Test return sites are not added to the graph by themselves
TEST_F(FunctionTest, ReturnSiteDoesNotAddBlock) {
  function_->AddReturnSite(0x1040);
  EXPECT_TRUE(function_->basic_blocks().empty());
  EXPECT_TRUE(function_->IsReturnSite(0x1040));
  EXPECT_FALSE(function_->IsReturnSite(0x1000));
}

// Test call site recording and lookup
TEST_F(FunctionTest, CallSite) {
  function_->AddCallSite(0x1010, 0x2000, 0x1020);

  EXPECT_EQ(function_->GetCallTarget(0x1010), 0x2000u);
  EXPECT_EQ(function_->GetCallReturn(0x1010), 0x1020u);
  EXPECT_EQ(function_->GetCallSiteForReturn(0x1020), 0x1010u);
  EXPECT_TRUE(function_->IsCallSite(0x1010));
  EXPECT_EQ(function_->GetCallSites(), std::vector<Address>{0x1010});
}

// Test unknown call sites yield no value
TEST_F(FunctionTest, UnknownCallSite) {
  EXPECT_FALSE(function_->GetCallTarget(0x1010).has_value());
  EXPECT_FALSE(function_->GetCallReturn(0x1010).has_value());
  EXPECT_FALSE(function_->GetCallSiteForReturn(0x1020).has_value());
  EXPECT_FALSE(function_->IsCallSite(0x1010));
}

// Test repeating the same call site leaves a single record
TEST_F(FunctionTest, CallSiteIdempotent) {
  function_->AddCallSite(0x1010, 0x2000, 0x1020);
  function_->AddCallSite(0x1010, 0x2000, 0x1020);

  EXPECT_EQ(function_->call_sites().size(), 1u);
  EXPECT_EQ(function_->return_to_call_site().size(), 1u);
  ExpectReverseIndexConsistent();
}

// Test a later record for the same site replaces the earlier one
TEST_F(FunctionTest, CallSiteLastWriteWins) {
  function_->AddCallSite(0x1010, 0x2000, 0x1020);
  function_->AddCallSite(0x1010, 0x3000, 0x1024);

  EXPECT_EQ(function_->call_sites().size(), 1u);
  EXPECT_EQ(function_->GetCallTarget(0x1010), 0x3000u);
  EXPECT_EQ(function_->GetCallReturn(0x1010), 0x1024u);
  EXPECT_EQ(function_->GetCallSiteForReturn(0x1024), 0x1010u);
  EXPECT_FALSE(function_->GetCallSiteForReturn(0x1020).has_value());
  ExpectReverseIndexConsistent();
}

// Test two sites sharing a return address: the later one owns the mirror
TEST_F(FunctionTest, SharedReturnAddress) {
  function_->AddCallSite(0x1010, 0x2000, 0x1020);
  function_->AddCallSite(0x1018, 0x3000, 0x1020);

  EXPECT_EQ(function_->call_sites().size(), 2u);
  EXPECT_EQ(function_->GetCallSiteForReturn(0x1020), 0x1018u);
  ExpectReverseIndexConsistent();

  // Moving the first site's return must not steal the second site's mirror
  function_->AddCallSite(0x1010, 0x2000, 0x1014);
  EXPECT_EQ(function_->GetCallSiteForReturn(0x1020), 0x1018u);
  EXPECT_EQ(function_->GetCallSiteForReturn(0x1014), 0x1010u);
  ExpectReverseIndexConsistent();
}

// Test moving the site that owns a shared mirror hands it to the other site
TEST_F(FunctionTest, SharedReturnAddressHandOver) {
  function_->AddCallSite(0x1010, 0x2000, 0x1020);
  function_->AddCallSite(0x1018, 0x2000, 0x1020);
  EXPECT_EQ(function_->GetCallSiteForReturn(0x1020), 0x1018u);

  function_->AddCallSite(0x1018, 0x2000, 0x1030);

  EXPECT_EQ(function_->GetCallSiteForReturn(0x1020), 0x1010u);
  EXPECT_EQ(function_->GetCallSiteForReturn(0x1030), 0x1018u);
  EXPECT_EQ(function_->return_to_call_site().size(), 2u);
  ExpectReverseIndexConsistent();
}

// Test a mirror freed by the only site returning there is dropped
TEST_F(FunctionTest, FreedReturnAddressDropped) {
  function_->AddCallSite(0x1010, 0x2000, 0x1020);
  function_->AddCallSite(0x1010, 0x2000, 0x1030);

  EXPECT_FALSE(function_->GetCallSiteForReturn(0x1020).has_value());
  EXPECT_EQ(function_->return_to_call_site().size(), 1u);
  ExpectReverseIndexConsistent();
}

// Test argument registers are deduplicated in insertion order
TEST_F(FunctionTest, ArgumentRegisters) {
  function_->AddArgumentRegister(4);
  function_->AddArgumentRegister(4);
  function_->AddArgumentRegister(8);

  EXPECT_EQ(function_->arguments().registers, (std::vector<int64_t>{4, 8}));
}

// Test stack arguments follow the same rule, independently of registers
TEST_F(FunctionTest, ArgumentStackVariables) {
  function_->AddArgumentStackVariable(16);
  function_->AddArgumentStackVariable(8);
  function_->AddArgumentStackVariable(16);
  function_->AddArgumentRegister(16);

  EXPECT_EQ(function_->arguments().stack_variables,
            (std::vector<int64_t>{16, 8}));
  EXPECT_EQ(function_->arguments().registers, std::vector<int64_t>{16});
}

// Test frame metadata is stored as given
TEST_F(FunctionTest, FrameMetadata) {
  function_->set_bp_on_stack(true);
  function_->set_retaddr_on_stack(true);
  function_->set_sp_difference(-24);

  EXPECT_TRUE(function_->bp_on_stack());
  EXPECT_TRUE(function_->retaddr_on_stack());
  EXPECT_EQ(function_->sp_difference(), -24);

  function_->set_sp_difference(8);
  EXPECT_EQ(function_->sp_difference(), 8);
}

// Test name does not affect identity
TEST_F(FunctionTest, Name) {
  function_->set_name("main");
  ASSERT_TRUE(function_->name().has_value());
  EXPECT_EQ(*function_->name(), "main");
  EXPECT_EQ(function_->entry(), 0x1000u);
}

// Test display name forms
TEST_F(FunctionTest, DisplayName) {
  EXPECT_EQ(function_->DisplayName(), "<Function 0x1000>");
  function_->set_name("main");
  EXPECT_EQ(function_->DisplayName(), "<Function main (0x1000)>");
}

// Test debug block list
TEST_F(FunctionTest, DebugString) {
  EXPECT_EQ(function_->DebugString(), "[]");
  function_->AddBlock(0x1000);
  function_->TransitTo(0x1000, 0x1010);
  EXPECT_EQ(function_->DebugString(), "[0x00001000, 0x00001010]");
}

// Test multi-line summary
TEST_F(FunctionTest, ToString) {
  function_->set_name("main");
  function_->AddBlock(0x1000);
  function_->AddReturnSite(0x1000);
  function_->AddArgumentRegister(16);
  function_->AddArgumentStackVariable(4);
  function_->set_sp_difference(8);

  std::string expected =
      "Function main [0x00001000]\n"
      "SP difference: 8\n"
      "Has return: true\n"
      "Arguments: reg: [16], stack: [4]\n"
      "Blocks: [0x00001000]";
  EXPECT_EQ(function_->ToString(), expected);
}

}  // namespace
}  // namespace core
}  // namespace funcmap
