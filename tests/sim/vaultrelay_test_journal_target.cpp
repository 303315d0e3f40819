// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <fstream>
#include <memory>

using namespace vaultrelay;
using namespace std::chrono_literals;
using sim::JournalConfig;
using sim::JournalSyncTarget;
using test::ManualExecutor;

namespace
{
std::vector<std::string> readLines(const std::string &path)
{
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line))
  {
    lines.push_back(line);
  }
  return lines;
}

sync::SyncCompletion collect(std::vector<sync::SyncOutcome> &into)
{
  return [&into](sync::SyncOutcome outcome) { into.push_back(std::move(outcome)); };
}
} // namespace

TEST_CASE("JournalSyncTarget records calls and confirms them", "[journal][target]")
{
  ManualExecutor exec;
  test::TempFile journal("vr_journal.log");
  JournalSyncTarget target(exec, JournalConfig{"bnb-vault", journal.path(), 50ms, 0});
  std::vector<sync::SyncOutcome> outcomes;

  target.updateSaleWindow(sync::SaleWindow{100, 200}, collect(outcomes));
  target.updateBalance(sync::Quantity(900), collect(outcomes));
  sync::Purchase purchase{"0xBuyer", sync::Quantity(5), sync::Quantity(2500), "56"};
  target.handlePurchase(purchase, collect(outcomes));
  REQUIRE(target.calls() == 3);
  REQUIRE(target.name() == "bnb-vault");

  exec.advance(49ms);
  REQUIRE(outcomes.empty());
  exec.advance(1ms);
  REQUIRE(outcomes.size() == 3);
  for (const auto &o : outcomes)
  {
    REQUIRE(o.ok);
    REQUIRE(o.receipt.size() == 66);
    REQUIRE(o.receipt.rfind("0x", 0) == 0);
  }
  REQUIRE(outcomes[0].receipt != outcomes[1].receipt);

  auto lines = readLines(journal.path());
  REQUIRE(lines.size() == 3);

  auto window = core::Json::parse(lines[0]);
  REQUIRE(window["target"].get<std::string>() == "bnb-vault");
  REQUIRE(window["op"].get<std::string>() == "updateSaleDates");
  REQUIRE(window["args"]["start"].get<std::uint64_t>() == 100);
  REQUIRE(window["args"]["end"].get<std::uint64_t>() == 200);
  REQUIRE(window["receipt"].get<std::string>() == outcomes[0].receipt);
  REQUIRE(window["time"].get<std::string>().size() == 20);

  auto balance = core::Json::parse(lines[1]);
  REQUIRE(balance["op"].get<std::string>() == "updateTokenBalance");
  REQUIRE(balance["args"]["balance"].get<std::string>() == "900");

  auto sale = core::Json::parse(lines[2]);
  REQUIRE(sale["op"].get<std::string>() == "handleTokenPurchase");
  REQUIRE(sale["args"]["buyer"].get<std::string>() == "0xBuyer");
  REQUIRE(sale["args"]["amount"].get<std::string>() == "5");
  REQUIRE(sale["args"]["value"].get<std::string>() == "2500");
  REQUIRE(sale["args"]["chainId"].get<std::string>() == "56");
  REQUIRE(target.lastEntry() == lines[2]);
}

TEST_CASE("JournalSyncTarget scripted and real failures", "[journal][errors]")
{
  ManualExecutor exec;
  std::vector<sync::SyncOutcome> outcomes;

  SECTION("The first calls can be rejected")
  {
    JournalSyncTarget target(exec, JournalConfig{"vault", "", 0ms, 2});
    for (int i = 0; i < 3; ++i)
    {
      target.updateBalance(sync::Quantity(i), collect(outcomes));
    }
    exec.advance(0ms);
    REQUIRE(outcomes.size() == 3);
    REQUIRE_FALSE(outcomes[0].ok);
    REQUIRE(outcomes[0].error == "rejected by vault (call 1)");
    REQUIRE_FALSE(outcomes[1].ok);
    REQUIRE(outcomes[2].ok);
    REQUIRE(core::Json::parse(target.lastEntry())["args"]["balance"].get<std::string>() == "2");
  }

  SECTION("An unwritable journal fails the call")
  {
    JournalSyncTarget target(exec, JournalConfig{"vault", "/nonexistent-dir/journal.log", 0ms, 0});
    target.updateBalance(sync::Quantity(1), collect(outcomes));
    exec.advance(0ms);
    REQUIRE(outcomes.size() == 1);
    REQUIRE_FALSE(outcomes[0].ok);
    REQUIRE(outcomes[0].error.find("cannot write journal") != std::string::npos);
  }

  SECTION("Completions are dropped once the target is gone")
  {
    auto target = std::make_unique<JournalSyncTarget>(exec, JournalConfig{"vault", "", 10ms, 0});
    target->updateBalance(sync::Quantity(1), collect(outcomes));
    target.reset();
    exec.advance(100ms);
    REQUIRE(outcomes.empty());
  }
}

TEST_CASE("JournalSyncTarget drives a full relay", "[journal][integration]")
{
  test::LogCapture capture;
  ManualExecutor exec;
  sim::StaticSnapshotSource source(sync::SaleWindow{100, 200}, sync::Quantity(1000));
  JournalSyncTarget vault(exec, JournalConfig{"bnb-vault", "", 20ms, 0});
  sync::SyncOrchestrator orchestrator(exec, source, {&vault}, &vault);

  orchestrator.bootstrap();
  exec.advance(20ms);
  REQUIRE(orchestrator.saleWindowSync("bnb-vault").state() == sync::SyncState::Synced);
  REQUIRE(orchestrator.balanceSync("bnb-vault").confirmed() == sync::Quantity(1000));

  orchestrator.onNotification(test::tokenPurchase("0xBuyer", "5"));
  exec.advance(20ms);
  REQUIRE(vault.calls() == 3);
  REQUIRE(capture.contains("Tokens sold to 0xBuyer for amount: 5"));
}

TEST_CASE("JournalSyncTarget fails a call it cannot confirm", "[journal][timer]")
{
  ManualExecutor exec;
  exec.maxDelay = 1000ms;
  JournalSyncTarget target(exec, JournalConfig{"bnb-vault", "", 5000ms, 0});
  std::vector<sync::SyncOutcome> outcomes;

  target.updateBalance(sync::Quantity(900), collect(outcomes));
  REQUIRE(outcomes.size() == 1);
  REQUIRE_FALSE(outcomes[0].ok);
  REQUIRE(outcomes[0].error == "confirmation could not be scheduled");
  REQUIRE(exec.pendingTimers() == 0);
}
