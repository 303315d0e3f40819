// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

namespace toml = vaultrelay::parsers::toml;

TEST_CASE("TOML scalars and tables", "[toml][parser]")
{
  auto doc = toml::parse(R"(
# top-level comment
title = "relay"          # trailing comment
literal = 'C:\path'
count = 1_000
negative = -42
ratio = 0.25
enabled = true

[connection]
endpoint = "wss://example.org/ws"
[connection.reconnect]
max_attempts = 5

[a."quoted key"]
value = "x"
dotted.inner = 7
)");

  SECTION("Scalars")
  {
    REQUIRE(doc.get("title").as<std::string>().value() == "relay");
    REQUIRE(doc.get("literal").as<std::string>().value() == "C:\\path");
    REQUIRE(doc.get("count").as<std::int64_t>().value() == 1000);
    REQUIRE(doc.get("negative").as<std::int64_t>().value() == -42);
    REQUIRE(doc.get("ratio").as<double>().value() == Approx(0.25));
    REQUIRE(doc.get("enabled").as<bool>().value());
  }

  SECTION("Integers convert to double, nothing else converts")
  {
    REQUIRE(doc.get("count").as<double>().value() == Approx(1000.0));
    REQUIRE_FALSE(doc.get("title").as<std::int64_t>().has_value());
    REQUIRE_FALSE(doc.get("enabled").as<std::string>().has_value());
  }

  SECTION("Nested tables and dotted paths")
  {
    REQUIRE(doc.at_path("connection.endpoint").as<std::string>().value() ==
            "wss://example.org/ws");
    REQUIRE(doc.at_path("connection.reconnect.max_attempts").as<std::int64_t>().value() == 5);
    REQUIRE(doc.at_path("a.quoted key.value").as<std::string>().value() == "x");
    REQUIRE(doc.at_path("a.quoted key.dotted.inner").as<std::int64_t>().value() == 7);
    REQUIRE_FALSE(doc.at_path("connection.missing"));
    REQUIRE_FALSE(doc.at_path("title.nested"));
  }
}

TEST_CASE("TOML arrays and arrays of tables", "[toml][parser]")
{
  auto doc = toml::parse(R"(
targets = ["bnb-vault", "eth-vault",]
matrix = [
  [1, 2],
  [3],
]

[[frame]]
at_ms = 100
name = "SaleDateUpdated"

[[frame]]
at_ms = 200
kind = "close"
)");

  const auto *targets = doc.get("targets").as_array();
  REQUIRE(targets != nullptr);
  REQUIRE(targets->size() == 2);
  REQUIRE((*targets)[1].as<std::string>().value() == "eth-vault");

  const auto *matrix = doc.get("matrix").as_array();
  REQUIRE(matrix != nullptr);
  REQUIRE(matrix->size() == 2);
  REQUIRE((*matrix)[0].as_array()->size() == 2);

  const auto *frames = doc.get("frame").as_array();
  REQUIRE(frames != nullptr);
  REQUIRE(frames->size() == 2);
  REQUIRE((*frames)[0].as_table()->get("at_ms").as<std::int64_t>().value() == 100);
  REQUIRE((*frames)[1].as_table()->get("kind").as<std::string>().value() == "close");
}

TEST_CASE("TOML errors carry a position", "[toml][errors]")
{
  SECTION("Duplicate keys")
  {
    REQUIRE_THROWS_AS(toml::parse("a = 1\na = 2\n"), toml::parse_error);
  }

  SECTION("Garbage after a value")
  {
    try
    {
      toml::parse("ok = 1\nbad = 2 3\n");
      FAIL("expected a parse error");
    }
    catch (const toml::parse_error &e)
    {
      REQUIRE(e.line() == 2);
    }
  }

  SECTION("Unterminated string")
  {
    REQUIRE_THROWS_AS(toml::parse("s = \"open\n"), toml::parse_error);
  }

  SECTION("Value redefined as a table")
  {
    REQUIRE_THROWS_AS(toml::parse("a = 1\n[a]\nb = 2\n"), toml::parse_error);
  }

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(toml::parse_file("/nonexistent/vaultrelay.toml"), std::runtime_error);
  }
}
