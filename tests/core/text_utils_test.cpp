#include "core/text_utils.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace core = batchexec::core;

TEST_CASE("TrimPattern strips one leading and one trailing match", "[core][text]") {
  std::string out;
  std::string error;

  REQUIRE(core::TrimPattern("  padded value \t", core::kWhitespacePattern, out, error));
  REQUIRE(out == "padded value");

  REQUIRE(core::TrimPattern("--x--y--", "-+", out, error));
  REQUIRE(out == "x--y");

  REQUIRE(core::TrimPattern("untouched", "\\s+", out, error));
  REQUIRE(out == "untouched");
}

TEST_CASE("TrimPattern rejects a pattern that does not compile", "[core][text]") {
  std::string out = "previous";
  std::string error;
  REQUIRE_FALSE(core::TrimPattern("text", "([", out, error));
  REQUIRE(error.find("invalid trim pattern") != std::string::npos);
}

TEST_CASE("TrimWhitespace trims both ends", "[core][text]") {
  REQUIRE(core::TrimWhitespace("\n  a b  \r\n") == "a b");
  REQUIRE(core::TrimWhitespace("   ").empty());
}

TEST_CASE("Truncate shortens long text with an ellipsis", "[core][text]") {
  REQUIRE(core::Truncate("short", 30) == "short");
  REQUIRE(core::Truncate("abcdefghij", 10) == "abcdefghij");
  REQUIRE(core::Truncate("abcdefghijk", 10) == "abcdefg...");
  REQUIRE(core::Truncate("abcdefghijk", 2) == "..");

  const std::string long_text(40, 'x');
  REQUIRE(core::Truncate(long_text).size() == core::kDefaultMaxLen);
}

TEST_CASE("StripCarriageReturns turns DOS records into lines", "[core][text]") {
  REQUIRE(core::StripCarriageReturns("one\r\ntwo\r\n") == "one\ntwo\n");
  REQUIRE(core::StripCarriageReturns("plain\n") == "plain\n");
  REQUIRE(core::StripCarriageReturns("\n\r") == "");
}

TEST_CASE("StripNulBytes and SplitWhitespace tokenize wide output", "[core][text]") {
  const std::string wide("a\0b c\0", 6);
  REQUIRE(core::StripNulBytes(wide) == "ab c");

  const std::vector<std::string> tokens = core::SplitWhitespace("  alpha\tbeta \n gamma ");
  REQUIRE(tokens == std::vector<std::string>{"alpha", "beta", "gamma"});
  REQUIRE(core::SplitWhitespace(" \t ").empty());
}

TEST_CASE("Tabulate orders columns and rows by the sort key", "[core][text]") {
  const std::vector<core::TableRecord> records = {
      {{"name", std::string("zeta")}, {"value", std::string("1")}, {"kind", std::string("any")}},
      {{"name", std::string("alpha")}, {"value", std::nullopt}, {"kind", std::string("bool")}},
  };

  const std::vector<std::string> lines = core::Tabulate(records, "name", 30);
  REQUIRE(lines.size() == 3U);
  REQUIRE(lines[0] == "name  kind value   ");
  REQUIRE(lines[1] == "alpha bool (undef) ");
  REQUIRE(lines[2] == "zeta  any  1       ");
}

TEST_CASE("Tabulate truncates wide cells and handles no records", "[core][text]") {
  REQUIRE(core::Tabulate({}).empty());

  const std::vector<core::TableRecord> records = {
      {{"name", std::string("abcdefghijkl")}},
  };
  const std::vector<std::string> lines = core::Tabulate(records, "name", 8);
  REQUIRE(lines.size() == 2U);
  REQUIRE(lines[1] == "abcde... ");
}
