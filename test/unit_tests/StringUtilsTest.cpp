#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace tether;

TEST_CASE("split keeps empty fields between delimiters", "[StringUtils]") {
  REQUIRE(split("a,b,,c", ',') == vector<string>{"a", "b", "", "c"});
  REQUIRE(split("", ',').empty());
  REQUIRE(split("solo", ',') == vector<string>{"solo"});
}

TEST_CASE("splitWhitespace drops runs of blanks", "[StringUtils]") {
  REQUIRE(splitWhitespace("  claude \t -p\nhello  ") ==
          vector<string>{"claude", "-p", "hello"});
  REQUIRE(splitWhitespace(" \t\n").empty());
}

TEST_CASE("trim strips surrounding whitespace", "[StringUtils]") {
  REQUIRE(trim("  echo hi \r\n") == "echo hi");
  REQUIRE(trim("\t\t") == "");
  REQUIRE(trim("inner  space") == "inner  space");
}

TEST_CASE("startsWith and toLower", "[StringUtils]") {
  REQUIRE(startsWith("git status", "git "));
  REQUIRE_FALSE(startsWith("gi", "git"));
  REQUIRE(startsWith("anything", ""));
  REQUIRE(toLower("ConTinue") == "continue");
}

TEST_CASE("constantTimeEquals compares secrets", "[StringUtils]") {
  REQUIRE(constantTimeEquals("s3cret", "s3cret"));
  REQUIRE_FALSE(constantTimeEquals("s3cret", "s3creT"));
  REQUIRE_FALSE(constantTimeEquals("s3cret", "s3cre"));
  REQUIRE(constantTimeEquals("", ""));
}

TEST_CASE("genRandomAlphaNum produces distinct alphanumeric tokens",
          "[StringUtils]") {
  string first = genRandomAlphaNum(32);
  string second = genRandomAlphaNum(32);
  REQUIRE(first.size() == 32);
  REQUIRE(first != second);
  REQUIRE(all_of(first.begin(), first.end(),
                 [](unsigned char c) { return isalnum(c) != 0; }));
}
