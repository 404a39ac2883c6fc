#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include <ringout/text_fields.hpp>

using namespace ringout;

TEST_CASE("Fields are trimmed and split on commas") {
  REQUIRE(trim("  a b \t\r") == "a b");
  REQUIRE(trim("   ").empty());
  REQUIRE(lower("Stepped") == "stepped");
  REQUIRE(split_csv_line(" f, 1 ,,x ") == std::vector<std::string>{"f", "1", "", "x"});
}

TEST_CASE("Numeric fields must be consumed whole") {
  bool ok = false;
  REQUIRE(to_double_safe("0x1.8p+1", ok) == 3.0);
  REQUIRE(ok);
  to_double_safe("1.5abc", ok);
  REQUIRE_FALSE(ok);
  to_double_safe("", ok);
  REQUIRE_FALSE(ok);

  REQUIRE(to_int_safe("-127", ok) == -127);
  REQUIRE(ok);
  to_int_safe("12.5", ok);
  REQUIRE_FALSE(ok);
  to_int_safe("99999999999999999999999", ok);
  REQUIRE_FALSE(ok);

  REQUIRE(to_u64_safe("ff", ok, 16) == 255u);
  REQUIRE(ok);
  to_u64_safe("-1", ok);
  REQUIRE_FALSE(ok);
}
