#include <vexlake/error.hpp>
#include <vexlake/error_mapping.hpp>
#include <catch2/catch_all.hpp>

#include <string>

TEST_CASE("error codes stable subset", "[errors]") {
  using vexlake::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::unavailable) == 7001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("only storage and publication races are transient", "[errors]") {
  using namespace vexlake::core;
  REQUIRE(is_transient(error_code::unavailable));
  REQUIRE(is_transient(error_code::conflict));
  REQUIRE_FALSE(is_transient(error_code::dimension_mismatch));
  REQUIRE_FALSE(is_transient(error_code::durability_failed));
  REQUIRE(std::string(to_string(error_code::not_found)) == "not_found");
}

TEST_CASE("C status mapping", "[errors][c_api]") {
  using namespace vexlake::core;
  REQUIRE(to_c_status(error_code::ok) == VEXLAKE_OK);
  REQUIRE(to_c_status(error_code::dimension_mismatch) == VEXLAKE_E_DIMENSION_MISMATCH);
  REQUIRE(to_c_status(error_code::not_found) == VEXLAKE_E_NOT_FOUND);
  REQUIRE(to_c_status(error_code::conflict) == VEXLAKE_E_UNAVAILABLE);
  REQUIRE(to_c_status(error_code::durability_failed) == VEXLAKE_E_DURABILITY);
}
