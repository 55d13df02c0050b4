//
// Unit tests for Result field access
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/core/result.h>

using namespace epoch_monitor;

namespace {
Result MakeResult() {
    glz::generic payload;
    auto ec = glz::read_json(payload, std::string{R"({
        "column_name": "age",
        "current": {"value": 41.5, "flag": true, "label": "x"},
        "bins": [{"count": 3}, {"count": 5}]
    })"});
    if (ec) {
        throw std::runtime_error(glz::format_error(ec, ""));
    }
    return Result{std::move(payload)};
}
}  // namespace

TEST_CASE("Result - Path lookup", "[result]") {
    const auto result = MakeResult();

    SECTION("Nested objects") {
        REQUIRE(result.GetNumber("current.value") == 41.5);
        REQUIRE(result.Get("column_name").get_string() == "age");
    }

    SECTION("Numeric segments index arrays") {
        REQUIRE(result.GetNumber("bins.1.count") == 5.0);
        REQUIRE_FALSE(result.Contains("bins.2.count"));
        REQUIRE_FALSE(result.Contains("bins.first.count"));
    }

    SECTION("Booleans read as numbers") {
        REQUIRE(result.GetNumber("current.flag") == 1.0);
    }

    SECTION("Missing field names the full path") {
        REQUIRE_FALSE(result.Contains("current.missing"));
        try {
            (void)result.Get("current.missing.deeper");
            FAIL("Should have thrown");
        } catch (const FieldNotFoundError& e) {
            REQUIRE(e.Path() == "current.missing.deeper");
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("missing"));
        }
    }

    SECTION("Non-numeric field is not a number") {
        REQUIRE_THROWS_AS(result.GetNumber("current.label"), FieldNotFoundError);
    }

    SECTION("Walking through a scalar fails") {
        REQUIRE_THROWS_AS(result.Get("column_name.length"), FieldNotFoundError);
    }
}

TEST_CASE("Result - Test status", "[result]") {
    SECTION("Metric results have no status") {
        REQUIRE(MakeResult().GetStatus() == epoch_core::TestStatus::Null);
    }

    SECTION("Test payload carries status and description") {
        const Result result{MakeTestPayload(epoch_core::TestStatus::Fail, "too many missing values")};
        REQUIRE(result.GetStatus() == epoch_core::TestStatus::Fail);
        REQUIRE(result.Get("description").get_string() == "too many missing values");
        REQUIRE_FALSE(result.Contains("parameters"));
    }

    SECTION("Parameters are kept when given") {
        glz::generic parameters;
        parameters.data = glz::generic::object_t{};
        parameters["lt"] = 0.1;
        const Result result{MakeTestPayload(epoch_core::TestStatus::Success, "ok", parameters)};
        REQUIRE(result.GetNumber("parameters.lt") == 0.1);
    }
}

TEST_CASE("Result - Equality follows JSON text", "[result]") {
    REQUIRE(MakeResult() == MakeResult());
    REQUIRE_FALSE(MakeResult() == Result{MakeTestPayload(epoch_core::TestStatus::Success, "ok")});
}
