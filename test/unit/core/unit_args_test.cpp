//
// Unit tests for ArgValue, UnitArgs and UnitIdentity
//

#include <catch2/catch_test_macros.hpp>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/core/unit_identity.h>
#include <cmath>
#include <limits>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

using namespace epoch_monitor;

TEST_CASE("ArgValue - Construction and access", "[unit_args]") {
    SECTION("Integers are stored as decimals") {
        ArgValue val(3);
        REQUIRE(val.IsType<double>());
        REQUIRE(val.GetInteger() == 3);
        REQUIRE(val == ArgValue(3.0));
    }

    SECTION("String literals stay strings") {
        ArgValue val("age");
        REQUIRE(val.IsType<std::string>());
        REQUIRE(val.GetString() == "age");
    }

    SECTION("Default value is null") {
        REQUIRE(ArgValue{}.IsNull());
        REQUIRE(ArgValue{}.ToString() == "null");
    }

    SECTION("Wrong accessor throws ConfigurationError") {
        ArgValue val(true);
        REQUIRE_THROWS_AS(val.GetString(), ConfigurationError);
        REQUIRE_THROWS_AS(val.GetDecimal(), ConfigurationError);
    }

    SECTION("Negative zero is stored as zero") {
        ArgValue val(-0.0);
        REQUIRE(val == ArgValue(0.0));
        REQUIRE(val.ToString() == ArgValue(0.0).ToString());
        REQUIRE_FALSE(std::signbit(val.GetDecimal()));
    }

    SECTION("NaN is rejected") {
        REQUIRE_THROWS_AS(ArgValue(std::numeric_limits<double>::quiet_NaN()), ConfigurationError);
        REQUIRE_THROWS_AS(UnitArgsFromYAML(YAML::Load("lt: .nan")), ConfigurationError);
    }

    SECTION("Find resolves dotted paths through mappings") {
        ArgValue val(ArgMapping{{"column", ArgMapping{{"name", "age"}}}});
        REQUIRE(val.Find("column.name") != nullptr);
        REQUIRE(val.Find("column.name")->GetString() == "age");
        REQUIRE(val.Find("column.type") == nullptr);
        REQUIRE(val.Find("column.name.extra") == nullptr);
    }
}

TEST_CASE("UnitArgs - Canonical text", "[unit_args]") {
    SECTION("Mapping keys print sorted regardless of insertion order") {
        UnitArgs a;
        a.emplace("quantile", 0.5);
        a.emplace("column_name", "age");
        UnitArgs b;
        b.emplace("column_name", "age");
        b.emplace("quantile", 0.5);
        REQUIRE(ToCanonicalString(a) == ToCanonicalString(b));
        REQUIRE(ToCanonicalString(a) == R"({"column_name":"age","quantile":0.5})");
    }

    SECTION("Sequences keep their order") {
        UnitArgs args{{"columns", std::vector<std::string>{"b", "a"}}};
        REQUIRE(ToCanonicalString(args) == R"({"columns":["b","a"]})");
    }
}

TEST_CASE("UnitArgs - Template matching", "[unit_args]") {
    const UnitArgs args{{"column_name", "age"},
                        {"quantile", 0.5},
                        {"options", ArgMapping{{"method", "linear"}}}};

    REQUIRE(MatchesTemplate(args, {}));
    REQUIRE(MatchesTemplate(args, {{"column_name", "age"}}));
    REQUIRE(MatchesTemplate(args, {{"options.method", "linear"}}));
    REQUIRE_FALSE(MatchesTemplate(args, {{"column_name", "hours"}}));
    REQUIRE_FALSE(MatchesTemplate(args, {{"missing", 1}}));
    REQUIRE_FALSE(MatchesTemplate(args, {{"options.method", "nearest"}}));
}

TEST_CASE("UnitArgs - YAML decoding", "[unit_args][yaml]") {
    const auto node = YAML::Load(R"(
column_name: age
quantile: 0.5
enabled: true
label: "42"
columns: [a, b]
)");
    const auto args = UnitArgsFromYAML(node);

    REQUIRE(args.at("column_name").GetString() == "age");
    REQUIRE(args.at("quantile").GetDecimal() == 0.5);
    REQUIRE(args.at("enabled").GetBoolean());
    REQUIRE(args.at("label").GetString() == "42");
    REQUIRE(args.at("columns").GetSequence().size() == 2);
}

TEST_CASE("UnitArgs - Generic conversion preserves values", "[unit_args]") {
    const UnitArgs args{{"column_name", "age"},
                        {"quantile", 0.25},
                        {"flags", ArgSequence{true, false}},
                        {"nested", ArgMapping{{"k", "v"}}}};
    REQUIRE(UnitArgsFromGeneric(ToGeneric(args)) == args);
}

TEST_CASE("UnitIdentity - Structural equality", "[unit_identity]") {
    const UnitIdentity a{"ColumnQuantileMetric", {{"column_name", "age"}, {"quantile", 0.5}}};
    const UnitIdentity b{"ColumnQuantileMetric", {{"quantile", 0.5}, {"column_name", "age"}}};
    const UnitIdentity c{"ColumnQuantileMetric", {{"column_name", "age"}, {"quantile", 0.75}}};
    const UnitIdentity d{"ColumnSummaryMetric", {{"column_name", "age"}, {"quantile", 0.5}}};

    REQUIRE(a == b);
    REQUIRE(std::hash<UnitIdentity>{}(a) == std::hash<UnitIdentity>{}(b));
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(a == d);

    std::unordered_set<UnitIdentity> identities{a, b, c, d};
    REQUIRE(identities.size() == 3);

    REQUIRE(a.ToString() == R"(ColumnQuantileMetric{"column_name":"age","quantile":0.5})");
    REQUIRE((a < c) != (c < a));

    SECTION("Signed zeros are one identity") {
        const UnitIdentity positive{"ShareOfMissingValuesTest", {{"lt", 0.0}}};
        const UnitIdentity negative{"ShareOfMissingValuesTest", {{"lt", -0.0}}};
        REQUIRE(positive == negative);
        REQUIRE(std::hash<UnitIdentity>{}(positive) == std::hash<UnitIdentity>{}(negative));
        REQUIRE_FALSE(positive < negative);
        REQUIRE_FALSE(negative < positive);
    }
}
