//
// Unit tests for column mapping and data definition
//

#include <catch2/catch_test_macros.hpp>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/data/input_data.h>

#include "../common/test_frames.h"

using namespace epoch_monitor;
using namespace epoch_monitor::test;

TEST_CASE("ProcessColumns - Feature inference", "[input_data]") {
    const auto current = MakeFrame({{"age", {30.0, 40.0}},
                                    {"target", {0.0, 1.0}},
                                    {"prediction", {0.2, 0.9}}},
                                   {{"education", {"HS-grad", "Masters"}}});

    SECTION("Default mapping separates utility columns") {
        const auto columns = ProcessColumns(current, ColumnMapping{});
        REQUIRE(columns.target == "target");
        REQUIRE(columns.prediction == std::vector<std::string>{"prediction"});
        REQUIRE(columns.numericalFeatures == std::vector<std::string>{"age"});
        REQUIRE(columns.categoricalFeatures == std::vector<std::string>{"education"});
        REQUIRE(columns.AllFeatures() == std::vector<std::string>{"age", "education"});
    }

    SECTION("Absent target and prediction become features") {
        ColumnMapping mapping;
        mapping.target = std::nullopt;
        mapping.prediction.clear();
        const auto columns = ProcessColumns(current, mapping);
        REQUIRE_FALSE(columns.target.has_value());
        REQUIRE(columns.numericalFeatures == std::vector<std::string>{"age", "target", "prediction"});
    }

    SECTION("Explicit feature lists win over inference") {
        ColumnMapping mapping;
        mapping.numericalFeatures = std::vector<std::string>{};
        mapping.categoricalFeatures = std::vector<std::string>{"age", "education"};
        const auto columns = ProcessColumns(current, mapping);
        REQUIRE(columns.numericalFeatures.empty());
        REQUIRE(columns.categoricalFeatures == std::vector<std::string>{"age", "education"});
    }

    SECTION("Mapped column missing from the data") {
        ColumnMapping mapping;
        mapping.numericalFeatures = std::vector<std::string>{"income"};
        REQUIRE_THROWS_AS(ProcessColumns(current, mapping), ConfigurationError);

        ColumnMapping datetime;
        datetime.datetime = "ts";
        REQUIRE_THROWS_AS(ProcessColumns(current, datetime), ConfigurationError);
    }
}

TEST_CASE("CreateDataDefinition - Row counts", "[input_data]") {
    const auto reference = CreateReferenceFrame();
    const auto current = CreateCurrentFrame();

    const auto withReference = CreateDataDefinition(reference, current, ColumnMapping{});
    REQUIRE(withReference.referencePresent);
    REQUIRE(withReference.currentRows == 4);
    REQUIRE(withReference.referenceRows == 5);

    const auto currentOnly = CreateDataDefinition(std::nullopt, current, ColumnMapping{});
    REQUIRE_FALSE(currentOnly.referencePresent);
    REQUIRE_FALSE(currentOnly.referenceRows.has_value());
}

TEST_CASE("ColumnMapping - YAML decoding", "[input_data][yaml]") {
    const auto mapping = YAML::Load(R"(
target: income
prediction: [p1, p2]
numerical_features: [age]
task: Classification
)").as<ColumnMapping>();

    REQUIRE(mapping.target == "income");
    REQUIRE(mapping.prediction == std::vector<std::string>{"p1", "p2"});
    REQUIRE(mapping.numericalFeatures == std::vector<std::string>{"age"});
    REQUIRE_FALSE(mapping.categoricalFeatures.has_value());
    REQUIRE(mapping.task == epoch_core::TaskType::Classification);

    const auto noTarget = YAML::Load("{target: null, prediction: null}").as<ColumnMapping>();
    REQUIRE_FALSE(noTarget.target.has_value());
    REQUIRE(noTarget.prediction.empty());
}
