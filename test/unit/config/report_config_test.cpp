/**
 * @file report_config_test.cpp
 * @brief Tests for declarative report configuration
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <epoch_monitor/config/report_config.h>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/report/test_suite.h>
#include <epoch_monitor/units/builtin.h>
#include <fstream>

#include "../common/temp_directory.h"
#include "../common/test_frames.h"

using namespace epoch_monitor;
using namespace epoch_monitor::test;
using Catch::Matchers::ContainsSubstring;

namespace {
constexpr auto QUALITY_YAML = R"(
kind: metric
metadata:
  type: data_quality
  version: 2
tags: [nightly]
batch_size: daily
dataset_id: adult
column_mapping:
  target: null
  prediction: null
items:
  - unit: ColumnQuantileMetric
    args: {column_name: age, quantile: 0.5}
  - preset: DataQualityPreset
    args: {columns: Numerical}
  - generator: ColumnSummaryGenerator
    args: {columns: Numerical}
)";

constexpr auto STABILITY_YAML = R"(
kind: test
column_mapping: {target: null, prediction: null}
items:
  - unit: ShareOfMissingValuesTest
    args: {lt: 0.5}
  - preset: DataStabilityTestPreset
)";
}  // namespace

TEST_CASE("ReportConfig - Parsing", "[config]") {
    const auto parsed = config::ReportConfigFromYAML(QUALITY_YAML);

    REQUIRE(parsed.kind == epoch_core::UnitKind::Metric);
    REQUIRE(std::get<std::string>(parsed.metadata.at("type")) == "data_quality");
    REQUIRE(std::get<double>(parsed.metadata.at("version")) == 2.0);
    REQUIRE(parsed.tags == Tags{"nightly"});
    REQUIRE(parsed.batchSize == "daily");
    REQUIRE(parsed.datasetId == "adult");
    REQUIRE_FALSE(parsed.modelId);
    REQUIRE_FALSE(parsed.columnMapping.target);
    REQUIRE(parsed.columnMapping.prediction.empty());

    REQUIRE(parsed.items.size() == 3);
    REQUIRE(parsed.items[0].type == epoch_core::ItemConfigType::Unit);
    REQUIRE(parsed.items[0].name == "ColumnQuantileMetric");
    REQUIRE(parsed.items[0].args.at("quantile").GetDecimal() == 0.5);
    REQUIRE(parsed.items[1].type == epoch_core::ItemConfigType::Preset);
    REQUIRE(parsed.items[2].type == epoch_core::ItemConfigType::Generator);

    SECTION("From a file") {
        TempDirectory dir;
        const auto path = dir / "quality.yaml";
        std::ofstream(path) << QUALITY_YAML;
        REQUIRE(config::LoadReportConfig(path).items.size() == 3);
    }
}

TEST_CASE("ReportConfig - Malformed documents", "[config]") {
    SECTION("An item names exactly one of unit, preset or generator") {
        REQUIRE_THROWS_AS(config::ReportConfigFromYAML("items:\n  - unit: A\n    preset: B\n"), ConfigurationError);
        REQUIRE_THROWS_AS(config::ReportConfigFromYAML("items:\n  - args: {x: 1}\n"), ConfigurationError);
        REQUIRE_THROWS_AS(config::ReportConfigFromYAML("items:\n  - DatasetSummaryMetric\n"), ConfigurationError);
    }

    SECTION("Unknown kind") {
        try {
            (void)config::ReportConfigFromYAML("kind: profile\n");
            FAIL("Should have thrown");
        } catch (const ConfigurationError& e) {
            REQUIRE_THAT(e.what(), ContainsSubstring("profile"));
        }
    }

    SECTION("Invalid YAML") {
        REQUIRE_THROWS_AS(config::ReportConfigFromYAML("items: [unit: {"), ConfigurationError);
    }

    SECTION("Missing file") {
        TempDirectory dir;
        REQUIRE_THROWS_AS(config::LoadReportConfig(dir / "absent.yaml"), ConfigurationError);
    }
}

TEST_CASE("ReportConfig - BuildReport", "[config]") {
    const auto unitRegistry = units::CreateDefaultUnitRegistry();
    const auto itemRegistry = units::CreateDefaultItemFactoryRegistry();

    SECTION("Metric report with metadata applied") {
        const auto parsed = config::ReportConfigFromYAML(QUALITY_YAML);
        auto built = config::BuildReport(parsed, unitRegistry, itemRegistry);
        REQUIRE(built->GetKind() == epoch_core::UnitKind::Metric);
        REQUIRE(std::get<std::string>(built->GetMetadata().at("batch_size")) == "daily");
        REQUIRE(std::get<std::string>(built->GetMetadata().at("dataset_id")) == "adult");
        REQUIRE(built->GetTags() == Tags{"nightly"});

        built->Run(CreateReferenceFrame(), CreateCurrentFrame(), parsed.columnMapping);
        // 1 quantile, 2 dataset metrics + 2 column summaries, 2 column summaries.
        REQUIRE(built->GetFirstLevelIndices().size() == 7);
    }

    SECTION("Test suite") {
        const auto parsed = config::ReportConfigFromYAML(STABILITY_YAML);
        auto built = config::BuildReport(parsed, unitRegistry, itemRegistry);
        const auto* stability = dynamic_cast<const report::TestSuite*>(built.get());
        REQUIRE(stability != nullptr);

        built->Run(CreateReferenceFrame(), CreateCurrentFrame(), parsed.columnMapping);
        REQUIRE(stability->GetSummary().totalTests == 4);
    }

    SECTION("Unknown names") {
        REQUIRE_THROWS_AS(config::BuildReport(config::ReportConfigFromYAML("items:\n  - unit: RetiredMetric\n"),
                                              unitRegistry, itemRegistry),
                          ConfigurationError);
        REQUIRE_THROWS_AS(config::BuildReport(config::ReportConfigFromYAML("items:\n  - preset: RetiredPreset\n"),
                                              unitRegistry, itemRegistry),
                          ConfigurationError);
    }

    SECTION("Invalid unit arguments") {
        REQUIRE_THROWS_AS(
            config::BuildReport(config::ReportConfigFromYAML("items:\n  - unit: ColumnQuantileMetric\n    args: {column_name: age}\n"),
                                unitRegistry, itemRegistry),
            ConfigurationError);
        REQUIRE_THROWS_AS(
            config::BuildReport(config::ReportConfigFromYAML("items:\n  - generator: ColumnSummaryGenerator\n    args: {columns: Everything}\n"),
                                unitRegistry, itemRegistry),
            ConfigurationError);
    }
}
