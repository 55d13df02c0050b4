/**
 * @file snapshot_store_test.cpp
 * @brief Tests for the snapshot directory store and time-series loading
 */

#include <catch2/catch_test_macros.hpp>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/storage/snapshot_store.h>
#include <epoch_monitor/units/builtin.h>
#include <fstream>

#include "../common/mock_units.h"
#include "../common/temp_directory.h"

using namespace epoch_monitor;
using namespace epoch_monitor::test;

namespace {
snapshot::Snapshot MetricSnapshot(const std::string& id, const std::string& date, double rows) {
    snapshot::Snapshot stored{.id = id, .timestamp = TimestampFromString(date), .kind = epoch_core::UnitKind::Metric};
    stored.units.push_back(snapshot::SnapshotUnit{.type = "DatasetSummaryMetric", .result = Result{MakePayload(rows)}});
    stored.units.push_back(snapshot::SnapshotUnit{.type = "ColumnSummaryMetric",
                                                  .args = {{"column_name", "age"}},
                                                  .result = Result{MakePayload(rows / 2)}});
    stored.firstLevelIndices = {0};
    return stored;
}

snapshot::Snapshot TestSnapshot(const std::string& id, const std::string& date) {
    snapshot::Snapshot stored{.id = id, .timestamp = TimestampFromString(date), .kind = epoch_core::UnitKind::Test};
    stored.units.push_back(snapshot::SnapshotUnit{
        .type = "ShareOfMissingValuesTest",
        .args = {{"lt", 0.1}},
        .result = Result{MakeTestPayload(epoch_core::TestStatus::Success, "missing share below 0.1")}});
    stored.firstLevelIndices = {0};
    return stored;
}

std::vector<std::string> Ids(const storage::SnapshotSeries& series) {
    std::vector<std::string> ids;
    for (const auto& [ts, stored] : series) {
        ids.push_back(stored.id);
    }
    return ids;
}
}  // namespace

TEST_CASE("SnapshotStore - Files", "[storage]") {
    TempDirectory dir;

    SECTION("A missing directory lists nothing") {
        storage::SnapshotStore store(dir / "absent");
        REQUIRE(store.ListFiles().empty());
        REQUIRE(store.LoadAll().empty());
        REQUIRE(store.LoadSeries().empty());
    }

    SECTION("Save, Contains and Load") {
        storage::SnapshotStore store(dir.Path());
        const auto stored = MetricSnapshot("b", "2024-01-02", 10.0);
        const auto path = store.Save(stored);
        REQUIRE(path == dir / "b.json");
        REQUIRE(store.Contains("b"));
        REQUIRE_FALSE(store.Contains("a"));
        REQUIRE(store.Load("b") == stored);
        REQUIRE_THROWS_AS(store.Load("a"), NotFoundError);
    }

    SECTION("Only json files are listed, sorted by name") {
        storage::SnapshotStore store(dir.Path());
        store.Save(MetricSnapshot("b", "2024-01-02", 1.0));
        store.Save(MetricSnapshot("a", "2024-01-03", 1.0));
        std::ofstream(dir / "notes.txt") << "not a snapshot";
        std::filesystem::create_directories(dir / "nested.json");

        const auto files = store.ListFiles();
        REQUIRE(files == std::vector<std::filesystem::path>{dir / "a.json", dir / "b.json"});
        REQUIRE(store.LoadAll().size() == 2);
    }

    SECTION("Snapshots need an id") {
        storage::SnapshotStore store(dir.Path());
        REQUIRE_THROWS_AS(store.Save(MetricSnapshot("", "2024-01-02", 1.0)), ConfigurationError);
    }

    SECTION("A corrupt file fails the whole load") {
        storage::SnapshotStore store(dir.Path());
        store.Save(MetricSnapshot("a", "2024-01-01", 1.0));
        std::ofstream(dir / "b.json") << "{\"id\": \"b\"";
        REQUIRE_THROWS_AS(store.LoadAll(), CorruptSnapshotError);
        REQUIRE_THROWS_AS(store.LoadSeries(), CorruptSnapshotError);
    }
}

TEST_CASE("SnapshotStore - LoadSeries", "[storage]") {
    TempDirectory dir;
    storage::SnapshotStore store(dir.Path());
    store.Save(MetricSnapshot("m1", "2024-01-01", 1.0));
    store.Save(MetricSnapshot("m2", "2024-01-02", 2.0));
    store.Save(MetricSnapshot("m3", "2024-01-03", 3.0));
    store.Save(TestSnapshot("t2", "2024-01-02T12:00:00"));

    SECTION("Unbounded query returns everything in time order") {
        REQUIRE(Ids(store.LoadSeries()) == std::vector<std::string>{"m1", "m2", "t2", "m3"});
    }

    SECTION("Bounds are inclusive") {
        const auto series = store.LoadSeries({.from = TimestampFromString("2024-01-02"),
                                              .to = TimestampFromString("2024-01-03")});
        REQUIRE(Ids(series) == std::vector<std::string>{"m2", "t2", "m3"});
    }

    SECTION("Equal bounds select a single instant") {
        const auto day = TimestampFromString("2024-01-02");
        REQUIRE(Ids(store.LoadSeries({.from = day, .to = day})) == std::vector<std::string>{"m2"});
    }

    SECTION("Inverted bounds select nothing") {
        REQUIRE(store.LoadSeries({.from = TimestampFromString("2024-01-03"),
                                  .to = TimestampFromString("2024-01-01")})
                    .empty());
    }

    SECTION("Kind filter") {
        REQUIRE(Ids(store.LoadSeries({.kind = epoch_core::UnitKind::Test})) == std::vector<std::string>{"t2"});
        REQUIRE(store.LoadSeries({.kind = epoch_core::UnitKind::Metric}).size() == 3);
    }

    SECTION("Last file in name order wins a timestamp collision") {
        store.Save(MetricSnapshot("m9", "2024-01-01", 9.0));
        const auto series = store.LoadSeries({.to = TimestampFromString("2024-01-01")});
        REQUIRE(Ids(series) == std::vector<std::string>{"m9"});
    }
}

TEST_CASE("SnapshotStore - LoadMetricTimeSeries", "[storage]") {
    TempDirectory dir;
    storage::SnapshotStore store(dir.Path());
    store.Save(MetricSnapshot("m1", "2024-01-01", 1.0));
    store.Save(MetricSnapshot("m2", "2024-01-02", 2.0));
    store.Save(TestSnapshot("t1", "2024-01-01T06:00:00"));
    const auto registry = units::CreateDefaultUnitRegistry();

    SECTION("Every first-level unit contributes") {
        const auto series = storage::LoadMetricTimeSeries(store, registry);
        REQUIRE(series.size() == 2);

        const auto& rows = series.at(UnitIdentity{"DatasetSummaryMetric", {}});
        REQUIRE(rows.size() == 2);
        REQUIRE(rows.at(TimestampFromString("2024-01-02")).GetNumber("current.value") == 2.0);
        REQUIRE(series.at(UnitIdentity{"ShareOfMissingValuesTest", {{"lt", 0.1}}}).size() == 1);
    }

    SECTION("A unit filter reaches dependencies") {
        const auto summary = std::make_shared<units::ColumnSummaryMetric>("age");
        const auto series = storage::LoadMetricTimeSeries(
            store, registry, {.kind = epoch_core::UnitKind::Metric}, {summary});
        REQUIRE(series.size() == 1);

        const auto& rows = series.at(summary->GetIdentity());
        REQUIRE(rows.size() == 2);
        REQUIRE(rows.at(TimestampFromString("2024-01-01")).GetNumber("current.value") == 0.5);
        REQUIRE(rows.at(TimestampFromString("2024-01-02")).GetNumber("current.value") == 1.0);
    }

    SECTION("Filtered units absent from every snapshot yield nothing") {
        const auto quantile = std::make_shared<units::ColumnQuantileMetric>("age", 0.5);
        REQUIRE(storage::LoadMetricTimeSeries(store, registry, {}, {quantile}).empty());
    }
}
