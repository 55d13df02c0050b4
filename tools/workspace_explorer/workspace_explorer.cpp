//
// Workspace Explorer Tool
// Generates a demo monitoring workspace and prints project dashboards
//

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <random>
#include <sstream>
#include <string>

#include <arrow/compute/initialize.h>
#include <google/protobuf/stubs/common.h>

#include <epoch_frame/dataframe.h>
#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_frame/factory/index_factory.h>

#include <epoch_monitor/config/env_loader.h>
#include <epoch_monitor/config/logging.h>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/report/report.h>
#include <epoch_monitor/report/test_suite.h>
#include <epoch_monitor/units/builtin.h>
#include <epoch_monitor/workspace/workspace.h>

namespace fs = std::filesystem;
using namespace epoch_monitor;

struct ExplorerConfig {
    std::string workspace = "workspace";
    int generate_demo_days = 0;
    std::string project_id;
    bool dashboard = false;
    bool list = false;
    std::optional<std::string> from;
    std::optional<std::string> to;
};

void PrintUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  --workspace DIR         Workspace root (default: $EPOCH_MONITOR_WORKSPACE or ./workspace)\n"
              << "  --generate-demo N       Create a demo project with N days of reports and test suites\n"
              << "  --list                  List projects and their snapshots\n"
              << "  --project ID            Project to inspect\n"
              << "  --dashboard             Print the dashboard of --project\n"
              << "  --from ISO              Dashboard lower bound (default: project date_from)\n"
              << "  --to ISO                Dashboard upper bound (default: project date_to)\n"
              << "  --help                  Show this help\n";
}

ExplorerConfig ParseArgs(int argc, char* argv[]) {
    ExplorerConfig config;
    config.workspace = EPOCH_MONITOR_ENV(std::string{epoch_monitor::config::WORKSPACE_VAR});
    if (config.workspace.empty()) {
        config.workspace = "workspace";
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            exit(0);
        } else if (arg == "--workspace" && i + 1 < argc) {
            config.workspace = argv[++i];
        } else if (arg == "--generate-demo" && i + 1 < argc) {
            config.generate_demo_days = std::stoi(argv[++i]);
        } else if (arg == "--project" && i + 1 < argc) {
            config.project_id = argv[++i];
        } else if (arg == "--dashboard") {
            config.dashboard = true;
        } else if (arg == "--list") {
            config.list = true;
        } else if (arg == "--from" && i + 1 < argc) {
            config.from = argv[++i];
        } else if (arg == "--to" && i + 1 < argc) {
            config.to = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            exit(1);
        }
    }

    return config;
}

// Census-like batch: age and education-num drift upwards with the batch number.
epoch_frame::DataFrame MakeDemoBatch(std::mt19937& rng, size_t rows, double shift) {
    using namespace epoch_frame;
    static const std::vector<std::string> EDUCATION = {"Bachelors", "HS-grad", "Masters",
                                                       "Some-college", "Doctorate"};

    std::normal_distribution<double> age(38.0 + shift, 12.0);
    std::normal_distribution<double> educationNum(10.0 + shift / 4.0, 2.5);
    std::uniform_real_distribution<double> hours(20.0, 60.0);
    std::uniform_int_distribution<size_t> education(0, EDUCATION.size() - 1);

    std::vector<double> ages, educationNums, hoursPerWeek;
    std::vector<std::string> educations;
    for (size_t i = 0; i < rows; ++i) {
        ages.push_back(std::max(17.0, age(rng)));
        educationNums.push_back(std::clamp(educationNum(rng), 1.0, 16.0));
        hoursPerWeek.push_back(hours(rng));
        educations.push_back(EDUCATION[education(rng)]);
    }

    auto index = factory::index::from_range(0, static_cast<int64_t>(rows));
    return make_dataframe(index,
                          {factory::array::make_array(ages),
                           factory::array::make_array(educationNums),
                           factory::array::make_array(hoursPerWeek),
                           factory::array::make_array(educations)},
                          {"age", "education-num", "hours-per-week", "education"});
}

ColumnMapping DemoMapping() {
    ColumnMapping mapping;
    mapping.target = std::nullopt;
    mapping.prediction.clear();
    return mapping;
}

report::ReportBasePtr CreateReport(int day, Timestamp timestamp, const epoch_frame::DataFrame& reference,
                                   const epoch_frame::DataFrame& current) {
    auto dataQuality = std::make_unique<report::Report>(std::vector<units::CheckItem>{
        std::make_shared<units::DatasetSummaryMetric>(),
        std::make_shared<units::DatasetMissingValuesMetric>(),
        std::make_shared<units::ColumnSummaryMetric>("age"),
        std::make_shared<units::ColumnQuantileMetric>("age", 0.5),
        std::make_shared<units::ColumnSummaryMetric>("education-num"),
        std::make_shared<units::ColumnQuantileMetric>("education-num", 0.5)});
    dataQuality->SetMetadata("type", std::string{"data_quality"})
        .SetBatchSize("daily")
        .SetDatasetId("adult")
        .SetTimestamp(timestamp);
    if (day % 7 == 0) {
        dataQuality->AddTag("weekly");
    }
    dataQuality->Run(reference, current, DemoMapping());
    return dataQuality;
}

report::ReportBasePtr CreateTestSuite(Timestamp timestamp, const epoch_frame::DataFrame& reference,
                                      const epoch_frame::DataFrame& current) {
    auto stability = std::make_unique<report::TestSuite>(
        std::vector<units::CheckItem>{std::make_shared<units::DataStabilityTestPreset>()});
    stability->SetMetadata("type", std::string{"data_stability"}).SetTimestamp(timestamp);
    stability->Run(reference, current, DemoMapping());
    return stability;
}

dashboard::Project& CreateDemoProject(workspace::Workspace& ws) {
    using namespace dashboard;
    const ReportFilter dataQuality{.metadataValues = {{"type", std::string{"data_quality"}}}};

    Project project{.name = "Example Project",
                    .description = "Synthetic census batches, one per day"};
    project.AddPanel(std::make_shared<DashboardPanelCounter>(
        CounterPanelOptions{.title = "Census Income Dataset (Adult)"}));
    project.AddPanel(std::make_shared<DashboardPanelCounter>(CounterPanelOptions{
        .title = "Rows processed",
        .filter = dataQuality,
        .value = PanelValue{.unitType = "DatasetSummaryMetric",
                            .fieldPath = "current.number_of_rows"},
        .text = "rows",
        .agg = std::string{aggregations::SUM}}));
    project.AddPanel(std::make_shared<DashboardPanelPlot>(PlotPanelOptions{
        .title = "Dataset Quality",
        .filter = dataQuality,
        .values = {PanelValue{.unitType = "DatasetMissingValuesMetric",
                              .fieldPath = "current.share_of_missing_values",
                              .legend = "Missing Values Share"}}}));
    for (const std::string column : {"age", "education-num"}) {
        project.AddPanel(std::make_shared<DashboardPanelPlot>(PlotPanelOptions{
            .title = column + ": quantile=0.5",
            .filter = dataQuality,
            .values = {PanelValue{.unitType = "ColumnQuantileMetric",
                                  .unitArgs = {{"column_name", column}, {"quantile", 0.5}},
                                  .fieldPath = "current.value",
                                  .legend = "Quantile"}},
            .size = epoch_core::PanelSize::Half}));
    }
    return ws.AddProject(std::move(project));
}

void GenerateDemo(workspace::Workspace& ws, int days) {
    std::mt19937 rng(42);
    const auto reference = MakeDemoBatch(rng, 500, 0.0);
    auto& project = CreateDemoProject(ws);
    const auto start = Now();

    for (int day = 0; day < days; ++day) {
        const auto current = MakeDemoBatch(rng, 100, day * 0.5);
        const auto timestamp = start + std::chrono::days{day};
        ws.AddReport(project.id, *CreateReport(day, timestamp, reference, current));
        ws.AddReport(project.id, *CreateTestSuite(timestamp, reference, current));
    }
    std::cout << "✓ Created project " << project.name << " (" << project.id << ") with "
              << days * 2 << " snapshots\n";
}

void ListWorkspace(const workspace::Workspace& ws) {
    for (const auto* project : ws.ListProjects()) {
        const auto snapshots = ws.ListSnapshots(project->id);
        std::cout << project->id << "  " << project->name << "  (" << snapshots.size()
                  << " snapshots, " << project->panels.size() << " panels)\n";
        for (const auto& snapshot : snapshots) {
            std::cout << "    " << ToIsoString(snapshot.timestamp) << "  "
                      << KindPrefix(snapshot.kind) << "  " << snapshot.id << "\n";
        }
    }
}

void PrintDashboard(const proto::DashboardInfo& info) {
    std::cout << "=== " << info.name() << " ===\n";
    for (const auto& widget : info.widgets()) {
        std::cout << "\n[" << widget.id() << "] " << widget.title() << "\n";
        switch (widget.type()) {
        case proto::WIDGET_COUNTER:
            for (const auto& counter : widget.counters()) {
                std::cout << "  " << counter.label() << ": ";
                if (counter.has_decimal()) {
                    std::cout << counter.decimal();
                } else {
                    std::cout << counter.text();
                }
                std::cout << "\n";
            }
            break;
        case proto::WIDGET_PLOT:
            for (const auto& series : widget.series()) {
                std::cout << "  " << series.legend() << " (" << series.points_size() << " points)\n";
                for (const auto& point : series.points()) {
                    std::cout << "    " << point.timestamp() << "  " << point.value() << "\n";
                }
            }
            break;
        case proto::WIDGET_ERROR:
            std::cout << "  error: " << widget.text() << "\n";
            break;
        default:
            std::cout << "  " << widget.text() << "\n";
            break;
        }
    }
}

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    auto arrowComputeStatus = arrow::compute::Initialize();
    if (!arrowComputeStatus.ok()) {
        std::stringstream errorMsg;
        errorMsg << "arrow compute initialized failed: " << arrowComputeStatus;
        throw std::runtime_error(errorMsg.str());
    }

    auto config = ParseArgs(argc, argv);

    try {
        epoch_monitor::config::ConfigureLoggingFromEnv();
        workspace::Workspace ws(config.workspace);

        if (config.generate_demo_days > 0) {
            GenerateDemo(ws, config.generate_demo_days);
        }
        if (config.list) {
            ListWorkspace(ws);
        }
        if (config.dashboard) {
            if (config.project_id.empty()) {
                std::cerr << "--dashboard requires --project\n";
                return 1;
            }
            const auto aggregations = dashboard::CreateDefaultAggregationRegistry();
            PrintDashboard(ws.BuildDashboard(
                config.project_id, aggregations,
                config.from ? std::optional{TimestampFromString(*config.from)} : std::nullopt,
                config.to ? std::optional{TimestampFromString(*config.to)} : std::nullopt));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}
