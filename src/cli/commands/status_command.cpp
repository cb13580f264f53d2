#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <ctime>
#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <hastat/cli/command.h>
#include <hastat/cli/hastat_cli.h>
#include <hastat/cli/ui_helpers.hpp>
#include <hastat/common/number_format.h>
#include <hastat/metadata/recorder_store.h>

namespace hastat::cli {

using json = nlohmann::json;

namespace {

std::string localNow() {
    std::time_t now = std::time(nullptr);
    std::tm tm = {};
    localtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S %Z");
    return oss.str();
}

double toMegabytes(int64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Summarize database tables: rows, columns, records and estimated size";
    }

    void registerCommand(CLI::App& app, HastatCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto db = cli_->ensureDatabase(metadata::ConnectionMode::ReadOnly);
        if (!db) {
            return db.error();
        }

        metadata::RecorderStore store(*db.value());
        auto summaries = store.tableSummaries();
        if (!summaries) {
            return summaries.error();
        }

        int64_t totalRecords = 0;
        int64_t totalBytes = 0;
        for (const auto& table : summaries.value()) {
            totalRecords += table.records();
            totalBytes += table.estimatedBytes();
        }

        const auto& observed = cli_->getSchemaCheck().observedVersion;
        std::string schema = observed ? std::to_string(*observed) : "unknown";

        auto percentOf = [&](int64_t records) {
            return totalRecords ? static_cast<double>(records) * 100.0 / totalRecords : 0.0;
        };

        if (cli_->getJsonOutput()) {
            json out;
            out["dialect"] = "sqlite";
            out["schema_version"] = observed ? json(*observed) : json(nullptr);
            out["tables"] = json::array();
            for (const auto& table : summaries.value()) {
                out["tables"].push_back({{"name", table.name},
                                         {"rows", table.rows},
                                         {"cols", table.columns},
                                         {"records", table.records()},
                                         {"percent", percentOf(table.records())},
                                         {"bytes", table.estimatedBytes()}});
            }
            out["total_records"] = totalRecords;
            out["total_bytes"] = totalBytes;
            std::cout << out.dump(2) << std::endl;
            return {};
        }

        std::cout << "Database type: sqlite, schema " << schema << "\n";
        std::cout << "Time: " << localNow() << "\n";
        std::cout << ui::horizontal_rule() << "\n";

        ui::Table table;
        table.headers = {"Table", "Rows", "Cols", "Records", "% total", "~ MB"};
        table.align = {ui::Align::Left,  ui::Align::Right, ui::Align::Right,
                       ui::Align::Right, ui::Align::Right, ui::Align::Right};
        for (const auto& summary : summaries.value()) {
            table.add_row({summary.name, std::to_string(summary.rows),
                           std::to_string(summary.columns), std::to_string(summary.records()),
                           std::format("{:.1f}%", percentOf(summary.records())),
                           std::format("{:.1f}", toMegabytes(summary.estimatedBytes()))});
        }
        ui::render_table(std::cout, table);

        std::cout << ui::horizontal_rule() << "\n";
        std::cout << "TOTAL RECORDS: " << common::formatThousands(totalRecords) << "\n";
        std::cout << std::format("TOTAL SIZE: {:.2f} MB", toMegabytes(totalBytes)) << "\n";
        return {};
    }

private:
    HastatCLI* cli_ = nullptr;
};

// Factory function
std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace hastat::cli
