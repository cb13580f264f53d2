#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <iostream>
#include <hastat/cli/command.h>
#include <hastat/cli/hastat_cli.h>
#include <hastat/cli/time_parser.h>
#include <hastat/cli/ui_helpers.hpp>
#include <hastat/common/csv.h>
#include <hastat/metadata/recorder_store.h>

namespace hastat::cli {

using json = nlohmann::json;

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override {
        return "List entities with row count, first/last sample, estimated KB and unit";
    }

    void registerCommand(CLI::App& app, HastatCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--sort", sortBy_, "Sort results by this column")
            ->check(CLI::IsMember({"count", "first", "last", "kb"}));
        cmd->add_flag("--reverse", reverse_, "Reverse sort order");
        cmd->add_flag("--csv", csvOutput_, "Output in CSV format");
        cmd->add_option("--after", after_,
                        "Only consider samples starting at or after this time (e.g. 2024-01-01, 7d)");
        cmd->add_option("--before", before_,
                        "Only consider samples starting at or before this time");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        metadata::TimeRange range;
        if (!after_.empty()) {
            auto ts = TimeParser::parseEpochSeconds(after_);
            if (!ts)
                return ts.error();
            range.after = ts.value();
        }
        if (!before_.empty()) {
            auto ts = TimeParser::parseEpochSeconds(before_);
            if (!ts)
                return ts.error();
            range.before = ts.value();
        }

        auto db = cli_->ensureDatabase(metadata::ConnectionMode::ReadOnly);
        if (!db) {
            return db.error();
        }

        metadata::RecorderStore store(*db.value());
        auto summaries = store.entitySummaries(range);
        if (!summaries) {
            return summaries.error();
        }
        auto entities = std::move(summaries).value();
        sortEntities(entities);

        if (cli_->getJsonOutput()) {
            json out = json::array();
            for (const auto& e : entities) {
                out.push_back({{"entity", e.statisticId},
                               {"metadata_id", e.metadataId},
                               {"count", e.count},
                               {"first", formatDate(e.firstStartTs)},
                               {"last", formatDate(e.lastStartTs)},
                               {"kb", e.estimatedKb},
                               {"unit", e.unit}});
            }
            std::cout << out.dump(2) << std::endl;
            return {};
        }

        const std::vector<std::string> headers = {"Entity", "Count", "First",
                                                  "Last",   "~ KB",  "Unit"};
        std::vector<std::vector<std::string>> rows;
        rows.reserve(entities.size());
        for (const auto& e : entities) {
            rows.push_back({e.statisticId, std::to_string(e.count), formatDate(e.firstStartTs),
                            formatDate(e.lastStartTs), std::format("{:.1f}", e.estimatedKb),
                            e.unit});
        }

        if (csvOutput_) {
            common::CsvWriter writer(std::cout);
            writer.writeRow(headers);
            for (const auto& row : rows) {
                writer.writeRow(row);
            }
            return {};
        }

        ui::Table table;
        table.headers = headers;
        table.rows = std::move(rows);
        table.align = {ui::Align::Left, ui::Align::Right, ui::Align::Left,
                       ui::Align::Left, ui::Align::Right, ui::Align::Left};
        ui::render_table(std::cout, table);
        return {};
    }

private:
    HastatCLI* cli_ = nullptr;
    std::string sortBy_;
    bool reverse_ = false;
    bool csvOutput_ = false;
    std::string after_;
    std::string before_;

    static std::string formatDate(const std::optional<double>& ts) {
        return ts ? TimeParser::formatTimestamp(*ts) : std::string{};
    }

    // Without --sort the store's metadata_id order is kept
    void sortEntities(std::vector<metadata::EntitySummary>& entities) const {
        if (sortBy_.empty())
            return;

        auto key = [this](const metadata::EntitySummary& e) -> double {
            if (sortBy_ == "count")
                return static_cast<double>(e.count);
            if (sortBy_ == "first")
                return e.firstStartTs.value_or(0.0);
            if (sortBy_ == "last")
                return e.lastStartTs.value_or(0.0);
            return e.estimatedKb;
        };
        std::stable_sort(entities.begin(), entities.end(),
                         [&](const auto& a, const auto& b) {
                             return reverse_ ? key(a) > key(b) : key(a) < key(b);
                         });
    }
};

// Factory function
std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace hastat::cli
