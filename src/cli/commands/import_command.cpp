#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <hastat/cli/command.h>
#include <hastat/cli/hastat_cli.h>
#include <hastat/cli/ui_helpers.hpp>
#include <hastat/import/import_service.h>

namespace hastat::cli {

using json = nlohmann::json;

namespace {

json reportToJson(const importer::ImportReport& report) {
    json out;
    out["mode"] = report.mode == importer::ExecutionMode::DryRun ? "dry-run" : "apply";
    out["rows_read"] = report.rowsRead;
    out["inserts"] = report.inserts;
    out["updates"] = report.updates;
    out["deletes"] = report.deletes;
    out["skipped"] = report.skipped;
    out["inserted_ids"] = report.insertedIds;

    json byKind = json::object();
    for (const auto& [kind, count] : report.invalidByKind) {
        byKind[std::string(importer::validationKindName(kind))] = count;
    }
    json invalidRows = json::array();
    for (const auto& issue : report.invalidRows) {
        invalidRows.push_back({{"line", issue.line},
                               {"kind", std::string(importer::validationKindName(issue.kind))},
                               {"field", issue.field},
                               {"message", issue.message}});
    }
    out["invalid"] = {{"total", report.invalid}, {"by_kind", byKind}, {"rows", invalidRows}};

    json conflicts = json::array();
    for (const auto& conflict : report.conflicts) {
        conflicts.push_back({{"table", std::string(metadata::tableName(conflict.table))},
                             {"id", conflict.id},
                             {"overridden_line", conflict.overriddenLine},
                             {"winning_line", conflict.winningLine}});
    }
    out["conflicts"] = conflicts;

    if (report.mode == importer::ExecutionMode::DryRun) {
        out["statements"] = report.statements;
    }
    out["schema_version"] =
        report.schema.observedVersion ? json(*report.schema.observedVersion) : json(nullptr);
    if (report.schema.warning) {
        out["schema_warning"] = *report.schema.warning;
    }
    return out;
}

} // namespace

class ImportCommand : public ICommand {
public:
    std::string getName() const override { return "import"; }

    std::string getDescription() const override {
        return "Import CSV rows: insert rows without id, update or delete rows with id";
    }

    void registerCommand(CLI::App& app, HastatCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("file", csvPath_, "CSV file in export format ('-' reads stdin)")
            ->required();
        cmd->add_flag("--dry-run", dryRun_,
                      "Print the SQL that would be executed without modifying the database");
        cmd->add_flag("--per-table", perTable_,
                      "Commit each table in its own transaction instead of one for the run");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        importer::ImportOptions options;
        options.mode = dryRun_ ? importer::ExecutionMode::DryRun : importer::ExecutionMode::Apply;
        options.scope = resolveScope();

        std::ifstream file;
        if (csvPath_ != "-") {
            file.open(csvPath_, std::ios::in | std::ios::binary);
            if (!file) {
                return Error{ErrorCode::FileNotFound, "Cannot open CSV file: " + csvPath_};
            }
        }
        std::istream& in = csvPath_ == "-" ? std::cin : file;

        auto db = cli_->ensureDatabase(metadata::ConnectionMode::ReadWrite);
        if (!db) {
            return db.error();
        }

        importer::ImportService service(*db.value());
        auto report = service.run(in, options);
        if (!report) {
            return report.error();
        }

        if (cli_->getJsonOutput()) {
            std::cout << reportToJson(report.value()).dump(2) << std::endl;
            return {};
        }
        printReport(report.value());
        return {};
    }

private:
    HastatCLI* cli_ = nullptr;
    std::string csvPath_;
    bool dryRun_ = false;
    bool perTable_ = false;

    importer::TransactionScope resolveScope() const {
        if (perTable_)
            return importer::TransactionScope::PerTable;
        auto configured = cli_->getConfigValue("import.transaction_scope");
        if (configured == "table")
            return importer::TransactionScope::PerTable;
        if (!configured.empty() && configured != "run") {
            spdlog::warn("Ignoring import.transaction_scope = '{}' (expected run or table)",
                         configured);
        }
        return importer::TransactionScope::PerRun;
    }

    static void printReport(const importer::ImportReport& report) {
        using importer::SummaryReporter;

        if (report.mode == importer::ExecutionMode::DryRun) {
            std::cout << "=== DRY RUN MODE: SQL commands that would be executed ===\n";
            std::cout << ui::horizontal_rule(75, '=') << "\n";
            std::cout << "Operations summary: " << SummaryReporter::countsLine(report) << "\n";
            for (const auto& line : SummaryReporter::detailLines(report)) {
                std::cout << line << "\n";
            }
            std::cout << "SQL to execute:\n";
            for (const auto& statement : report.statements) {
                std::cout << statement << "\n";
            }
            std::cout << "Dry run complete, no changes applied.\n";
            return;
        }

        for (const auto& line : SummaryReporter::detailLines(report)) {
            std::cerr << line << "\n";
        }
        std::cout << "Import done: " << SummaryReporter::countsLine(report) << "\n";
    }
};

// Factory function
std::unique_ptr<ICommand> createImportCommand() {
    return std::make_unique<ImportCommand>();
}

} // namespace hastat::cli
