#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <hastat/cli/command.h>
#include <hastat/cli/hastat_cli.h>
#include <hastat/cli/time_parser.h>
#include <hastat/cli/ui_helpers.hpp>
#include <hastat/common/csv.h>
#include <hastat/import/export_format.h>
#include <hastat/metadata/recorder_store.h>

namespace hastat::cli {

class ExportCommand : public ICommand {
public:
    std::string getName() const override { return "export"; }

    std::string getDescription() const override {
        return "Export statistics rows of one or more entities as CSV (re-importable)";
    }

    void registerCommand(CLI::App& app, HastatCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("entities", entities_, "Entity ids (statistic_id), e.g. sensor.energy")
            ->required();
        cmd->add_option("--above", above_,
                        "Only rows where mean, min or max is above this value");
        cmd->add_option("--below", below_,
                        "Only rows where mean, min or max is below this value");
        cmd->add_option("--after", after_, "Only rows starting at or after this time");
        cmd->add_option("--before", before_, "Only rows starting at or before this time");
        cmd->add_option("-o,--output", outputPath_, "Write to FILE instead of stdout");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        metadata::ExportFilter filter;
        filter.above = above_;
        filter.below = below_;
        if (!after_.empty()) {
            auto ts = TimeParser::parseEpochSeconds(after_);
            if (!ts)
                return ts.error();
            filter.range.after = ts.value();
        }
        if (!before_.empty()) {
            auto ts = TimeParser::parseEpochSeconds(before_);
            if (!ts)
                return ts.error();
            filter.range.before = ts.value();
        }

        auto db = cli_->ensureDatabase(metadata::ConnectionMode::ReadOnly);
        if (!db) {
            return db.error();
        }

        std::ofstream file;
        if (!outputPath_.empty()) {
            file.open(outputPath_, std::ios::out | std::ios::trunc | std::ios::binary);
            if (!file) {
                return Error{ErrorCode::FileNotFound, "Cannot write to " + outputPath_};
            }
        }
        std::ostream& out = outputPath_.empty() ? std::cout : file;

        common::CsvWriter writer(out);
        writer.writeRow(importer::exportHeader());

        metadata::RecorderStore store(*db.value());
        std::size_t written = 0;
        for (const auto& entity : entities_) {
            auto metadataId = store.findMetadataId(entity);
            if (!metadataId) {
                return metadataId.error();
            }
            if (!metadataId.value()) {
                std::cerr << ui::warning_text("Entity '" + entity + "' not found") << "\n";
                continue;
            }

            auto records = store.exportRows(*metadataId.value(), filter);
            if (!records) {
                return records.error();
            }
            for (const auto& record : records.value()) {
                writer.writeRow(importer::exportFields(record, entity));
            }
            written += records.value().size();
            spdlog::debug("Exported {} rows for {}", records.value().size(), entity);
        }

        out.flush();
        if (!out) {
            return Error{ErrorCode::InternalError, "Failed to write export output"};
        }
        if (!outputPath_.empty() && !cli_->getJsonOutput()) {
            std::cerr << "Wrote " << written << " rows to " << outputPath_ << "\n";
        }
        return {};
    }

private:
    HastatCLI* cli_ = nullptr;
    std::vector<std::string> entities_;
    std::optional<double> above_;
    std::optional<double> below_;
    std::string after_;
    std::string before_;
    std::string outputPath_;
};

// Factory function
std::unique_ptr<ICommand> createExportCommand() {
    return std::make_unique<ExportCommand>();
}

} // namespace hastat::cli
