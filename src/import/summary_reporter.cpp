#include <format>
#include <hastat/import/summary_reporter.h>

namespace hastat::importer {

ImportReport SummaryReporter::summarize(const ExecutionResult& execution,
                                        const ImportPlan& diagnostics, std::size_t rowsRead,
                                        metadata::SchemaCheck schema) {
    ImportReport report;
    report.mode = execution.mode;
    report.rowsRead = rowsRead;
    report.skipped = diagnostics.skipped.size();
    report.invalid = diagnostics.invalid.size();
    for (const auto& issue : diagnostics.invalid) {
        ++report.invalidByKind[issue.kind];
    }
    report.invalidRows = diagnostics.invalid;
    report.conflicts = diagnostics.conflicts;
    report.inserts = execution.inserts;
    report.updates = execution.updates;
    report.deletes = execution.deletes;
    report.insertedIds = execution.insertedIds;
    report.statements = execution.statements;
    report.schema = std::move(schema);
    return report;
}

std::string SummaryReporter::countsLine(const ImportReport& report) {
    return std::format("{} inserts, {} updates, {} deletes, {} skips, {} invalid, {} conflicts",
                       report.inserts, report.updates, report.deletes, report.skipped,
                       report.invalid, report.conflictCount());
}

std::vector<std::string> SummaryReporter::detailLines(const ImportReport& report) {
    std::vector<std::string> lines;
    lines.reserve(report.invalidRows.size() + report.conflicts.size());
    for (const auto& issue : report.invalidRows) {
        lines.push_back(std::format("Line {}: {} ({})", issue.line, issue.message,
                                    validationKindName(issue.kind)));
    }
    for (const auto& conflict : report.conflicts) {
        lines.push_back(std::format("Line {}: overridden by line {} for {} id={}",
                                    conflict.overriddenLine, conflict.winningLine,
                                    metadata::tableName(conflict.table), conflict.id));
    }
    return lines;
}

} // namespace hastat::importer
