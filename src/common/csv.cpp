#include <hastat/common/csv.h>
#include <hastat/config/config_helpers.h>

#include <format>

namespace hastat::common {

CsvReader::CsvReader(std::istream& in) : in_(in) {}

Result<void> CsvReader::readHeader() {
    if (headerRead_) {
        return Error{ErrorCode::InvalidState, "CSV header already read"};
    }
    auto record = readRecord();
    if (!record)
        return record.error();
    if (!record.value()) {
        return Error{ErrorCode::InvalidData, "CSV input is empty (header row required)"};
    }
    header_ = std::move(record.value()->fields);
    for (auto& name : header_) {
        config::trim(name);
    }
    // A UTF-8 BOM written by spreadsheet tools sticks to the first header name
    if (!header_.empty() && header_.front().starts_with("\xEF\xBB\xBF")) {
        header_.front().erase(0, 3);
    }
    headerRead_ = true;
    return {};
}

std::optional<std::size_t> CsvReader::columnIndex(std::string_view name) const {
    for (std::size_t i = 0; i < header_.size(); ++i) {
        if (header_[i] == name)
            return i;
    }
    return std::nullopt;
}

Result<std::optional<CsvRecord>> CsvReader::next() {
    if (!headerRead_) {
        return Error{ErrorCode::InvalidState, "CSV header not read"};
    }
    auto record = readRecord();
    if (!record)
        return record.error();
    if (record.value() && record.value()->fields.size() != header_.size()) {
        return Error{ErrorCode::InvalidData,
                     std::format("CSV structure error at line {}: expected {} columns, got {}",
                                 record.value()->line, header_.size(),
                                 record.value()->fields.size())};
    }
    return record;
}

Result<std::vector<CsvRecord>> CsvReader::readAll() {
    std::vector<CsvRecord> records;
    while (true) {
        auto record = next();
        if (!record)
            return record.error();
        if (!record.value())
            break;
        records.push_back(std::move(*record.value()));
    }
    return records;
}

Result<std::optional<CsvRecord>> CsvReader::readRecord() {
    while (true) {
        CsvRecord record;
        std::string field;
        bool inQuotes = false;
        bool fieldWasQuoted = false;
        bool sawAny = false;

        int ch = 0;
        while (true) {
            ch = in_.get();
            if (ch == std::char_traits<char>::eof())
                break;

            if (!sawAny) {
                ++line_;
                record.line = line_;
                sawAny = true;
            }

            const char c = static_cast<char>(ch);
            if (inQuotes) {
                if (c == '"') {
                    if (in_.peek() == '"') {
                        in_.get();
                        field.push_back('"');
                    } else {
                        inQuotes = false;
                    }
                } else {
                    if (c == '\n')
                        ++line_;
                    field.push_back(c);
                }
                continue;
            }

            if (c == '"' && field.empty() && !fieldWasQuoted) {
                inQuotes = true;
                fieldWasQuoted = true;
            } else if (c == ',') {
                record.fields.push_back(std::move(field));
                field.clear();
                fieldWasQuoted = false;
            } else if (c == '\r') {
                if (in_.peek() == '\n')
                    in_.get();
                break;
            } else if (c == '\n') {
                break;
            } else {
                field.push_back(c);
            }
        }

        if (inQuotes) {
            return Error{ErrorCode::InvalidData,
                         std::format("CSV structure error at line {}: unterminated quoted field",
                                     record.line)};
        }

        if (!sawAny) {
            return std::optional<CsvRecord>{};
        }

        // Physically empty line: skip it
        if (record.fields.empty() && field.empty() && !fieldWasQuoted) {
            if (ch == std::char_traits<char>::eof())
                return std::optional<CsvRecord>{};
            continue;
        }

        record.fields.push_back(std::move(field));
        return std::optional<CsvRecord>{std::move(record)};
    }
}

void CsvWriter::writeRow(const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0)
            out_ << ',';
        out_ << escape(fields[i]);
    }
    out_ << "\r\n";
}

std::string CsvWriter::escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"')
            out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace hastat::common
