#pragma once

#include <hastat/core/types.h>

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace hastat::common {

/**
 * @brief One parsed CSV record with the 1-based line it started on
 */
struct CsvRecord {
    std::size_t line = 0;
    std::vector<std::string> fields;
};

/**
 * @brief RFC 4180 reader with a mandatory header row
 *
 * Quoted fields may contain commas, doubled quotes and line breaks. Physically empty lines
 * are skipped. A record whose field count differs from the header is a structure error.
 */
class CsvReader {
public:
    explicit CsvReader(std::istream& in);

    /**
     * @brief Read and remember the header row (names are trimmed)
     */
    Result<void> readHeader();

    [[nodiscard]] const std::vector<std::string>& header() const { return header_; }

    /**
     * @brief Index of a header column, if present
     */
    [[nodiscard]] std::optional<std::size_t> columnIndex(std::string_view name) const;

    /**
     * @brief Next record, or nullopt at end of input
     */
    Result<std::optional<CsvRecord>> next();

    /**
     * @brief Read every remaining record; stops at the first structure error
     */
    Result<std::vector<CsvRecord>> readAll();

private:
    std::istream& in_;
    std::vector<std::string> header_;
    std::size_t line_ = 0;
    bool headerRead_ = false;

    Result<std::optional<CsvRecord>> readRecord();
};

/**
 * @brief CSV writer that quotes only when a field requires it
 */
class CsvWriter {
public:
    explicit CsvWriter(std::ostream& out) : out_(out) {}

    void writeRow(const std::vector<std::string>& fields);

    static std::string escape(std::string_view field);

private:
    std::ostream& out_;
};

} // namespace hastat::common
