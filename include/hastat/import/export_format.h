#pragma once

#include <hastat/metadata/recorder_store.h>

#include <string>
#include <string_view>
#include <vector>

namespace hastat::importer {

/**
 * @brief Header of the export file, which is also what import reads back
 */
std::vector<std::string> exportHeader();

/**
 * @brief One record as CSV fields in exportHeader() order
 *
 * NULL becomes an empty field; reals use the shortest form that reads back to the same
 * value, so an unedited export re-imports as no-op-equivalent updates.
 */
std::vector<std::string> exportFields(const metadata::StatisticRecord& record,
                                      std::string_view entity);

} // namespace hastat::importer
