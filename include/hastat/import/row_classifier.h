// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <hastat/import/import_types.h>

namespace hastat::importer {

/**
 * @brief Decide the operation one input row asks for
 *
 * Rules, in order:
 *  - a row where every column is blank is skipped;
 *  - the table must name one of the statistics tables;
 *  - a non-empty id means delete (no measurement field given) or a sparse update of the
 *    given fields; id always wins over insert-looking content;
 *  - without an id, a row with nothing in it is skipped, otherwise it is an insert that
 *    needs metadata_id and start_ts, with created_ts defaulting to start_ts.
 *
 * Values are parsed strictly: ids as integers, last_reset verbatim, everything else as a
 * finite real. metadata_id existence is not checked here.
 */
class RowClassifier {
public:
    [[nodiscard]] Classification classify(const ImportRow& row) const;
};

} // namespace hastat::importer
