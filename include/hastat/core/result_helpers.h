// Copyright (c) 2026 hastat Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file result_helpers.h
 * @brief Early-return macros for Result<T>
 *
 * These macros implement early return on error, similar to Rust's ? operator.
 */

#include <hastat/core/types.h>

#include <utility>

/**
 * @def HASTAT_TRY(expr)
 * @brief Evaluate expression and return early if it's an error
 *
 * Use this for expressions that return Result<void> when you don't need
 * the value, just need to propagate errors.
 *
 * @code
 * Result<void> doWork() {
 *     HASTAT_TRY(step1());
 *     HASTAT_TRY(step2());
 *     return {};
 * }
 * @endcode
 */
#define HASTAT_TRY(expr)                                                                           \
    do {                                                                                           \
        auto _hastat_try_result = (expr);                                                          \
        if (!_hastat_try_result.has_value()) {                                                     \
            return _hastat_try_result.error();                                                     \
        }                                                                                          \
    } while (0)

/**
 * @def HASTAT_TRY_UNWRAP(var, expr)
 * @brief Declare and initialize variable from Result, returning error if failed
 *
 * @code
 * Result<int> compute(Database& db) {
 *     HASTAT_TRY_UNWRAP(stmt, db.prepare(sql));
 *     HASTAT_TRY_UNWRAP(hasRow, stmt.step());
 *     return hasRow ? stmt.getInt(0) : 0;
 * }
 * @endcode
 */
#define HASTAT_TRY_UNWRAP(var, expr)                                                               \
    auto _hastat_res_##var = (expr);                                                               \
    if (!_hastat_res_##var.has_value()) {                                                          \
        return _hastat_res_##var.error();                                                          \
    }                                                                                              \
    auto var = std::move(_hastat_res_##var).value()

/**
 * @def HASTAT_TRY_ASSIGN(var, expr)
 * @brief Evaluate expression, assign value to an existing var, or return error
 */
#define HASTAT_TRY_ASSIGN(var, expr)                                                               \
    do {                                                                                           \
        auto _hastat_try_r = (expr);                                                               \
        if (!_hastat_try_r.has_value()) {                                                          \
            return _hastat_try_r.error();                                                          \
        }                                                                                          \
        var = std::move(_hastat_try_r).value();                                                    \
    } while (0)
