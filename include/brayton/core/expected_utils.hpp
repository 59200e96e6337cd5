#pragma once

#include <expected>
#include <utility>

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   BRAYTON_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define BRAYTON_TRY_ASSIGN(lhs, expr)                                                         \
    do {                                                                                      \
        auto brayton_try_tmp = (expr);                                                        \
        if (!brayton_try_tmp)                                                                 \
            return std::unexpected(brayton_try_tmp.error());                                  \
        lhs = std::move(brayton_try_tmp.value());                                             \
    } while (0)

/**
 * @brief Void-or-return helper for std::expected<void, E>
 *
 * Usage: BRAYTON_TRY_VOID(some_void_expected_result);
 */
#define BRAYTON_TRY_VOID(expr)                                                                \
    do {                                                                                      \
        auto brayton_try_tmp_void = (expr);                                                   \
        if (!brayton_try_tmp_void)                                                            \
            return std::unexpected(brayton_try_tmp_void.error());                             \
    } while (0)
