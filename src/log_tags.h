/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_LOG_TAGS_H
#define RECEIPTWIRE_LOG_TAGS_H

#include <string_view>

namespace receiptwire::log
{

/**
 * @brief Tag for operational events of the application (CLI runs, chosen extractor).
 *
 * Kept in release builds. Example: `log_entry(log::audit{}, "Extraction finished", field_count);`
 */
struct audit { static constexpr std::string_view string() { return "audit"; } };

/// @brief Tag for recoverable problems that change the result, such as a skipped rule. Kept in release builds.
struct warning { static constexpr std::string_view string() { return "warning"; } };

/// @brief Added to the record written when a `log_scope` is entered.
struct scope_enter { static constexpr std::string_view string() { return "scope_enter"; } };

/// @brief Added to the record written when a `log_scope` is exited.
struct scope_exit { static constexpr std::string_view string() { return "scope_exit"; } };

} // namespace receiptwire::log

#endif // RECEIPTWIRE_LOG_TAGS_H
