/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_FIELD_EXTRACTORS_H
#define RECEIPTWIRE_FIELD_EXTRACTORS_H

#include "core_export.h"
#include "html_document.h"
#include <optional>
#include <string>

/**
 * @brief One extractor per scalar field.
 *
 * Every extractor runs a cascade of case-insensitive patterns over the text and returns the trimmed
 * capture of the first pattern that matches, or nullopt. Extractors taking an html_document also look at
 * the table cell next to a label when the text patterns fail. Currency symbols ($, €, £) are never part of
 * a returned amount.
 */
namespace receiptwire
{

/**
 * @brief Vendor from labels and greetings ("Thank you for your order from X", "X Order Confirmation",
 * "Welcome to X"), else a short line at the top of the message, else the copyright notice near the end.
 */
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_vendor_name(const std::string& text);

/**
 * @brief Amount after "Amount Due", "Balance Due", "Please Pay" and similar labels.
 *
 * Falls back to the cell next to an "amount due" label cell and finally to extract_total_amount.
 */
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_amount_due(const std::string& text, const html_document* html = nullptr);

/// @brief Due date. Candidates without a digit are rejected.
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_date_due(const std::string& text);

RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_order_number(const std::string& text);

/// @brief Order date. Candidates without a digit are rejected.
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_order_date(const std::string& text);

/**
 * @brief Amount after "Order Total", "Grand Total", "Amount", "Charged" and similar labels,
 * else the cell next to a total label cell.
 */
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_total_amount(const std::string& text, const html_document* html = nullptr);

/**
 * @brief Address block after a shipping or delivery label, up to a blank line, a line starting with a
 * capital letter or the end of text. Line breaks become ", " and whitespace runs a single space.
 */
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_shipping_address(const std::string& text);

RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_tracking_number(const std::string& text);

/**
 * @brief Sender from a "From:" or "Sender:" label, else the first email address in the text.
 *
 * An address in angle brackets wins over the display name.
 */
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> extract_email_from(const std::string& text);

} // namespace receiptwire

#endif // RECEIPTWIRE_FIELD_EXTRACTORS_H
