/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_EXTRACTION_RULE_H
#define RECEIPTWIRE_EXTRACTION_RULE_H

#include "core_export.h"
#include "extracted_record.h"
#include <boost/regex.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace receiptwire
{

/**
 * @brief One pattern of a field's cascade.
 *
 * The value is the trimmed capture group `group` of the first match. When `accept` is set, a value it rejects
 * makes the rule fail and the cascade moves on to the next rule.
 */
struct extraction_rule
{
	boost::regex pattern;
	int group = 1;
	std::function<bool(const std::string&)> accept;
};

/// @brief Case-insensitive pattern in which '.' does not match a newline.
RECEIPTWIRE_CORE_EXPORT boost::regex line_pattern(const std::string& expression);

/// @brief Case-insensitive pattern in which '.' matches newlines too. Used for multi-line blocks.
RECEIPTWIRE_CORE_EXPORT boost::regex block_pattern(const std::string& expression);

/// @brief Case-sensitive pattern in which '.' does not match a newline.
RECEIPTWIRE_CORE_EXPORT boost::regex case_sensitive_pattern(const std::string& expression);

/**
 * @brief regex_search that treats a match aborted for excessive backtracking as no match.
 *
 * The abort is logged with the `warning` tag.
 */
RECEIPTWIRE_CORE_EXPORT bool safe_search(const std::string& text, boost::smatch& match, const boost::regex& pattern);

/**
 * @brief All non-overlapping matches, in order. Stops at the first aborted match and keeps what was found.
 */
RECEIPTWIRE_CORE_EXPORT std::vector<boost::smatch> safe_find_all(const std::string& text, const boost::regex& pattern);

/**
 * @brief Runs the rules in order and returns the value of the first successful one.
 *
 * An empty value counts as a failure.
 */
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> first_match(field f, const std::string& text, const std::vector<extraction_rule>& rules);

/// @brief True when the value contains at least one decimal digit.
RECEIPTWIRE_CORE_EXPORT bool has_digit(const std::string& value);

} // namespace receiptwire

#endif // RECEIPTWIRE_EXTRACTION_RULE_H
