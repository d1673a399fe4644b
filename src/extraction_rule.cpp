/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "extraction_rule.h"

#include "log_entry.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <cctype>

namespace receiptwire
{

namespace
{

constexpr boost::regex::flag_type perl = boost::regex::perl;
constexpr boost::regex::flag_type icase = boost::regex::icase;
constexpr boost::regex::flag_type mod_s = boost::regex::mod_s;
constexpr boost::regex::flag_type no_mod_m = boost::regex::no_mod_m;
constexpr boost::regex::flag_type no_mod_s = boost::regex::no_mod_s;

void log_aborted_search(const boost::regex_error& error, const boost::regex& pattern)
{
	std::string expression = pattern.str();
	std::string reason = error.what();
	log_entry(log::warning{}, "Regular expression search aborted", expression, reason);
}

} // anonymous namespace

boost::regex line_pattern(const std::string& expression)
{
	return boost::regex{expression, perl | icase | no_mod_m | no_mod_s};
}

boost::regex block_pattern(const std::string& expression)
{
	return boost::regex{expression, perl | icase | no_mod_m | mod_s};
}

boost::regex case_sensitive_pattern(const std::string& expression)
{
	return boost::regex{expression, perl | no_mod_m | no_mod_s};
}

bool safe_search(const std::string& text, boost::smatch& match, const boost::regex& pattern)
{
	try
	{
		return boost::regex_search(text, match, pattern);
	}
	catch (const boost::regex_error& error)
	{
		log_aborted_search(error, pattern);
		return false;
	}
}

std::vector<boost::smatch> safe_find_all(const std::string& text, const boost::regex& pattern)
{
	std::vector<boost::smatch> matches;
	try
	{
		for (boost::sregex_iterator it{text.begin(), text.end(), pattern}, end; it != end; ++it)
			matches.push_back(*it);
	}
	catch (const boost::regex_error& error)
	{
		log_aborted_search(error, pattern);
	}
	return matches;
}

std::optional<std::string> first_match(field f, const std::string& text, const std::vector<extraction_rule>& rules)
{
	for (size_t rule_index = 0; rule_index < rules.size(); ++rule_index)
	{
		const extraction_rule& rule = rules[rule_index];
		boost::smatch match;
		if (!safe_search(text, match, rule.pattern))
			continue;
		std::string value = boost::algorithm::trim_copy(match.str(rule.group));
		if (value.empty() || (rule.accept && !rule.accept(value)))
			continue;
		log_entry("Field matched", f, rule_index);
		return value;
	}
	return std::nullopt;
}

bool has_digit(const std::string& value)
{
	return std::any_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace receiptwire
