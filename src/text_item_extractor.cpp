/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "text_item_extractor.h"

#include "extraction_rule.h"
#include "log_entry.h"
#include <boost/algorithm/string.hpp>
#include <charconv>

namespace receiptwire
{

namespace
{

struct item_grammar
{
	boost::regex pattern;
	int name_group;
	int quantity_group;
	int price_group;
};

unsigned parse_quantity(const std::string& digits)
{
	unsigned quantity = 0;
	auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), quantity);
	if (ec != std::errc{} || quantity == 0)
		return 1;
	return quantity;
}

std::vector<line_item> items_from_grammars(const std::string& text)
{
	static const std::vector<item_grammar> grammars = {
		{case_sensitive_pattern(R"re((\d+)\s*x\s*([^,\n]+)[\s,]*(?:\$|EUR|£)?([0-9,.]+))re"), 2, 1, 3},
		{case_sensitive_pattern(R"re((\d+)\s+([^@\n]+)@\s*(?:\$|EUR|£)?([0-9,.]+))re"), 2, 1, 3},
		{case_sensitive_pattern(R"re(([^()\n]+)\s*\((\d+)\)\s*(?:\$|EUR|£)?([0-9,.]+))re"), 1, 2, 3}
	};
	std::vector<line_item> items;
	for (const item_grammar& grammar : grammars)
	{
		for (const boost::smatch& match : safe_find_all(text, grammar.pattern))
		{
			line_item item;
			item.name = boost::algorithm::trim_copy(match.str(grammar.name_group));
			item.quantity = parse_quantity(match.str(grammar.quantity_group));
			item.unit_price = boost::algorithm::trim_copy(match.str(grammar.price_group));
			if (is_valid(item))
				items.push_back(std::move(item));
		}
	}
	return items;
}

std::vector<line_item> items_from_section(const std::string& text)
{
	static const boost::regex section = block_pattern(R"re((?:Your Order|Order Details|Items|Products).*?(?=\n\n|(?-i:\n[A-Z])|\z))re");
	static const boost::regex price = case_sensitive_pattern(R"re((?:\$|EUR|£)?([0-9,.]*[0-9][0-9,.]*))re");
	static const boost::regex name_before_price = case_sensitive_pattern(R"re((.*?)(?=\$|EUR|£|[0-9]{1,3},[0-9]{3}|[0-9]+\.[0-9]+))re");
	static const boost::regex leading_quantity = case_sensitive_pattern(R"re(^\s*(\d+)\s*x\s*)re");

	std::vector<line_item> items;
	boost::smatch section_match;
	if (!safe_search(text, section_match, section))
		return items;
	std::string section_text = section_match.str(0);
	std::vector<std::string> lines;
	boost::algorithm::split(lines, section_text, boost::is_any_of("\n"));
	for (const std::string& line : lines)
	{
		boost::smatch match;
		if (boost::algorithm::trim_copy(line).size() <= 10 || !safe_search(line, match, price))
			continue;
		if (!safe_search(line, match, name_before_price))
			continue;
		line_item item;
		item.name = boost::algorithm::trim_copy(match.str(1));
		std::string price_text = match.suffix().str();
		if (!safe_search(price_text, match, price))
			continue;
		item.unit_price = match.str(1);
		item.quantity = 1;
		if (safe_search(item.name, match, leading_quantity))
		{
			item.quantity = parse_quantity(match.str(1));
			item.name = boost::algorithm::trim_copy(match.suffix().str());
		}
		if (is_valid(item))
			items.push_back(std::move(item));
	}
	return items;
}

} // anonymous namespace

std::vector<line_item> extract_text_items(const std::string& text)
{
	std::vector<line_item> items = items_from_grammars(text);
	if (items.empty())
	{
		items = items_from_section(text);
		size_t item_count = items.size();
		log_entry("Items read from order section", item_count);
	}
	return items;
}

} // namespace receiptwire
