/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "field_extractors.h"

#include "extraction_rule.h"
#include "log_entry.h"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <initializer_list>
#include <vector>

namespace receiptwire
{

namespace
{

const std::string currency = R"re((?:\$|€|£)?)re";
const std::string amount = currency + R"re(([0-9,.]+))re";
const std::string block_end = R"re((?=\n\n|(?-i:\n[A-Z])|\z))re";

std::vector<extraction_rule> line_rules(std::initializer_list<std::string> expressions,
	std::function<bool(const std::string&)> accept = {})
{
	std::vector<extraction_rule> rules;
	for (const std::string& expression : expressions)
		rules.push_back({line_pattern(expression), 1, accept});
	return rules;
}

std::optional<std::string> vendor_from_top_lines(const std::vector<std::string>& lines)
{
	static const boost::regex not_a_name = line_pattern(R"re(@|http|www|subject|dear|hi\s|hello)re");
	for (size_t i = 0; i < std::min<size_t>(lines.size(), 5); ++i)
	{
		std::string candidate = boost::algorithm::trim_copy(lines[i]);
		if (candidate.empty() || candidate.size() >= 50)
			continue;
		boost::smatch match;
		if (!safe_search(lines[i], match, not_a_name))
			return candidate;
	}
	return std::nullopt;
}

std::optional<std::string> vendor_from_copyright(const std::vector<std::string>& lines)
{
	static const boost::regex marker = line_pattern(R"re(©|copyright|all rights reserved)re");
	static const boost::regex holder = line_pattern(R"re((?:©|copyright|all rights reserved)[,\s]+([A-Za-z0-9\s,.&]+))re");
	if (lines.size() < 2)
		return std::nullopt;
	// never the first line, at most the last 9 lines
	size_t stop = lines.size() > 10 ? lines.size() - 10 : 0;
	for (size_t i = lines.size() - 1; i > stop; --i)
	{
		boost::smatch match;
		if (!safe_search(lines[i], match, marker))
			continue;
		if (safe_search(lines[i], match, holder))
		{
			std::string name = boost::algorithm::trim_copy(match.str(1));
			if (!name.empty())
				return name;
		}
	}
	return std::nullopt;
}

} // anonymous namespace

std::optional<std::string> extract_vendor_name(const std::string& text)
{
	static const std::vector<extraction_rule> rules = line_rules({
		R"re((?:From|Vendor|Seller|Company)[:\s]+([A-Za-z0-9\s,.]+)(?=\n|<|,|\())re",
		R"re(Thank you for (?:your order|shopping) (?:from|with|at) ([A-Za-z0-9\s,.&]+))re",
		R"re(([A-Za-z0-9\s,.&]+) Order Confirmation)re",
		R"re(Welcome to ([A-Za-z0-9\s,.&]+))re"
	});
	if (auto vendor = first_match(field::vendor_name, text, rules))
		return vendor;
	std::vector<std::string> lines;
	boost::algorithm::split(lines, text, boost::is_any_of("\n"));
	if (auto vendor = vendor_from_top_lines(lines))
		return vendor;
	return vendor_from_copyright(lines);
}

std::optional<std::string> extract_amount_due(const std::string& text, const html_document* html)
{
	static const std::vector<extraction_rule> rules = line_rules({
		R"re((?:Amount\s*Due|Balance\s*Due|Total\s*Due|Payment\s*Due)[:\s]*)re" + amount,
		R"re((?:Total\s*Amount\s*Due|Payment\s*Amount)[:\s]*)re" + amount,
		R"re((?:Please\s*Pay|Pay\s*Now)[:\s]*)re" + amount,
		R"re((?:Total\s*Balance|Outstanding\s*Balance)[:\s]*)re" + amount
	});
	if (auto value = first_match(field::amount_due, text, rules))
		return value;
	if (html)
	{
		static const boost::regex label = line_pattern(R"re(amount\s*due)re");
		static const boost::regex value_pattern = line_pattern(amount);
		if (auto value = html->find_value_next_to_label(label, value_pattern); value && !value->empty())
		{
			log_entry("Amount due found next to label cell");
			return value;
		}
	}
	return extract_total_amount(text, html);
}

std::optional<std::string> extract_date_due(const std::string& text)
{
	static const std::vector<extraction_rule> rules = line_rules({
		R"re((?:Due\s*Date|Payment\s*Due\s*(?:Date|By|On)|Date\s*Due)[:\s]*([A-Za-z0-9,\s]+))re",
		R"re((?:Pay\s*By|Payment\s*Deadline)[:\s]*([A-Za-z0-9,\s]+))re",
		R"re((?:due\s*on|due\s*by)[:\s]*([A-Za-z0-9,\s]+))re"
	}, has_digit);
	return first_match(field::date_due, text, rules);
}

std::optional<std::string> extract_order_number(const std::string& text)
{
	static const std::vector<extraction_rule> rules = line_rules({
		R"re(Order\s*(?:Number|#|No\.)[:\s]*([A-Za-z0-9\-_]+))re",
		R"re((?:order|confirmation)[:\s]*#?\s*([A-Za-z0-9\-_]+))re",
		R"re(Reference\s*(?:Number|#)[:\s]*([A-Za-z0-9\-_]+))re",
		R"re((?:Invoice|Receipt)\s*(?:Number|#)[:\s]*([A-Za-z0-9\-_]+))re"
	});
	return first_match(field::order_number, text, rules);
}

std::optional<std::string> extract_order_date(const std::string& text)
{
	static const std::vector<extraction_rule> rules = line_rules({
		R"re(Order\s*Date[:\s]*([A-Za-z0-9,\s]+))re",
		R"re(Date\s*(?:of|on)[:\s]*Order[:\s]*([A-Za-z0-9,\s]+))re",
		R"re(Ordered\s*on[:\s]*([A-Za-z0-9,\s]+))re",
		R"re(Purchase\s*Date[:\s]*([A-Za-z0-9,\s]+))re"
	}, has_digit);
	return first_match(field::order_date, text, rules);
}

std::optional<std::string> extract_total_amount(const std::string& text, const html_document* html)
{
	static const std::vector<extraction_rule> rules = line_rules({
		R"re((?:Order\s*Total|Total)[:\s]*)re" + amount,
		R"re((?:Total\s*Amount|Grand\s*Total)[:\s]*)re" + amount,
		R"re((?:Amount|Payment)[:\s]*)re" + amount,
		R"re((?:Charged|Price)[:\s]*)re" + amount
	});
	if (auto value = first_match(field::total_amount, text, rules))
		return value;
	if (html)
	{
		static const boost::regex label = line_pattern(R"re((?:order\s*total|total\s*amount|grand\s*total))re");
		static const boost::regex value_pattern = line_pattern(amount);
		if (auto value = html->find_value_next_to_label(label, value_pattern); value && !value->empty())
			return value;
	}
	return std::nullopt;
}

std::optional<std::string> extract_shipping_address(const std::string& text)
{
	static const std::vector<extraction_rule> rules = [] {
		std::vector<extraction_rule> block_rules;
		for (const std::string label : {R"re((?:Shipping|Delivery)\s*Address)re", R"re((?:Ship\s*To|Deliver\s*To))re", R"re((?:Shipped\s*To|Delivered\s*To))re"})
			block_rules.push_back({block_pattern(label + R"re([:\s]*(.*?))re" + block_end), 1, {}});
		return block_rules;
	}();
	std::optional<std::string> address = first_match(field::shipping_address, text, rules);
	if (!address)
		return std::nullopt;
	static const boost::regex line_breaks{R"re(\n+)re"};
	static const boost::regex whitespace_run{R"re(\s+)re"};
	return boost::regex_replace(boost::regex_replace(*address, line_breaks, ", "), whitespace_run, " ");
}

std::optional<std::string> extract_tracking_number(const std::string& text)
{
	static const std::vector<extraction_rule> rules = line_rules({
		R"re((?:Tracking\s*(?:Number|#)|Track\s*Your\s*Package)[:\s]*([A-Za-z0-9]+))re",
		R"re((?:Tracking\s*ID|Shipment\s*ID)[:\s]*([A-Za-z0-9]+))re",
		R"re(Your\s*package\s*can\s*be\s*tracked\s*with[:\s]*([A-Za-z0-9]+))re",
		R"re(Track[:\s]*.*?number[:\s]*([A-Za-z0-9]+))re"
	});
	return first_match(field::tracking_number, text, rules);
}

std::optional<std::string> extract_email_from(const std::string& text)
{
	static const std::vector<extraction_rule> rules = line_rules({
		R"re(From:[:\s]*([A-Za-z0-9\s,.@<>]+))re",
		R"re(Sender:[:\s]*([A-Za-z0-9\s,.@<>]+))re",
		R"re(([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}))re"
	});
	std::optional<std::string> sender = first_match(field::email_from, text, rules);
	if (!sender)
		return std::nullopt;
	static const boost::regex angle_brackets{R"re(<([^>]+)>)re"};
	boost::smatch match;
	if (safe_search(*sender, match, angle_brackets))
		return match.str(1);
	return sender;
}

} // namespace receiptwire
