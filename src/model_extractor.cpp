/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "model_extractor.h"

#include "error_tags.h"
#include "log_scope.h"
#include "make_error.h"
#include <boost/algorithm/string.hpp>
#include <boost/json.hpp>
#include <charconv>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>

namespace receiptwire
{

namespace
{

std::string strip_code_fence(const std::string& content)
{
	std::string text = boost::algorithm::trim_copy(content);
	if (!text.starts_with("```"))
		return text;
	size_t first_line_end = text.find('\n');
	if (first_line_end == std::string::npos)
		return {};
	text.erase(0, first_line_end + 1);
	if (text.ends_with("```"))
		text.erase(text.size() - 3);
	return boost::algorithm::trim_copy(text);
}

std::optional<std::string> scalar_text(const boost::json::value& value)
{
	switch (value.kind())
	{
		case boost::json::kind::string:
		{
			std::string text = boost::algorithm::trim_copy(std::string{value.get_string()});
			if (text.empty())
				return std::nullopt;
			return text;
		}
		case boost::json::kind::int64:
			return std::to_string(value.get_int64());
		case boost::json::kind::uint64:
			return std::to_string(value.get_uint64());
		case boost::json::kind::double_:
		{
			std::ostringstream stream;
			stream << std::setprecision(15) << value.get_double();
			return stream.str();
		}
		default:
			return std::nullopt;
	}
}

std::optional<unsigned> quantity_from(const boost::json::value& value)
{
	if (value.is_int64() && value.get_int64() > 0 && value.get_int64() <= std::numeric_limits<unsigned>::max())
		return static_cast<unsigned>(value.get_int64());
	if (value.is_uint64() && value.get_uint64() > 0 && value.get_uint64() <= std::numeric_limits<unsigned>::max())
		return static_cast<unsigned>(value.get_uint64());
	if (value.is_string())
	{
		std::string_view text = value.get_string();
		unsigned quantity = 0;
		auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), quantity);
		if (ec == std::errc{} && quantity > 0)
			return quantity;
	}
	return std::nullopt;
}

std::optional<std::string> member_text(const boost::json::object& obj, std::string_view key)
{
	if (const boost::json::value* value = obj.if_contains(key))
		return scalar_text(*value);
	return std::nullopt;
}

std::vector<line_item> decode_items(const boost::json::value& items_value)
{
	std::vector<line_item> items;
	if (!items_value.is_array())
		return items;
	for (const boost::json::value& entry : items_value.get_array())
	{
		if (!entry.is_object())
			continue;
		const boost::json::object& obj = entry.get_object();
		line_item item;
		item.name = member_text(obj, "name").value_or("");
		if (const boost::json::value* quantity = obj.if_contains("quantity"))
			item.quantity = quantity_from(*quantity);
		item.unit_price = member_text(obj, "unit_price");
		item.total_price = member_text(obj, "total_price");
		if (is_valid(item))
			items.push_back(std::move(item));
	}
	return items;
}

} // anonymous namespace

extraction_prompt build_extraction_prompt(const std::string& email_text)
{
	std::string field_list;
	for (field f : all_fields)
	{
		if (!field_list.empty())
			field_list += ", ";
		field_list += field_key(f);
	}
	return {
		"Extract structured data from emails.",
		"Extract the following fields from the email content: " + field_list + ".\n"
			"Answer with a single JSON object using these names as keys and null for missing values. "
			"Purchased items, if any, go to an \"items\" array of objects with name, quantity, unit_price and total_price.\n\n"
			"Email Content:\n" + email_text
	};
}

extracted_record decode_model_response(const std::string& content)
{
	std::string json_text = strip_code_fence(content);
	boost::json::error_code ec;
	boost::json::value parsed = boost::json::parse(json_text, ec);
	if (ec || !parsed.is_object())
	{
		std::string parse_error = ec ? ec.message() : std::string{"not an object"};
		throw make_error("Model response is not a JSON object", errors::uninterpretable_response{}, parse_error);
	}
	const boost::json::object& obj = parsed.get_object();
	extracted_record record;
	for (field f : all_fields)
	{
		if (auto value = member_text(obj, field_key(f)))
			record.fields.emplace(f, std::move(*value));
	}
	if (const boost::json::value* items = obj.if_contains("items"))
		record.items = decode_items(*items);
	return record;
}

extracted_record parse_via_external_model(const std::string& email_text, model_client& client)
{
	log_scope();
	extraction_prompt prompt = build_extraction_prompt(email_text);
	std::string reply;
	try
	{
		reply = client.complete(prompt.system, prompt.user);
	}
	catch (const std::exception&)
	{
		std::throw_with_nested(make_error("External model request failed"));
	}
	return decode_model_response(reply);
}

} // namespace receiptwire
