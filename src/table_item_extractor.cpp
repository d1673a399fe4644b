/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "table_item_extractor.h"

#include "extraction_rule.h"
#include "log_entry.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include <algorithm>
#include <array>
#include <boost/algorithm/string.hpp>
#include <charconv>
#include <string_view>

namespace receiptwire
{

namespace
{

bool contains_any(const std::string& text, std::initializer_list<std::string_view> words)
{
	return std::any_of(words.begin(), words.end(), [&](std::string_view word) { return text.find(word) != std::string::npos; });
}

std::optional<unsigned> parse_quantity(const std::string& cell_text)
{
	static const boost::regex digits{R"re((\d+))re"};
	boost::smatch match;
	if (!safe_search(cell_text, match, digits))
		return std::nullopt;
	std::string digits_text = match.str(1);
	unsigned quantity = 0;
	auto [ptr, ec] = std::from_chars(digits_text.data(), digits_text.data() + digits_text.size(), quantity);
	if (ec != std::errc{} || quantity == 0)
		return std::nullopt;
	return quantity;
}

std::optional<std::string> parse_amount(const std::string& cell_text)
{
	static const boost::regex amount = line_pattern(R"re((?:\$|€|£)?([0-9,.]+))re");
	boost::smatch match;
	if (!safe_search(cell_text, match, amount))
		return std::nullopt;
	return match.str(1);
}

} // anonymous namespace

std::optional<column_role> resolve_column_role(const std::string& header_text)
{
	std::string text = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(header_text));
	if (contains_any(text, {"item", "product", "description"}))
		return column_role::name;
	if (contains_any(text, {"qty", "quantity"}))
		return column_role::quantity;
	if (contains_any(text, {"price", "unit", "cost"}))
		return column_role::price;
	if (contains_any(text, {"total", "amount", "subtotal"}))
		return column_role::total;
	return std::nullopt;
}

table_column_map map_columns(const html_document::row& header_row)
{
	table_column_map columns;
	for (size_t i = 0; i < header_row.cells.size(); ++i)
	{
		if (std::optional<column_role> role = resolve_column_role(header_row.cells[i].text))
			columns.emplace(*role, i);
	}
	return columns;
}

std::vector<line_item> extract_items_from_table(const html_document::table& table)
{
	std::vector<line_item> items;
	if (table.rows.size() < 2)
		return items;
	table_column_map columns = map_columns(table.rows.front());
	if (!columns.contains(column_role::name))
	{
		log_entry("Item table has no name column");
		return items;
	}
	size_t required_cells = 1 + std::max_element(columns.begin(), columns.end(),
		[](const auto& a, const auto& b) { return a.second < b.second; })->second;
	for (auto row = table.rows.begin() + 1; row != table.rows.end(); ++row)
	{
		if (row->cells.size() < required_cells)
			continue;
		auto cell_text = [&](column_role role) -> const std::string& { return row->cells[columns.at(role)].text; };
		line_item item;
		item.name = cell_text(column_role::name);
		if (item.name.empty())
			continue;
		if (columns.contains(column_role::quantity))
			item.quantity = parse_quantity(cell_text(column_role::quantity));
		if (columns.contains(column_role::price))
			item.unit_price = parse_amount(cell_text(column_role::price));
		if (columns.contains(column_role::total))
			item.total_price = parse_amount(cell_text(column_role::total));
		items.push_back(std::move(item));
	}
	return items;
}

int item_likeness_score(const html_document::table& table)
{
	static constexpr std::array<std::string_view, 7> keywords = {
		"item", "product", "description", "quantity", "price", "amount", "subtotal"
	};
	std::string text = boost::algorithm::to_lower_copy(table.text);
	return static_cast<int>(std::count_if(keywords.begin(), keywords.end(),
		[&](std::string_view keyword) { return text.find(keyword) != std::string::npos; }));
}

std::vector<line_item> extract_table_items(const html_document& doc)
{
	const auto& tables = doc.tables();
	auto table = std::find_if(tables.begin(), tables.end(),
		[](const html_document::table& t) { return item_likeness_score(t) >= item_table_min_score; });
	if (table == tables.end())
		return {};
	std::vector<line_item> items = extract_items_from_table(*table);
	size_t table_index = table - tables.begin();
	size_t item_count = items.size();
	log_entry("Item table selected", table_index, item_count);
	return items;
}

std::vector<line_item> extract_table_items(const std::string& html)
{
	return extract_table_items(html_document::parse(html));
}

} // namespace receiptwire
