/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_EXTRACTED_RECORD_H
#define RECEIPTWIRE_EXTRACTED_RECORD_H

#include "core_export.h"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace receiptwire
{

/**
 * @brief Canonical scalar fields, in output order.
 */
enum class field
{
	vendor_name,
	amount_due,
	date_due,
	order_number,
	order_date,
	total_amount,
	shipping_address,
	tracking_number,
	email_from
};

inline constexpr std::array<field, 9> all_fields = {
	field::vendor_name, field::amount_due, field::date_due, field::order_number, field::order_date,
	field::total_amount, field::shipping_address, field::tracking_number, field::email_from
};

/// @brief Output key of a field, equal to the enumerator name.
RECEIPTWIRE_CORE_EXPORT std::string_view field_key(field f);

RECEIPTWIRE_CORE_EXPORT std::optional<field> field_from_key(std::string_view key);

/**
 * @brief One purchased entry. Prices are the numeric text as found, without currency symbols.
 */
struct line_item
{
	std::string name;
	std::optional<unsigned> quantity;
	std::optional<std::string> unit_price;
	std::optional<std::string> total_price;

	bool operator==(const line_item&) const = default;
};

/// @brief An item is valid when it has a non-empty name.
RECEIPTWIRE_CORE_EXPORT bool is_valid(const line_item& item);

/**
 * @brief Result of one extraction. A field missing from the map is absent, which is not the same as empty.
 *
 * An empty item list means no items were found.
 */
struct extracted_record
{
	std::map<field, std::string> fields;
	std::vector<line_item> items;

	bool operator==(const extracted_record&) const = default;

	std::optional<std::string> get(field f) const
	{
		auto it = fields.find(f);
		if (it == fields.end())
			return std::nullopt;
		return it->second;
	}
};

} // namespace receiptwire

#endif // RECEIPTWIRE_EXTRACTED_RECORD_H
