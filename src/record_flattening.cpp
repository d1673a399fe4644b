/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "record_flattening.h"

namespace receiptwire
{

std::vector<std::pair<std::string, std::string>> flatten(const extracted_record& record)
{
	std::vector<std::pair<std::string, std::string>> columns;
	for (field f : all_fields)
	{
		if (auto value = record.get(f))
			columns.emplace_back(std::string{field_key(f)}, *value);
	}
	for (size_t i = 0; i < record.items.size(); ++i)
	{
		const line_item& item = record.items[i];
		std::string prefix = "item" + std::to_string(i + 1) + "_";
		columns.emplace_back(prefix + "name", item.name);
		if (item.quantity)
			columns.emplace_back(prefix + "quantity", std::to_string(*item.quantity));
		if (item.unit_price)
			columns.emplace_back(prefix + "unit_price", *item.unit_price);
		if (item.total_price)
			columns.emplace_back(prefix + "total_price", *item.total_price);
	}
	return columns;
}

} // namespace receiptwire
