/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_SERIALIZATION_RECORD_H
#define RECEIPTWIRE_SERIALIZATION_RECORD_H

#include "extracted_record.h"
#include "serialization_base.h"

namespace receiptwire::serialization
{

template <>
struct serializer<line_item>
{
	value full(const line_item& item) const
	{
		object obj{{{"name", item.name}}};
		if (item.quantity)
			obj.v["quantity"] = static_cast<std::uint64_t>(*item.quantity);
		if (item.unit_price)
			obj.v["unit_price"] = *item.unit_price;
		if (item.total_price)
			obj.v["total_price"] = *item.total_price;
		return obj;
	}
};

/**
 * @brief Present fields under their keys, `items` only when the record has items.
 */
template <>
struct serializer<extracted_record>
{
	value full(const extracted_record& record) const
	{
		object obj;
		for (const auto& [f, field_value] : record.fields)
			obj.v[std::string{field_key(f)}] = field_value;
		if (!record.items.empty())
			obj.v["items"] = serialization::full(record.items);
		return obj;
	}
};

} // namespace receiptwire::serialization

#endif // RECEIPTWIRE_SERIALIZATION_RECORD_H
