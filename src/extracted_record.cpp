/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "extracted_record.h"

#include <magic_enum/magic_enum.hpp>

namespace receiptwire
{

std::string_view field_key(field f)
{
	return magic_enum::enum_name(f);
}

std::optional<field> field_from_key(std::string_view key)
{
	return magic_enum::enum_cast<field>(key);
}

bool is_valid(const line_item& item)
{
	return !item.name.empty();
}

} // namespace receiptwire
