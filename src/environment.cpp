/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "environment.h"

#include <cstdlib>

namespace receiptwire::environment
{

std::optional<std::string> get(std::string_view name)
{
	// std::getenv needs a null-terminated name
	const std::string name_str(name);
	const char* value = std::getenv(name_str.c_str());
	if (value)
		return std::string(value);
	return std::nullopt;
}

std::string get_or(std::string_view name, std::string_view fallback)
{
	std::optional<std::string> value = get(name);
	if (value && !value->empty())
		return *value;
	return std::string{fallback};
}

} // namespace receiptwire::environment
