/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "json_serialization.h"

#include <boost/json.hpp>

namespace receiptwire::serialization
{

namespace
{

boost::json::value to_json_value(const value& s_val)
{
	return std::visit(
		[](const auto& arg) -> boost::json::value {
			using T = std::decay_t<decltype(arg)>;
			if constexpr (std::is_same_v<T, object>)
			{
				boost::json::object obj;
				for (const auto& [key, val] : arg.v)
					obj[key] = to_json_value(val);
				return obj;
			}
			else if constexpr (std::is_same_v<T, array>)
			{
				boost::json::array arr;
				arr.reserve(arg.v.size());
				for (const auto& val : arg.v)
					arr.push_back(to_json_value(val));
				return arr;
			}
			else if constexpr (std::is_same_v<T, std::string>)
				return boost::json::string(arg.data(), arg.size());
			else
				return boost::json::value(arg);
		},
		s_val);
}

} // anonymous namespace

std::string to_json(const value& s_val)
{
	return boost::json::serialize(to_json_value(s_val));
}

} // namespace receiptwire::serialization
