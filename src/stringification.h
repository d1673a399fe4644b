/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_STRINGIFICATION_H
#define RECEIPTWIRE_STRINGIFICATION_H

#include "concepts.h"
#include "json_serialization.h"
#include "serialization_base.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include <string>
#include <string_view>
#include <utility>

namespace receiptwire
{

/**
 * @brief Human readable form of a context item.
 *
 * Strings are used verbatim, tags by their name, named items as "name: value" and everything else as JSON.
 */
template <typename T>
std::string stringify(const T& v)
{
	if constexpr (context_tag<T>)
		return std::string{T::string()};
	else if constexpr (std::is_pointer_v<T> && string_like<T>)
		return v ? std::string{v} : std::string{"null"};
	else if constexpr (string_like<T>)
		return std::string{std::string_view{v}};
	else
		return serialization::to_json(serialization::full(v));
}

template <typename T>
std::string stringify(const std::pair<std::string, T>& item)
{
	return item.first + ": " + stringify(item.second);
}

} // namespace receiptwire

#endif // RECEIPTWIRE_STRINGIFICATION_H
