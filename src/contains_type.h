/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_CONTAINS_TYPE_H
#define RECEIPTWIRE_CONTAINS_TYPE_H

#include "error.h"
#include <exception>

namespace receiptwire::errors
{

/**
 * @brief Checks if an exception or any exception nested in it carries a context item of type T.
 *
 * Mostly used with error tags:
 * @code
 * if (errors::contains_type<errors::network_failure>(e)) ...
 * @endcode
 */
template <typename T>
bool contains_type(const std::exception& e)
{
	if (const auto* error = dynamic_cast<const errors::base*>(&e))
	{
		for (size_t i = 0; i < error->context_count(); ++i)
		{
			if (error->context_type(i) == typeid(T))
				return true;
		}
	}
	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception& nested_ex)
	{
		return contains_type<T>(nested_ex);
	}
	catch (...)
	{
		// Nested object is not a std::exception and cannot carry context.
		return false;
	}
	return false;
}

} // namespace receiptwire::errors

#endif // RECEIPTWIRE_CONTAINS_TYPE_H
