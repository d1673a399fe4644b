/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_TYPE_NAME_H
#define RECEIPTWIRE_TYPE_NAME_H

#include "core_export.h"
#include <string>
#include <typeindex>

namespace receiptwire::type_name
{

/// @brief Demangled and compiler-neutral name of a type.
RECEIPTWIRE_CORE_EXPORT std::string from_type_index(std::type_index t);

template<typename T>
std::string pretty()
{
	return from_type_index(typeid(T));
}

/// @brief Cleans a function signature captured by source_location for log records.
RECEIPTWIRE_CORE_EXPORT std::string pretty_function(const std::string& function_name);

} // namespace receiptwire::type_name

#endif // RECEIPTWIRE_TYPE_NAME_H
