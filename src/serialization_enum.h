/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_SERIALIZATION_ENUM_H
#define RECEIPTWIRE_SERIALIZATION_ENUM_H

#include "serialization_base.h"
#include <magic_enum/magic_enum.hpp>

namespace receiptwire::serialization
{

template <typename T> requires std::is_enum_v<T>
struct serializer<T>
{
	value full(const T& v) const { return std::string{magic_enum::enum_name(v)}; }
};

} // namespace receiptwire::serialization

#endif // RECEIPTWIRE_SERIALIZATION_ENUM_H
