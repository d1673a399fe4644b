/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "type_name.h"

#include <boost/algorithm/string.hpp>
#include <boost/core/demangle.hpp>

namespace receiptwire::type_name
{

namespace
{

std::string normalize_name(std::string name)
{
	boost::algorithm::erase_all(name, "__cdecl ");
	boost::algorithm::erase_all(name, "class ");
	boost::algorithm::erase_all(name, "struct ");
	boost::algorithm::replace_all(name, "::__cxx11", ""); // libstdc++ ABI tag
	boost::algorithm::replace_all(name, "std::__1::", "std::"); // libc++ inline namespace
	boost::algorithm::replace_all(name, "(void)", "()");
	boost::algorithm::replace_all(name, ", ", ",");
	boost::algorithm::replace_all(name, " >", ">");
	return name;
}

} // anonymous namespace

std::string from_type_index(std::type_index t)
{
	return normalize_name(boost::core::demangle(t.name()));
}

std::string pretty_function(const std::string& function_name)
{
	return normalize_name(function_name);
}

} // namespace receiptwire::type_name
