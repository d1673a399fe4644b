/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "error.h"

#include "type_name.h"

namespace receiptwire::errors
{

base::base(const source_location& location)
	: location(location)
{
}

const char* base::what() const noexcept
{
	try
	{
		if (m_type_name.empty())
			m_type_name = type_name::from_type_index(typeid(*this));
		return m_type_name.c_str();
	}
	catch (const std::exception&)
	{
		return "receiptwire::errors::base";
	}
}

} // namespace receiptwire::errors
