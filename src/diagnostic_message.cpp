/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "diagnostic_message.h"

#include "error.h"

namespace receiptwire::errors
{

namespace
{

std::string quote(const std::string& s)
{
	return "\"" + s + "\"";
}

std::string location_lines(const source_location& location, const std::string& prefix)
{
	return prefix + std::string{location.function_name()} + "\n" +
		"at " + std::string{location.file_name()} + ":" + std::to_string(location.line()) + "\n";
}

} // anonymous namespace

std::string diagnostic_message(const std::exception& e)
{
	std::string message;
	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception& nested_ex)
	{
		message = diagnostic_message(nested_ex);
	}
	catch (...)
	{
		message = "Unknown error\n";
	}

	const errors::base* error = dynamic_cast<const errors::base*>(&e);
	if (error == nullptr)
	{
		message += "Error: " + quote(e.what()) + "\n";
		message += "No location information available\n";
		return message;
	}
	size_t first_context_item = 0;
	if (message.empty())
	{
		message += "Error: " + (error->context_count() > 0 ? quote(error->context_string(0)) : quote(e.what())) + "\n";
		message += location_lines(error->location, "in ");
		first_context_item = 1;
	}
	else
		message += location_lines(error->location, "wrapping at: ");
	for (size_t i = first_context_item; i < error->context_count(); ++i)
		message += "with context " + quote(error->context_string(i)) + "\n";
	return message;
}

std::string diagnostic_message(std::exception_ptr eptr)
{
	try
	{
		std::rethrow_exception(eptr);
	}
	catch (const std::exception& e)
	{
		return diagnostic_message(e);
	}
	catch (...)
	{
		return "Unknown error\n";
	}
}

} // namespace receiptwire::errors
