/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_MAKE_ERROR_H
#define RECEIPTWIRE_MAKE_ERROR_H

#include "diagnostic_context.h"
#include "error.h" // IWYU pragma: keep
#include <tuple> // IWYU pragma: keep
#include <type_traits> // IWYU pragma: keep

#define RECEIPTWIRE_MAKE_ERROR_AT_LOCATION(explicit_location, ...) \
	[&](const auto& location) { \
		auto context_tuple = std::make_tuple(RECEIPTWIRE_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__)); \
		return std::apply([&](auto&&... args) { \
			return receiptwire::errors::impl<std::remove_cvref_t<decltype(args)>...>(context_tuple, location); \
		}, context_tuple); \
	}(explicit_location)

#define RECEIPTWIRE_MAKE_ERROR(...) \
	RECEIPTWIRE_MAKE_ERROR_AT_LOCATION(receiptwire::source_location::current() __VA_OPT__(,) __VA_ARGS__)

#define RECEIPTWIRE_MAKE_ERROR_PTR(...) \
	std::make_exception_ptr(RECEIPTWIRE_MAKE_ERROR(__VA_ARGS__))

#ifdef RECEIPTWIRE_ENABLE_SHORT_MACRO_NAMES
#define make_error RECEIPTWIRE_MAKE_ERROR
#define make_error_ptr RECEIPTWIRE_MAKE_ERROR_PTR
#endif

#endif // RECEIPTWIRE_MAKE_ERROR_H
