/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_THROW_IF_H
#define RECEIPTWIRE_THROW_IF_H

#include "make_error.h"

#define RECEIPTWIRE_THROW_IF_AT_LOCATION(condition, explicit_location, ...) \
	do { \
		if (condition) \
			throw RECEIPTWIRE_MAKE_ERROR_AT_LOCATION(explicit_location, #condition __VA_OPT__(,) __VA_ARGS__); \
	} while (false)

#define RECEIPTWIRE_THROW_IF(condition, ...) \
	RECEIPTWIRE_THROW_IF_AT_LOCATION(condition, receiptwire::source_location::current() __VA_OPT__(,) __VA_ARGS__)

#ifdef RECEIPTWIRE_ENABLE_SHORT_MACRO_NAMES
#define throw_if RECEIPTWIRE_THROW_IF
#endif

#endif // RECEIPTWIRE_THROW_IF_H
