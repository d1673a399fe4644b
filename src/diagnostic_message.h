/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_DIAGNOSTIC_MESSAGE_H
#define RECEIPTWIRE_DIAGNOSTIC_MESSAGE_H

#include "core_export.h"
#include <exception>
#include <string>

namespace receiptwire::errors
{

/**
 * @brief Human readable description of an exception and all exceptions nested in it.
 *
 * The innermost error comes first with its message and location. Every wrapping level follows with its own
 * location and context items.
 */
RECEIPTWIRE_CORE_EXPORT std::string diagnostic_message(const std::exception& e);

RECEIPTWIRE_CORE_EXPORT std::string diagnostic_message(std::exception_ptr eptr);

} // namespace receiptwire::errors

#endif // RECEIPTWIRE_DIAGNOSTIC_MESSAGE_H
