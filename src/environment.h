/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_ENVIRONMENT_H
#define RECEIPTWIRE_ENVIRONMENT_H

#include "core_export.h"
#include <optional>
#include <string>
#include <string_view>

namespace receiptwire::environment
{

/// @brief Value of an environment variable, or nullopt when it is not set.
RECEIPTWIRE_CORE_EXPORT std::optional<std::string> get(std::string_view name);

/// @brief Value of an environment variable, or the fallback when it is not set or empty.
RECEIPTWIRE_CORE_EXPORT std::string get_or(std::string_view name, std::string_view fallback);

} // namespace receiptwire::environment

#endif // RECEIPTWIRE_ENVIRONMENT_H
