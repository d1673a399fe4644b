/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_JSON_SERIALIZATION_H
#define RECEIPTWIRE_JSON_SERIALIZATION_H

#include "core_export.h"
#include "serialization_base.h"
#include <string>

namespace receiptwire::serialization
{

/**
 * @brief Renders a serialized value as compact JSON text.
 */
RECEIPTWIRE_CORE_EXPORT std::string to_json(const value& s_val);

} // namespace receiptwire::serialization

#endif // RECEIPTWIRE_JSON_SERIALIZATION_H
