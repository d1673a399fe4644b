/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_RECORD_FLATTENING_H
#define RECEIPTWIRE_RECORD_FLATTENING_H

#include "core_export.h"
#include "extracted_record.h"
#include <string>
#include <utility>
#include <vector>

namespace receiptwire
{

/**
 * @brief Record as one column per value, for spreadsheet export.
 *
 * Present fields come first in canonical order, then for the i-th item (counted from 1) the present members
 * as item<i>_name, item<i>_quantity, item<i>_unit_price and item<i>_total_price.
 */
RECEIPTWIRE_CORE_EXPORT std::vector<std::pair<std::string, std::string>> flatten(const extracted_record& record);

} // namespace receiptwire

#endif // RECEIPTWIRE_RECORD_FLATTENING_H
