/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_TEXT_ITEM_EXTRACTOR_H
#define RECEIPTWIRE_TEXT_ITEM_EXTRACTOR_H

#include "core_export.h"
#include "extracted_record.h"
#include <string>
#include <vector>

namespace receiptwire
{

/**
 * @brief Line items written as free text.
 *
 * Three case-sensitive item forms are searched and all their matches are returned, grouped by form:
 * "2 x Blue Shirt, $15.00", "2 Blue Shirt @ $15.00" and "Blue Shirt (2) $15.00" (currency $, EUR or £).
 * When none of them occurs, lines of the block following "Your Order", "Order Details", "Items" or
 * "Products" that carry a number are read as "name price", with an optional leading "N x" quantity.
 * Items from free text always have a quantity, 1 when none is written.
 */
RECEIPTWIRE_CORE_EXPORT std::vector<line_item> extract_text_items(const std::string& text);

} // namespace receiptwire

#endif // RECEIPTWIRE_TEXT_ITEM_EXTRACTOR_H
