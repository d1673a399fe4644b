/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_TEXT_NORMALIZER_H
#define RECEIPTWIRE_TEXT_NORMALIZER_H

#include "core_export.h"
#include <string>

namespace receiptwire
{

/**
 * @brief Converts HTML markup to flat text suitable for the field extractors.
 *
 * Markup is stripped, script and style content is dropped and every text node becomes a separate word group,
 * so "<td>Total</td><td>$5</td>" gives "Total $5". Whitespace runs are collapsed to single spaces.
 * Broken markup gives best-effort text.
 *
 * @see html_document::text
 */
RECEIPTWIRE_CORE_EXPORT std::string normalize(const std::string& html);

} // namespace receiptwire

#endif // RECEIPTWIRE_TEXT_NORMALIZER_H
