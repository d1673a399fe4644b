/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_EMAIL_BODY_H
#define RECEIPTWIRE_EMAIL_BODY_H

#include "core_export.h"
#include <string>
#include <variant>

namespace receiptwire
{

/// @brief Body taken from a text/plain part.
struct plain_text_body
{
	std::string content;
};

/// @brief Body taken from a text/html part.
struct html_body
{
	std::string content;
};

/**
 * @brief Email body to extract data from. Never modified by extraction.
 */
using raw_email_body = std::variant<plain_text_body, html_body>;

/**
 * @brief Chooses the body alternative by looking at the content.
 *
 * Content containing an HTML tag (html, body, table, div, p, br, span, td, tr, a, img, font or a doctype)
 * is treated as HTML, everything else as plain text.
 */
RECEIPTWIRE_CORE_EXPORT raw_email_body detect_body_type(std::string content);

} // namespace receiptwire

#endif // RECEIPTWIRE_EMAIL_BODY_H
