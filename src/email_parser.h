/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_EMAIL_PARSER_H
#define RECEIPTWIRE_EMAIL_PARSER_H

#include "core_export.h"
#include "email_body.h"
#include "extracted_record.h"
#include "html_document.h"
#include <string>

namespace receiptwire
{

/**
 * @brief Runs all field and item extractors on an email body.
 *
 * Plain text is used as is. HTML is parsed once: fields are extracted from its flattened text with the
 * document available for label/value cells, items come from the first item table and, when that gives none,
 * from the flattened text. The result depends only on the body.
 *
 * @code
 * extracted_record record = parse(html_body{message_html});
 * if (auto total = record.get(field::total_amount))
 *   std::cout << *total << std::endl;
 * @endcode
 */
RECEIPTWIRE_CORE_EXPORT extracted_record parse(const raw_email_body& body);

/// @brief Field extractors only, on text with an optional parsed HTML document.
RECEIPTWIRE_CORE_EXPORT void extract_fields(extracted_record& record, const std::string& text, const html_document* html = nullptr);

} // namespace receiptwire

#endif // RECEIPTWIRE_EMAIL_PARSER_H
