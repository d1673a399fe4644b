/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_H
#define RECEIPTWIRE_H

#include "contains_type.h" // IWYU pragma: export
#include "diagnostic_message.h" // IWYU pragma: export
#include "email_body.h" // IWYU pragma: export
#include "email_parser.h" // IWYU pragma: export
#include "ensure.h" // IWYU pragma: export
#include "environment.h" // IWYU pragma: export
#include "error_tags.h" // IWYU pragma: export
#include "extracted_record.h" // IWYU pragma: export
#include "extraction_rule.h" // IWYU pragma: export
#include "field_extractors.h" // IWYU pragma: export
#include "html_document.h" // IWYU pragma: export
#include "json_serialization.h" // IWYU pragma: export
#include "log_entry.h" // IWYU pragma: export
#include "log_json_stream_sink.h" // IWYU pragma: export
#include "log_scope.h" // IWYU pragma: export
#include "log_scoped_configuration.h" // IWYU pragma: export
#include "make_error.h" // IWYU pragma: export
#include "model_extractor.h" // IWYU pragma: export
#include "openai_chat_client.h" // IWYU pragma: export
#include "record_flattening.h" // IWYU pragma: export
#include "serialization_record.h" // IWYU pragma: export
#include "table_item_extractor.h" // IWYU pragma: export
#include "text_item_extractor.h" // IWYU pragma: export
#include "text_normalizer.h" // IWYU pragma: export
#include "throw_if.h" // IWYU pragma: export
#include <iostream> // IWYU pragma: export

#endif // RECEIPTWIRE_H
