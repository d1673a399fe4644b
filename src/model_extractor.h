/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_MODEL_EXTRACTOR_H
#define RECEIPTWIRE_MODEL_EXTRACTOR_H

#include "core_export.h"
#include "extracted_record.h"
#include <string>

namespace receiptwire
{

/**
 * @brief A language model answering a single prompt.
 *
 * Implementations return the text of the model's reply and throw errors::base tagged
 * errors::network_failure or errors::uninterpretable_response when no reply could be obtained.
 * @see openai::chat_client
 */
class RECEIPTWIRE_CORE_EXPORT model_client
{
public:
	virtual ~model_client() = default;
	virtual std::string complete(const std::string& system_prompt, const std::string& user_prompt) = 0;
};

struct extraction_prompt
{
	std::string system;
	std::string user;
};

/// @brief Prompt asking for all canonical fields of the email text as one JSON object.
RECEIPTWIRE_CORE_EXPORT extraction_prompt build_extraction_prompt(const std::string& email_text);

/**
 * @brief Reads the model's reply as a record.
 *
 * The reply must be a JSON object, optionally inside a markdown code fence. Keys are field keys,
 * strings and numbers become values, null or missing keys leave the field absent. An optional "items" array
 * of objects with name, quantity, unit_price and total_price gives the line items.
 *
 * @throw errors::base tagged errors::uninterpretable_response when the reply is not a JSON object.
 */
RECEIPTWIRE_CORE_EXPORT extracted_record decode_model_response(const std::string& content);

/**
 * @brief Extraction delegated to a language model. The model is asked once, never retried.
 *
 * Failures of the client are rethrown nested in an error describing the request.
 */
RECEIPTWIRE_CORE_EXPORT extracted_record parse_via_external_model(const std::string& email_text, model_client& client);

} // namespace receiptwire

#endif // RECEIPTWIRE_MODEL_EXTRACTOR_H
