/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_OPENAI_CHAT_CLIENT_H
#define RECEIPTWIRE_OPENAI_CHAT_CLIENT_H

#include "core_export.h"
#include "model_extractor.h"
#include <string>

namespace receiptwire::openai
{

/**
 * @brief model_client talking to an OpenAI compatible chat completions endpoint.
 *
 * Sends the system and user prompts with temperature 0 and at most 500 reply tokens and returns the content
 * of the first choice.
 */
class RECEIPTWIRE_CORE_EXPORT chat_client : public model_client
{
public:
	explicit chat_client(std::string api_key, std::string model = "gpt-3.5-turbo",
		std::string base_url = "https://api.openai.com/v1", long timeout_seconds = 60);

	/**
	 * @brief Client configured from OPENAI_API_KEY, RECEIPTWIRE_MODEL and RECEIPTWIRE_MODEL_BASE_URL.
	 * @throw errors::base tagged errors::missing_configuration when OPENAI_API_KEY is not set.
	 */
	static chat_client from_environment();

	std::string complete(const std::string& system_prompt, const std::string& user_prompt) override;

	const std::string& model() const { return m_model; }

private:
	std::string m_api_key;
	std::string m_model;
	std::string m_base_url;
	long m_timeout_seconds;
};

} // namespace receiptwire::openai

#endif // RECEIPTWIRE_OPENAI_CHAT_CLIENT_H
