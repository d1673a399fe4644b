/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "openai_chat_client.h"

#include "environment.h"
#include "error_tags.h"
#include "log_entry.h"
#include "make_error.h"
#include "throw_if.h"
#include <boost/json.hpp>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace receiptwire::openai
{

namespace
{

struct curl_easy_deleter
{
	void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct curl_slist_deleter
{
	void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using curl_easy_ptr = std::unique_ptr<CURL, curl_easy_deleter>;
using curl_slist_ptr = std::unique_ptr<curl_slist, curl_slist_deleter>;

size_t append_to_string(char* contents, size_t size, size_t nmemb, void* userp)
{
	static_cast<std::string*>(userp)->append(contents, size * nmemb);
	return size * nmemb;
}

void ensure_curl_initialized()
{
	static std::once_flag init_flag;
	std::call_once(init_flag, []
	{
		CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
		throw_if(code != CURLE_OK, "curl_global_init() failed", errors::network_failure{}, code);
	});
}

curl_slist_ptr append_header(curl_slist_ptr headers, const std::string& header)
{
	curl_slist* extended = curl_slist_append(headers.get(), header.c_str());
	throw_if(extended == nullptr, "curl_slist_append() failed");
	headers.release();
	return curl_slist_ptr{extended};
}

std::string request_body(const std::string& model, const std::string& system_prompt, const std::string& user_prompt)
{
	boost::json::object body;
	body["model"] = model;
	body["messages"] = boost::json::array{
		boost::json::object{{"role", "system"}, {"content", system_prompt}},
		boost::json::object{{"role", "user"}, {"content", user_prompt}}
	};
	body["temperature"] = 0.0;
	body["max_tokens"] = 500;
	return boost::json::serialize(body);
}

std::string reply_content(const std::string& response_text)
{
	boost::json::error_code ec;
	boost::json::value response = boost::json::parse(response_text, ec);
	if (!ec && response.is_object())
	{
		const boost::json::value* choices = response.get_object().if_contains("choices");
		if (choices && choices->is_array() && !choices->get_array().empty())
		{
			const boost::json::value& choice = choices->get_array().front();
			const boost::json::value* message = choice.is_object() ? choice.get_object().if_contains("message") : nullptr;
			const boost::json::value* content = message && message->is_object() ? message->get_object().if_contains("content") : nullptr;
			if (content && content->is_string())
				return std::string{content->get_string()};
		}
	}
	throw make_error("Chat completion response has no message content", errors::uninterpretable_response{});
}

} // anonymous namespace

chat_client::chat_client(std::string api_key, std::string model, std::string base_url, long timeout_seconds)
	: m_api_key(std::move(api_key)), m_model(std::move(model)), m_base_url(std::move(base_url)), m_timeout_seconds(timeout_seconds)
{
}

chat_client chat_client::from_environment()
{
	std::optional<std::string> api_key = environment::get("OPENAI_API_KEY");
	throw_if(!api_key || api_key->empty(), "OPENAI_API_KEY environment variable is not set", errors::missing_configuration{});
	return chat_client{*api_key,
		environment::get_or("RECEIPTWIRE_MODEL", "gpt-3.5-turbo"),
		environment::get_or("RECEIPTWIRE_MODEL_BASE_URL", "https://api.openai.com/v1")};
}

std::string chat_client::complete(const std::string& system_prompt, const std::string& user_prompt)
{
	ensure_curl_initialized();
	curl_easy_ptr handle{curl_easy_init()};
	throw_if(!handle, "curl_easy_init() failed", errors::network_failure{});

	std::string url = m_base_url + "/chat/completions";
	std::string body = request_body(m_model, system_prompt, user_prompt);
	std::string response_text;
	curl_slist_ptr headers = append_header(nullptr, "Content-Type: application/json");
	headers = append_header(std::move(headers), "Authorization: Bearer " + m_api_key);

	curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
	curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
	curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
	curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, append_to_string);
	curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_text);
	curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, m_timeout_seconds);
	curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT, 10L);

	log_entry("Sending chat completion request", url, m_model);
	CURLcode code = curl_easy_perform(handle.get());
	if (code != CURLE_OK)
	{
		std::string curl_error = curl_easy_strerror(code);
		throw make_error("Chat completion request failed", errors::network_failure{}, url, curl_error);
	}
	long http_status = 0;
	curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_status);
	throw_if(http_status >= 400, "Chat completion endpoint returned an error status", errors::network_failure{}, url, http_status, response_text);
	return reply_content(response_text);
}

} // namespace receiptwire::openai
