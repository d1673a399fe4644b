/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "receiptwire.h"

#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace po = boost::program_options;

namespace
{

using namespace receiptwire;

std::string read_all(std::istream& input)
{
	return std::string{std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{}};
}

std::string read_input(const std::string& path)
{
	if (path.empty() || path == "-")
		return read_all(std::cin);
	std::ifstream file{path, std::ios::binary};
	throw_if(!file, "Cannot open input file", path);
	return read_all(file);
}

extracted_record extract_with_model(const std::string& text)
{
	openai::chat_client client = openai::chat_client::from_environment();
	log_entry(log::audit{}, "Using external model", client.model());
	try
	{
		return parse_via_external_model(text, client);
	}
	catch (const std::exception& e)
	{
		if (!errors::contains_type<errors::uninterpretable_response>(e))
			throw;
		std::string diagnostic = errors::diagnostic_message(e);
		log_entry(log::warning{}, "Model response could not be decoded, using an empty record", diagnostic);
		return extracted_record{};
	}
}

} // anonymous namespace

int main(int argc, char* argv[])
{
	using namespace receiptwire;

	po::options_description visible_options{"Usage: receiptwire [options] [FILE]\nOptions"};
	visible_options.add_options()
		("help,h", "show this help")
		("html", "treat the input as HTML")
		("text", "treat the input as plain text")
		("model", "extract with the OpenAI chat model configured by OPENAI_API_KEY, RECEIPTWIRE_MODEL and RECEIPTWIRE_MODEL_BASE_URL")
		("flat", "print key=value lines instead of JSON")
		("log-filter", po::value<std::string>(), "enable JSON logs on stderr, e.g. \"*\" or \"audit,warning\" (default: RECEIPTWIRE_LOG_FILTER)");
	po::options_description all_options;
	all_options.add(visible_options).add_options()
		("input", po::value<std::string>()->default_value(""), "input file");
	po::positional_options_description positional;
	positional.add("input", 1);

	po::variables_map options;
	try
	{
		po::store(po::command_line_parser(argc, argv).options(all_options).positional(positional).run(), options);
		po::notify(options);
	}
	catch (const po::error& e)
	{
		std::cerr << e.what() << std::endl << visible_options << std::endl;
		return 2;
	}
	if (options.count("help"))
	{
		std::cout << visible_options << std::endl;
		return 0;
	}
	if (options.count("html") && options.count("text"))
	{
		std::cerr << "--html and --text are mutually exclusive" << std::endl;
		return 2;
	}

	std::optional<std::string> log_filter = options.count("log-filter")
		? std::optional<std::string>{options["log-filter"].as<std::string>()}
		: environment::get("RECEIPTWIRE_LOG_FILTER");
	std::optional<log::scoped_configuration> logging;
	if (log_filter && !log_filter->empty())
		logging.emplace(log::json_stream_sink(std::clog), *log_filter);

	int exit_code = 0;
	try
	{
		std::string content = read_input(options["input"].as<std::string>());
		raw_email_body body = options.count("html") ? raw_email_body{html_body{std::move(content)}}
			: options.count("text") ? raw_email_body{plain_text_body{std::move(content)}}
			: detect_body_type(std::move(content));
		bool is_html = std::holds_alternative<html_body>(body);
		log_entry(log::audit{}, "Input read", is_html);

		extracted_record record;
		if (options.count("model"))
		{
			std::string text = std::visit(
				[](const auto& b) { return std::is_same_v<std::decay_t<decltype(b)>, html_body> ? normalize(b.content) : b.content; },
				body);
			record = extract_with_model(text);
		}
		else
			record = parse(body);

		if (options.count("flat"))
		{
			for (const auto& [key, value] : flatten(record))
				std::cout << key << "=" << value << std::endl;
		}
		else
			std::cout << serialization::to_json(serialization::full(record)) << std::endl;
	}
	catch (const std::exception& e)
	{
		std::cerr << errors::diagnostic_message(e) << std::endl;
		exit_code = 1;
	}
	return exit_code;
}
