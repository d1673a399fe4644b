/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "email_body.h"

#include <boost/regex.hpp>

namespace receiptwire
{

raw_email_body detect_body_type(std::string content)
{
	static const boost::regex html_tag{
		R"(<(?:!doctype\s+html|/?(?:html|body|table|div|p|br|span|td|tr|a|img|font)\b)[^>]*>)",
		boost::regex::perl | boost::regex::icase};
	if (boost::regex_search(content, html_tag))
		return html_body{std::move(content)};
	return plain_text_body{std::move(content)};
}

} // namespace receiptwire
