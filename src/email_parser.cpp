/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "email_parser.h"

#include "field_extractors.h"
#include "html_document.h"
#include "log_scope.h"
#include "table_item_extractor.h"
#include "text_item_extractor.h"

namespace receiptwire
{

namespace
{

template <typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void set_if_found(extracted_record& record, field f, std::optional<std::string>&& value)
{
	if (value)
		record.fields.emplace(f, std::move(*value));
}

} // anonymous namespace

void extract_fields(extracted_record& record, const std::string& text, const html_document* html)
{
	set_if_found(record, field::vendor_name, extract_vendor_name(text));
	set_if_found(record, field::amount_due, extract_amount_due(text, html));
	set_if_found(record, field::date_due, extract_date_due(text));
	set_if_found(record, field::order_number, extract_order_number(text));
	set_if_found(record, field::order_date, extract_order_date(text));
	set_if_found(record, field::total_amount, extract_total_amount(text, html));
	set_if_found(record, field::shipping_address, extract_shipping_address(text));
	set_if_found(record, field::tracking_number, extract_tracking_number(text));
	set_if_found(record, field::email_from, extract_email_from(text));
}

extracted_record parse(const raw_email_body& body)
{
	log_scope();
	extracted_record record;
	std::visit(overloaded{
		[&](const plain_text_body& plain)
		{
			extract_fields(record, plain.content);
			record.items = extract_text_items(plain.content);
		},
		[&](const html_body& html)
		{
			html_document doc = html_document::parse(html.content);
			extract_fields(record, doc.text(), &doc);
			record.items = extract_table_items(doc);
			if (record.items.empty())
				record.items = extract_text_items(doc.text());
		}
	}, body);
	size_t field_count = record.fields.size();
	size_t item_count = record.items.size();
	log_entry("Extraction finished", field_count, item_count);
	return record;
}

} // namespace receiptwire
