/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_HTML_DOCUMENT_H
#define RECEIPTWIRE_HTML_DOCUMENT_H

#include "core_export.h"
#include <boost/regex.hpp>
#include <optional>
#include <string>
#include <vector>

namespace receiptwire
{

/**
 * @brief Immutable snapshot of an HTML email body.
 *
 * The markup is parsed once. The parser's document is released before parse() returns and only the parts
 * needed for extraction are kept: the flattened text, the tables and their rows.
 * Malformed markup never fails, the parser recovers the way browsers do.
 */
class RECEIPTWIRE_CORE_EXPORT html_document
{
public:
	struct cell
	{
		/// @brief "td" or "th".
		std::string tag;
		/// @brief All descendant text with whitespace collapsed and trimmed.
		std::string text;
		/// @brief Trimmed, non-empty text nodes that are direct children of the cell.
		std::vector<std::string> own_text;
	};

	struct row
	{
		/// @brief Direct td and th children of the tr element.
		std::vector<cell> cells;
	};

	struct table
	{
		/// @brief Plain concatenation of all descendant text nodes.
		std::string text;
		/// @brief Every descendant tr element in document order, including rows of nested tables.
		std::vector<row> rows;
	};

	/**
	 * @brief Parses the markup. Markup errors are never reported, lexbor recovers from them.
	 * @throw errors::base only when lexbor runs out of memory while creating or building the document.
	 */
	static html_document parse(const std::string& html);

	/**
	 * @brief Visible text: script and style content and comments skipped, text nodes trimmed and joined
	 * with single spaces, whitespace runs collapsed. Non-breaking spaces count as whitespace.
	 */
	const std::string& text() const { return m_text; }

	/// @brief All tables in document order of their opening tags.
	const std::vector<table>& tables() const { return m_tables; }

	/**
	 * @brief Finds a value in the cell following a label cell.
	 *
	 * Cells whose own text matches label_pattern are visited in document order. For each of them the next td
	 * in the same row is searched with value_pattern and the first capture group of the first hit is returned.
	 * Searches aborted by the regex complexity guard count as no match.
	 */
	std::optional<std::string> find_value_next_to_label(const boost::regex& label_pattern, const boost::regex& value_pattern) const;

private:
	friend class html_snapshot_builder;

	std::string m_text;
	std::vector<table> m_tables;
	std::vector<row> m_rows;
};

} // namespace receiptwire

#endif // RECEIPTWIRE_HTML_DOCUMENT_H
