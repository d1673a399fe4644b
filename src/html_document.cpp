/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "html_document.h"

#include "error_tags.h"
#include "extraction_rule.h"
#include "log_entry.h"
#include "make_error.h"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/dom/interfaces/node.h>
#include <lexbor/html/html.h>
#include <lexbor/html/parser.h>
#include <memory>
#include <string_view>

namespace receiptwire
{

namespace
{

struct document_deleter
{
	void operator()(lxb_html_document_t* doc) const noexcept
	{
		lxb_html_document_destroy(doc);
	}
};

using document_ptr = std::unique_ptr<lxb_html_document_t, document_deleter>;

std::string_view tag_name(lxb_dom_node_t* node)
{
	size_t length = 0;
	const lxb_char_t* name = lxb_dom_element_local_name(lxb_dom_interface_element(node), &length);
	return name ? std::string_view{reinterpret_cast<const char*>(name), length} : std::string_view{};
}

std::string node_text(lxb_dom_node_t* node)
{
	size_t length = 0;
	const lxb_char_t* data = lxb_dom_node_text_content(node, &length);
	if (data == nullptr || length == 0)
		return {};
	std::string text{reinterpret_cast<const char*>(data), length};
	boost::algorithm::replace_all(text, "\xC2\xA0", " ");
	return text;
}

std::string collapse_whitespace(const std::string& text)
{
	static const boost::regex whitespace_run{R"(\s+)"};
	return boost::algorithm::trim_copy(boost::regex_replace(text, whitespace_run, " "));
}

} // anonymous namespace

/**
 * @brief Walks the lexbor tree once and fills an html_document.
 */
class html_snapshot_builder
{
public:
	explicit html_snapshot_builder(html_document& doc) : m_doc(doc) {}

	void build(lxb_dom_node_t* root)
	{
		visit_children(root, {});
		std::string joined;
		for (const std::string& fragment : m_fragments)
		{
			std::string stripped = boost::algorithm::trim_copy(fragment);
			if (stripped.empty())
				continue;
			if (!joined.empty())
				joined += ' ';
			joined += stripped;
		}
		m_doc.m_text = collapse_whitespace(joined);
		for (auto& row : m_doc.m_rows)
			for (auto& cell : row.cells)
				cell.text = collapse_whitespace(cell.text);
		for (size_t t = 0; t < m_doc.m_tables.size(); ++t)
			for (size_t row_index : m_table_rows[t])
				m_doc.m_tables[t].rows.push_back(m_doc.m_rows[row_index]);
	}

private:
	struct cell_ref
	{
		size_t row;
		size_t cell;
	};

	struct context
	{
		std::optional<size_t> parent_row;
		std::vector<cell_ref> enclosing_cells;
		bool parent_is_cell = false;
	};

	void visit_children(lxb_dom_node_t* parent, const context& ctx)
	{
		for (lxb_dom_node_t* child = parent->first_child; child != nullptr; child = child->next)
			visit(child, ctx);
	}

	void visit(lxb_dom_node_t* node, const context& ctx)
	{
		switch (node->type)
		{
			case LXB_DOM_NODE_TYPE_TEXT:
				add_text(node_text(node), ctx);
				break;
			case LXB_DOM_NODE_TYPE_ELEMENT:
				visit_element(node, ctx);
				break;
			case LXB_DOM_NODE_TYPE_COMMENT:
				break;
			default:
				visit_children(node, {std::nullopt, ctx.enclosing_cells, false});
				break;
		}
	}

	void visit_element(lxb_dom_node_t* node, const context& ctx)
	{
		std::string_view name = tag_name(node);
		if (name == "script" || name == "style")
			return;
		context child_ctx{std::nullopt, ctx.enclosing_cells, false};
		if (name == "table")
		{
			m_open_tables.push_back(m_doc.m_tables.size());
			m_doc.m_tables.emplace_back();
			m_table_rows.emplace_back();
			visit_children(node, child_ctx);
			m_open_tables.pop_back();
			return;
		}
		if (name == "tr")
		{
			size_t row_index = m_doc.m_rows.size();
			m_doc.m_rows.emplace_back();
			for (size_t table_index : m_open_tables)
				m_table_rows[table_index].push_back(row_index);
			child_ctx.parent_row = row_index;
		}
		else if ((name == "td" || name == "th") && ctx.parent_row)
		{
			auto& cells = m_doc.m_rows[*ctx.parent_row].cells;
			cells.push_back(html_document::cell{std::string{name}, {}, {}});
			child_ctx.enclosing_cells.push_back({*ctx.parent_row, cells.size() - 1});
			child_ctx.parent_is_cell = true;
		}
		visit_children(node, child_ctx);
	}

	void add_text(const std::string& text, const context& ctx)
	{
		if (text.empty())
			return;
		m_fragments.push_back(text);
		for (size_t table_index : m_open_tables)
			m_doc.m_tables[table_index].text += text;
		for (const cell_ref& ref : ctx.enclosing_cells)
			m_doc.m_rows[ref.row].cells[ref.cell].text += text;
		if (ctx.parent_is_cell)
		{
			std::string stripped = boost::algorithm::trim_copy(text);
			if (!stripped.empty())
				m_doc.m_rows[ctx.enclosing_cells.back().row].cells[ctx.enclosing_cells.back().cell].own_text.push_back(stripped);
		}
	}

	html_document& m_doc;
	std::vector<std::string> m_fragments;
	std::vector<size_t> m_open_tables;
	std::vector<std::vector<size_t>> m_table_rows;
};

html_document html_document::parse(const std::string& html)
{
	document_ptr doc{lxb_html_document_create()};
	if (!doc)
		throw make_error("Failed to create HTML document");
	lxb_status_t status = lxb_html_document_parse(doc.get(), reinterpret_cast<const lxb_char_t*>(html.data()), html.size());
	if (status != LXB_STATUS_OK)
		throw make_error("lexbor could not allocate memory while parsing the HTML document", status);
	html_document result;
	html_snapshot_builder{result}.build(lxb_dom_interface_node(doc.get()));
	log_entry("HTML document parsed", result.m_tables.size(), result.m_rows.size());
	return result;
}

std::optional<std::string> html_document::find_value_next_to_label(const boost::regex& label_pattern, const boost::regex& value_pattern) const
{
	for (const row& r : m_rows)
	{
		for (auto label_cell = r.cells.begin(); label_cell != r.cells.end(); ++label_cell)
		{
			bool is_label = std::any_of(label_cell->own_text.begin(), label_cell->own_text.end(),
				[&](const std::string& fragment)
				{
					boost::smatch label_match;
					return safe_search(fragment, label_match, label_pattern);
				});
			if (!is_label)
				continue;
			auto value_cell = std::find_if(label_cell + 1, r.cells.end(), [](const cell& c) { return c.tag == "td"; });
			if (value_cell == r.cells.end())
				continue;
			boost::smatch match;
			if (safe_search(value_cell->text, match, value_pattern))
				return boost::algorithm::trim_copy(match.str(1));
		}
	}
	return std::nullopt;
}

} // namespace receiptwire
