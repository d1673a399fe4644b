/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_TABLE_ITEM_EXTRACTOR_H
#define RECEIPTWIRE_TABLE_ITEM_EXTRACTOR_H

#include "core_export.h"
#include "extracted_record.h"
#include "html_document.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace receiptwire
{

enum class column_role
{
	name,
	quantity,
	price,
	total
};

/// @brief Column index per role, as assigned from a header row.
using table_column_map = std::map<column_role, size_t>;

/**
 * @brief Role of a column given its header text.
 *
 * Checked in priority order, case-insensitive substrings: name (item, product, description),
 * quantity (qty, quantity), price (price, unit, cost), total (total, amount, subtotal).
 */
RECEIPTWIRE_CORE_EXPORT std::optional<column_role> resolve_column_role(const std::string& header_text);

/// @brief Maps roles to columns. When several headers resolve to the same role the first one keeps it.
RECEIPTWIRE_CORE_EXPORT table_column_map map_columns(const html_document::row& header_row);

/**
 * @brief Number of item keywords (item, product, description, quantity, price, amount, subtotal)
 * occurring in the lowercased table text.
 */
RECEIPTWIRE_CORE_EXPORT int item_likeness_score(const html_document::table& table);

/// @brief Tables scoring at least this are considered item tables.
inline constexpr int item_table_min_score = 3;

/**
 * @brief Line items of one table, whatever its score.
 *
 * The first row is the header and must have a name column. Rows with too few cells for the mapped columns
 * or with an empty name are skipped. A quantity is set only when the quantity cell holds a positive number.
 */
RECEIPTWIRE_CORE_EXPORT std::vector<line_item> extract_items_from_table(const html_document::table& table);

/**
 * @brief Line items of the first table that looks like an item table.
 *
 * Only the first qualifying table is used even when it yields no items.
 */
RECEIPTWIRE_CORE_EXPORT std::vector<line_item> extract_table_items(const html_document& doc);

RECEIPTWIRE_CORE_EXPORT std::vector<line_item> extract_table_items(const std::string& html);

} // namespace receiptwire

#endif // RECEIPTWIRE_TABLE_ITEM_EXTRACTOR_H
