/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_LOG_CORE_H
#define RECEIPTWIRE_LOG_CORE_H

#include "core_export.h"
#include "serialization_base.h"
#include "source_location.h"
#include <functional>
#include <span>
#include <string>
#include <string_view>

/**
 * @brief Structured logging.
 *
 * Records are built from the same context items as errors and handed to a sink as a tree of
 * serialization values. Nothing is logged until both a sink and a filter are set.
 *
 * Filter syntax: comma, semicolon or space separated rules. `*` enables everything, a bare word enables
 * records carrying a matching tag, `@file:` and `@func:` match the source file name and function signature.
 * A leading `-` turns a rule into a deny rule. Deny rules win. Rule values may contain `*` and `?` wildcards.
 *
 * In release builds only records tagged `log::audit` or `log::warning` are compiled in.
 */
namespace receiptwire::log
{

struct RECEIPTWIRE_CORE_EXPORT record
{
	source_location location;
	serialization::array context;
};

RECEIPTWIRE_CORE_EXPORT void set_filter(const std::string& filter_spec);

RECEIPTWIRE_CORE_EXPORT std::string get_filter();

/**
 * @brief Sets the function receiving all enabled records. An empty function disables logging.
 * @see json_stream_sink
 */
RECEIPTWIRE_CORE_EXPORT void set_sink(std::function<void(const record&)> callback);

RECEIPTWIRE_CORE_EXPORT std::function<void(const record&)> get_sink();

/**
 * @brief Timestamp, file, line, function and thread id of a record.
 */
RECEIPTWIRE_CORE_EXPORT serialization::object create_base_metadata(const source_location& location);

namespace detail
{
RECEIPTWIRE_CORE_EXPORT bool is_enabled(const source_location& location, std::span<const std::string_view> entry_tags);
RECEIPTWIRE_CORE_EXPORT bool is_logging_enabled();
RECEIPTWIRE_CORE_EXPORT void write(const record& rec);
} // namespace detail

} // namespace receiptwire::log

#endif // RECEIPTWIRE_LOG_CORE_H
