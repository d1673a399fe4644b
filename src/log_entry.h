/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_LOG_ENTRY_H
#define RECEIPTWIRE_LOG_ENTRY_H

#include "diagnostic_context.h"
#include "log_core.h"
#include "log_tags.h"
#include "serialization_base.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace receiptwire::log
{

namespace detail
{

template <typename... T>
consteval bool should_log_in_release()
{
	return (false || ... || (std::is_same_v<T, log::audit> || std::is_same_v<T, log::warning>));
}

template <typename T>
void collect_tag(std::vector<std::string_view>& tags, const T&)
{
	if constexpr (context_tag<T>)
		tags.push_back(T::string());
}

template <typename T>
serialization::value to_log_value(const T& item)
{
	if constexpr (context_tag<T>)
		return std::string{T::string()};
	else
		return serialization::full(item);
}

template <typename T>
serialization::value to_log_value(const std::pair<std::string, T>& item)
{
	return serialization::object{{{item.first, serialization::full(item.second)}}};
}

} // namespace detail

/**
 * @brief Writes one record if the filter enables it for the given location and the tags found in the context.
 *
 * Use the log_entry macro, which names the context items after the variables passed to it.
 */
template <typename... T>
void entry(const source_location& location, const std::tuple<T...>& context)
{
	std::vector<std::string_view> tags;
	std::apply([&](const auto&... items) { (detail::collect_tag(tags, items), ...); }, context);
	if (!detail::is_enabled(location, tags))
		return;
	record rec{location, {}};
	std::apply([&](const auto&... items) { (rec.context.v.push_back(detail::to_log_value(items)), ...); }, context);
	detail::write(rec);
}

} // namespace receiptwire::log

#ifdef NDEBUG
	#define RECEIPTWIRE_LOG_ENTRY(...) \
		do { \
			if constexpr (receiptwire::log::detail::should_log_in_release<RECEIPTWIRE_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)>()) \
			{ \
				if (receiptwire::log::detail::is_logging_enabled()) \
					receiptwire::log::entry(receiptwire::source_location::current(), std::make_tuple(RECEIPTWIRE_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
			} \
		} while (false)
#else
	#define RECEIPTWIRE_LOG_ENTRY(...) \
		do { \
			if (receiptwire::log::detail::is_logging_enabled()) \
				receiptwire::log::entry(receiptwire::source_location::current(), std::make_tuple(RECEIPTWIRE_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
		} while (false)
#endif

#ifdef RECEIPTWIRE_ENABLE_SHORT_MACRO_NAMES
	#define log_entry(...) RECEIPTWIRE_LOG_ENTRY(__VA_ARGS__)
#endif

#endif // RECEIPTWIRE_LOG_ENTRY_H
