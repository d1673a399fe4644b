/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_LOG_SCOPE_H
#define RECEIPTWIRE_LOG_SCOPE_H

#include "log_entry.h"
#include <boost/preprocessor/cat.hpp>
#include <optional> // IWYU pragma: keep

namespace receiptwire::log::detail
{

/**
 * @brief Writes a scope_enter record on construction and a scope_exit record with the same context on destruction.
 */
template <typename... Args>
class scope
{
public:
	scope(const source_location& location, std::tuple<Args...>&& args_tuple)
		: m_location(location), m_args_tuple(std::move(args_tuple))
	{
		log::entry(m_location, std::tuple_cat(std::make_tuple(log::scope_enter{}), m_args_tuple));
	}

	scope(const scope&) = delete;
	scope& operator=(const scope&) = delete;

	~scope() noexcept
	{
		try
		{
			log::entry(m_location, std::tuple_cat(std::make_tuple(log::scope_exit{}), m_args_tuple));
		}
		catch (const std::exception&)
		{
			// a failing sink must not terminate the unwinding scope
		}
	}

private:
	source_location m_location;
	std::tuple<Args...> m_args_tuple;
};

} // namespace receiptwire::log::detail

#ifdef NDEBUG
	#define RECEIPTWIRE_LOG_SCOPE(...) \
		[[maybe_unused]] auto BOOST_PP_CAT(receiptwire_log_scope_at_line_, __LINE__) = \
			[&](const auto& loc) { \
				using scope_type = receiptwire::log::detail::scope<RECEIPTWIRE_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)>; \
				if constexpr (receiptwire::log::detail::should_log_in_release<RECEIPTWIRE_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)>()) \
				{ \
					if (receiptwire::log::detail::is_logging_enabled()) \
						return std::optional<scope_type>(std::in_place, loc, std::make_tuple(RECEIPTWIRE_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
				} \
				return std::optional<scope_type>{}; \
			}(receiptwire::source_location::current())
#else
	#define RECEIPTWIRE_LOG_SCOPE(...) \
		[[maybe_unused]] auto BOOST_PP_CAT(receiptwire_log_scope_at_line_, __LINE__) = \
			[&](const auto& loc) { \
				using scope_type = receiptwire::log::detail::scope<RECEIPTWIRE_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)>; \
				if (receiptwire::log::detail::is_logging_enabled()) \
					return std::optional<scope_type>(std::in_place, loc, std::make_tuple(RECEIPTWIRE_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
				return std::optional<scope_type>{}; \
			}(receiptwire::source_location::current())
#endif

#ifdef RECEIPTWIRE_ENABLE_SHORT_MACRO_NAMES
	#define log_scope(...) RECEIPTWIRE_LOG_SCOPE(__VA_ARGS__)
#endif

#endif // RECEIPTWIRE_LOG_SCOPE_H
