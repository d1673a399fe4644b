/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_ERROR_H
#define RECEIPTWIRE_ERROR_H

#include "core_export.h"
#include "diagnostic_context.h" // IWYU pragma: keep
#include "source_location.h"
#include "stringification.h"
#include <exception>
#include <string>
#include <tuple>
#include <typeinfo>
#include <utility>

/**
 * @brief Errors carrying the place they were raised and any number of context items.
 *
 * Errors are raised with the make_error macro and nested with std::throw_with_nested when a lower level
 * failure is wrapped. errors::diagnostic_message renders the whole chain for humans.
 */
namespace receiptwire::errors
{

/**
 * @brief Base class for all exceptions raised by the library.
 *
 * Context items are kept typed. They are converted to strings only on demand, so an error never carries
 * a pre-formatted message. what() returns the exception type name for compatibility with std::exception.
 *
 * @code
 * try {
 *   auto record = parse_via_external_model(client, body);
 * } catch (const receiptwire::errors::base& e) {
 *   std::cerr << errors::diagnostic_message(e) << std::endl;
 * }
 * @endcode
 *
 * @see errors::impl
 * @see errors::diagnostic_message
 */
struct RECEIPTWIRE_CORE_EXPORT base : public std::exception
{
	/// @brief The source location where the exception was created.
	source_location location;

	base(const source_location& location = source_location::current());

	/**
	 * @brief Type information of the context item at the given index.
	 * @see context_string
	 */
	virtual std::type_info const& context_type(size_t index) const noexcept = 0;

	/**
	 * @brief String representation of the context item at the given index.
	 * @see context_type
	 */
	virtual std::string context_string(size_t index) const = 0;

	virtual size_t context_count() const noexcept = 0;

	/**
	 * @brief The exception type name, never a formatted message.
	 * @see diagnostic_message
	 */
	const char* what() const noexcept override;

private:
	mutable std::string m_type_name;
};

/**
 * @brief Error holding a tuple of context items.
 *
 * Use the make_error macro instead of constructing it directly: the macro captures variable names
 * and the source location.
 *
 * @code
 * throw make_error("Model response is not valid JSON", errors::uninterpretable_response{}, response_text);
 * @endcode
 */
template <typename... T>
struct impl : public base
{
private:
	template<size_t I>
	std::string context_string_impl() const
	{
		return stringify(std::get<I>(context));
	}

	template<size_t I>
	const std::type_info& context_type_impl() const noexcept
	{
		return typeid(std::get<I>(context));
	}

	template <size_t... Is>
	std::string context_string_at(size_t index, std::index_sequence<Is...>) const
	{
		using func_type = std::string(impl::*)() const;
		static constexpr func_type funcs[] = { &impl::template context_string_impl<Is>... };
		return (this->*funcs[index])();
	}

	template <size_t... Is>
	const std::type_info& context_type_at(size_t index, std::index_sequence<Is...>) const noexcept
	{
		using func_type = const std::type_info&(impl::*)() const noexcept;
		static constexpr func_type funcs[] = { &impl::template context_type_impl<Is>... };
		return (this->*funcs[index])();
	}

public:
	std::tuple<T...> context;

	explicit impl(const std::tuple<T...>& context_tuple, const source_location& location = source_location::current())
		: base(location), context(context_tuple)
	{
	}

	std::type_info const& context_type(size_t index) const noexcept override
	{
		return context_type_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	std::string context_string(size_t index) const override
	{
		return context_string_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	size_t context_count() const noexcept override
	{
		return sizeof...(T);
	}
};

} // namespace receiptwire::errors

#endif // RECEIPTWIRE_ERROR_H
