/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_CONCEPTS_H
#define RECEIPTWIRE_CONCEPTS_H

#include <concepts>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <variant>

namespace receiptwire
{

/**
 * @brief Types convertible to std::string_view (std::string, string literals, const char*).
 */
template<typename T>
concept string_like = std::is_convertible_v<T, std::string_view>;

/**
 * @brief Iterable types whose elements are not the type itself.
 */
template<typename T>
concept container = requires(const T& t) {
	{ std::begin(t) } -> std::input_iterator;
	{ std::end(t) } -> std::input_iterator;
	requires !std::is_same_v<std::remove_cvref_t<T>, std::remove_cvref_t<typename std::iterator_traits<decltype(std::begin(t))>::value_type>>;
};

/**
 * @brief Pointer-like types, including std::optional.
 */
template<typename T>
concept dereferenceable = requires(const T& t) { *t; !t; };

/**
 * @brief Empty marker types that name themselves. Used as error and log tags.
 */
template <typename T>
concept context_tag = std::is_empty_v<T> && requires { { T::string() } -> std::convertible_to<std::string_view>; };

template <typename T, typename Variant>
struct is_variant_alternative : std::false_type {};

template <typename T, typename... Us>
struct is_variant_alternative<T, std::variant<Us...>> : std::bool_constant<(std::is_same_v<T, Us> || ...)> {};

template <typename T, typename Variant>
concept variant_alternative = is_variant_alternative<T, Variant>::value;

} // namespace receiptwire

#endif // RECEIPTWIRE_CONCEPTS_H
