/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_DIAGNOSTIC_CONTEXT_H
#define RECEIPTWIRE_DIAGNOSTIC_CONTEXT_H

#include "concepts.h"
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

/**
 * @brief Builds the context items attached to errors and log records.
 *
 * Every argument of `make_error(...)`, `log_entry(...)` or `log_scope(...)` becomes one item:
 * a variable is captured as a (name, value) pair using its spelling in the source, a string literal
 * is kept as an anonymous message and a tag (see `context_tag`) is passed through as is.
 */
namespace receiptwire::diagnostic_context
{

template<typename T>
auto make_context_item(const char* name, T&& v) -> std::pair<std::string, std::decay_t<T>>
{
	return {name, std::forward<T>(v)};
}

template <context_tag T>
T make_context_item(const char*, T&& v)
{
	return std::forward<T>(v);
}

template <std::size_t N>
const char* make_context_item(const char*, const char (&v)[N])
{
	return v;
}

} // namespace receiptwire::diagnostic_context

#define RECEIPTWIRE_DIAGNOSTIC_CONTEXT_MAKE_TUPLE_ELEM(r, data, i, elem) \
	BOOST_PP_COMMA_IF(i) receiptwire::diagnostic_context::make_context_item(BOOST_PP_STRINGIZE(elem), elem)

#define RECEIPTWIRE_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(...) \
	__VA_OPT__(BOOST_PP_SEQ_FOR_EACH_I(RECEIPTWIRE_DIAGNOSTIC_CONTEXT_MAKE_TUPLE_ELEM, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))

#define RECEIPTWIRE_DIAGNOSTIC_CONTEXT_GET_TYPE_ELEM(r, data, i, elem) \
	BOOST_PP_COMMA_IF(i) std::decay_t<decltype(receiptwire::diagnostic_context::make_context_item(BOOST_PP_STRINGIZE(elem), elem))>

#define RECEIPTWIRE_DIAGNOSTIC_CONTEXT_GET_TYPES(...) \
	__VA_OPT__(BOOST_PP_SEQ_FOR_EACH_I(RECEIPTWIRE_DIAGNOSTIC_CONTEXT_GET_TYPE_ELEM, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))

#endif // RECEIPTWIRE_DIAGNOSTIC_CONTEXT_H
