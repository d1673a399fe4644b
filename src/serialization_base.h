/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_SERIALIZATION_BASE_H
#define RECEIPTWIRE_SERIALIZATION_BASE_H

#include "concepts.h"
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Generic, non-intrusive conversion of C++ values into a tree of primitives.
 *
 * `serialization::full(x)` turns any supported value into a `serialization::value`. Support for a new type
 * is added by specializing `serialization::serializer`. The tree is rendered to JSON by `to_json()` and is
 * what log records and error context strings are made of.
 */
namespace receiptwire::serialization
{

struct object;
struct array;

using value = std::variant<
	std::nullptr_t,
	bool,
	std::int64_t,
	std::uint64_t,
	double,
	std::string,
	array,
	object
>;

struct array { std::vector<value> v; };

struct object { std::map<std::string, value> v; };

template <typename T>
struct serializer;

template <typename T>
value full(const T& v) { return serializer<T>{}.full(v); }

template <typename T>
concept value_alternative = variant_alternative<T, value>;

template <value_alternative T>
struct serializer<T>
{
	value full(const T& v) const { return v; }
};

template <typename T> requires(std::is_arithmetic_v<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& v) const
	{
		if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
			return static_cast<std::int64_t>(v);
		else if constexpr (std::is_integral_v<T>)
			return static_cast<std::uint64_t>(v);
		else
			return static_cast<double>(v);
	}
};

template <typename T> requires(string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& v) const
	{
		if constexpr (std::is_pointer_v<std::decay_t<T>>)
		{
			if (v == nullptr)
				return nullptr;
		}
		return std::string(v);
	}
};

/**
 * @brief Pointers and std::optional: null when empty, the pointee otherwise.
 */
template <typename T> requires(dereferenceable<T> && !container<T> && !string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& v) const
	{
		if (v)
			return serialization::full(*v);
		return nullptr;
	}
};

template <typename T> requires(container<T> && !string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& items) const
	{
		array arr;
		for (const auto& item : items)
			arr.v.push_back(serialization::full(item));
		return arr;
	}
};

template <typename T1, typename T2>
struct serializer<std::pair<T1, T2>>
{
	value full(const std::pair<T1, T2>& p) const
	{
		return object{{
			{"first", serialization::full(p.first)},
			{"second", serialization::full(p.second)}
		}};
	}
};

} // namespace receiptwire::serialization

#endif // RECEIPTWIRE_SERIALIZATION_BASE_H
