/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_ENSURE_H
#define RECEIPTWIRE_ENSURE_H

#include "concepts.h"
#include "source_location.h"
#include "throw_if.h"
#include <cassert>
#include <initializer_list>
#include <string_view>

namespace receiptwire
{

/**
 * @brief Fluent check that throws an error with both operands and the call location when it fails.
 *
 * @code
 * ensure(record.fields.at(field::vendor_name)) == "Acme Corp";
 * ensure(items.size()) >= 1;
 * ensure(message).contains("network failure");
 * @endcode
 *
 * In debug builds the destructor asserts that a comparison was actually performed, which catches
 * `ensure(a == b);`.
 */
template<typename T>
class [[nodiscard]] ensure
{
public:
	explicit ensure(const T& value, const source_location& loc = source_location::current())
		: m_value(value), m_location(loc)
	{}

	~ensure()
	{
		assert(m_comparison_performed && "ensure() used without a comparison operator");
	}

	template<typename U>
	void operator==(const U& other) const
	{
		set_comparison_performed();
		RECEIPTWIRE_THROW_IF_AT_LOCATION(!(m_value == other), m_location, m_value, other);
	}

	template<typename U>
	void operator!=(const U& other) const
	{
		set_comparison_performed();
		RECEIPTWIRE_THROW_IF_AT_LOCATION(!(m_value != other), m_location, m_value, other);
	}

	template<typename U>
	void operator>(const U& other) const
	{
		set_comparison_performed();
		RECEIPTWIRE_THROW_IF_AT_LOCATION(!(m_value > other), m_location, m_value, other);
	}

	template<typename U>
	void operator>=(const U& other) const
	{
		set_comparison_performed();
		RECEIPTWIRE_THROW_IF_AT_LOCATION(!(m_value >= other), m_location, m_value, other);
	}

	template<typename U>
	void operator<(const U& other) const
	{
		set_comparison_performed();
		RECEIPTWIRE_THROW_IF_AT_LOCATION(!(m_value < other), m_location, m_value, other);
	}

	/// @brief Only for string-like values: throws when the substring is not found.
	template<typename U>
	requires string_like<T> && string_like<U>
	void contains(const U& substring) const
	{
		set_comparison_performed();
		RECEIPTWIRE_THROW_IF_AT_LOCATION(std::string_view(m_value).find(substring) == std::string_view::npos, m_location, m_value, substring);
	}

	void is_one_of(std::initializer_list<T> expected_values) const
	{
		set_comparison_performed();
		for (const auto& expected : expected_values)
		{
			if (m_value == expected)
				return;
		}
		RECEIPTWIRE_THROW_IF_AT_LOCATION(true, m_location, m_value, expected_values);
	}

private:
	void set_comparison_performed() const
	{
#ifndef NDEBUG
		m_comparison_performed = true;
#endif
	}

	const T& m_value;
	source_location m_location;
#ifndef NDEBUG
	mutable bool m_comparison_performed = false;
#endif
};

template<typename T>
ensure(const T&, const source_location&) -> ensure<T>;

} // namespace receiptwire

#endif // RECEIPTWIRE_ENSURE_H
