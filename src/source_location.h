/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_SOURCE_LOCATION_H
#define RECEIPTWIRE_SOURCE_LOCATION_H

#include <cstdint>

// Clang before 16 ships <source_location> but reports the wrong caller: https://github.com/llvm/llvm-project/issues/56379
#if __has_include(<source_location>) && (!defined(__clang__) || __clang_major__ >= 16)
	#include <source_location>
	#define RECEIPTWIRE_STD_SOURCE_LOCATION 1
#else
	#define RECEIPTWIRE_STD_SOURCE_LOCATION 0
#endif

namespace receiptwire
{

/// @brief Minimal replacement of std::source_location built on compiler intrinsics.
class builtin_source_location
{
public:
	static constexpr builtin_source_location current(const char* file = __builtin_FILE(),
		const char* function = __builtin_FUNCTION(), std::uint_least32_t line = __builtin_LINE()) noexcept
	{
		builtin_source_location location;
		location.m_file = file;
		location.m_function = function;
		location.m_line = line;
		return location;
	}

	constexpr const char* file_name() const noexcept { return m_file; }
	constexpr const char* function_name() const noexcept { return m_function; }
	constexpr std::uint_least32_t line() const noexcept { return m_line; }
	constexpr std::uint_least32_t column() const noexcept { return 0; }

private:
	const char* m_file = "";
	const char* m_function = "";
	std::uint_least32_t m_line = 0;
};

#if RECEIPTWIRE_STD_SOURCE_LOCATION
using source_location = std::source_location;
#else
using source_location = builtin_source_location;
#endif

} // namespace receiptwire

#undef RECEIPTWIRE_STD_SOURCE_LOCATION

#endif // RECEIPTWIRE_SOURCE_LOCATION_H
