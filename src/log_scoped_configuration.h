/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_LOG_SCOPED_CONFIGURATION_H
#define RECEIPTWIRE_LOG_SCOPED_CONFIGURATION_H

#include "log_core.h"
#include <functional>
#include <string>
#include <utility>

namespace receiptwire::log
{

/**
 * @brief Installs a sink and a filter for its lifetime.
 *
 * The previous sink and filter are put back on destruction, which also destroys the installed sink
 * (a json_stream_sink closes its array at that point).
 *
 * @code
 * {
 *   log::scoped_configuration logging{log::json_stream_sink(std::clog), "audit,warning"};
 *   record = parse(body);
 * }
 * @endcode
 */
class scoped_configuration
{
public:
	scoped_configuration(std::function<void(const record&)> sink, const std::string& filter)
		: m_previous_sink(get_sink()), m_previous_filter(get_filter())
	{
		set_filter(filter);
		set_sink(std::move(sink));
	}

	scoped_configuration(const scoped_configuration&) = delete;
	scoped_configuration& operator=(const scoped_configuration&) = delete;

	~scoped_configuration()
	{
		set_sink(std::move(m_previous_sink));
		set_filter(m_previous_filter);
	}

private:
	std::function<void(const record&)> m_previous_sink;
	std::string m_previous_filter;
};

} // namespace receiptwire::log

#endif // RECEIPTWIRE_LOG_SCOPED_CONFIGURATION_H
