/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_LOG_JSON_STREAM_SINK_H
#define RECEIPTWIRE_LOG_JSON_STREAM_SINK_H

#include "core_export.h"
#include "log_core.h"
#include <functional>
#include <ostream>

namespace receiptwire::log
{

/**
 * @brief Sink writing records as a JSON array to a stream.
 *
 * The array is closed when the last copy of the returned function is destroyed. The stream must outlive it.
 *
 * @code
 * log::set_sink(log::json_stream_sink(std::clog));
 * log::set_filter("*");
 * @endcode
 */
RECEIPTWIRE_CORE_EXPORT std::function<void(const record&)> json_stream_sink(std::ostream& stream);

} // namespace receiptwire::log

#endif // RECEIPTWIRE_LOG_JSON_STREAM_SINK_H
