/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "log_json_stream_sink.h"

#include "json_serialization.h"
#include <memory>
#include <mutex>

namespace receiptwire::log
{

std::function<void(const record&)> json_stream_sink(std::ostream& stream)
{
	struct stream_state
	{
		std::ostream& m_stream;
		bool m_first_record = true;
		std::mutex m_mutex;

		explicit stream_state(std::ostream& s) : m_stream(s) {}

		~stream_state()
		{
			if (!m_first_record)
				m_stream << std::endl << "]" << std::endl;
		}
	};

	auto state = std::make_shared<stream_state>(stream);

	return [state](const record& rec)
	{
		serialization::object record_object = create_base_metadata(rec.location);
		record_object.v["log"] = rec.context;
		std::string json_output = serialization::to_json(record_object);

		std::lock_guard lock(state->m_mutex);
		state->m_stream << (state->m_first_record ? "[" : ",") << std::endl << json_output;
		state->m_first_record = false;
	};
}

} // namespace receiptwire::log
