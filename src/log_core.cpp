/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "log_core.h"

#include "type_name.h"
#include <algorithm>
#include <atomic>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/c_local_time_adjustor.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace receiptwire::log
{

namespace
{

struct filter_rule
{
	enum class kind { tag, file, func } type;
	std::string value;
	bool is_negative;
};

struct filter_spec
{
	std::vector<filter_rule> rules;
	bool wildcard_enabled = false;
};

filter_spec parse_filter(const std::string& filter_str)
{
	filter_spec filter;
	std::vector<std::string> rule_strings;
	boost::split(rule_strings, filter_str, boost::is_any_of(",; "));
	for (auto& rule_str : rule_strings)
	{
		boost::trim(rule_str);
		if (rule_str.empty())
			continue;
		if (rule_str == "*")
		{
			filter.wildcard_enabled = true;
			continue;
		}
		filter_rule rule;
		rule.is_negative = rule_str.front() == '-';
		std::string_view rule_view = rule_str;
		if (rule.is_negative)
			rule_view.remove_prefix(1);
		if (rule_view.starts_with("@file:"))
		{
			rule.type = filter_rule::kind::file;
			rule_view.remove_prefix(6);
		}
		else if (rule_view.starts_with("@func:"))
		{
			rule.type = filter_rule::kind::func;
			rule_view.remove_prefix(6);
		}
		else
			rule.type = filter_rule::kind::tag;
		rule.value = std::string{rule_view};
		filter.rules.push_back(std::move(rule));
	}
	return filter;
}

bool wildcard_match(std::string_view pattern, std::string_view text)
{
	if (pattern == "*")
		return true;
	auto pattern_iter = pattern.begin();
	auto text_iter = text.begin();
	auto star_pattern_iter = pattern.end();
	auto star_text_iter = text.end();
	while (text_iter != text.end())
	{
		if (pattern_iter != pattern.end() && *pattern_iter == '*')
		{
			star_pattern_iter = pattern_iter++;
			star_text_iter = text_iter;
		}
		else if (pattern_iter != pattern.end() && (*pattern_iter == '?' || *pattern_iter == *text_iter))
		{
			++pattern_iter;
			++text_iter;
		}
		else if (star_pattern_iter != pattern.end())
		{
			// backtrack: let the last star swallow one more character
			pattern_iter = star_pattern_iter + 1;
			text_iter = ++star_text_iter;
		}
		else
			return false;
	}
	while (pattern_iter != pattern.end() && *pattern_iter == '*')
		++pattern_iter;
	return pattern_iter == pattern.end();
}

bool rule_matches(const filter_rule& rule, std::string_view file_name, std::string_view function_name,
	std::span<const std::string_view> tags)
{
	switch (rule.type)
	{
		case filter_rule::kind::file:
			return wildcard_match(rule.value, file_name);
		case filter_rule::kind::func:
			return wildcard_match(rule.value, function_name);
		case filter_rule::kind::tag:
			return std::any_of(tags.begin(), tags.end(), [&](std::string_view tag) { return wildcard_match(rule.value, tag); });
	}
	return false;
}

std::mutex filter_mutex;
filter_spec current_filter;
std::string current_filter_str;

std::atomic<bool> logging_enabled{false};
std::function<void(const record&)> sink_callback;
std::mutex sink_mutex;

} // anonymous namespace

void set_filter(const std::string& filter_spec)
{
	std::lock_guard lock(filter_mutex);
	current_filter = parse_filter(filter_spec);
	current_filter_str = filter_spec;
}

std::string get_filter()
{
	std::lock_guard lock(filter_mutex);
	return current_filter_str;
}

void set_sink(std::function<void(const record&)> callback)
{
	std::lock_guard lock(sink_mutex);
	sink_callback = std::move(callback);
	logging_enabled.store(static_cast<bool>(sink_callback), std::memory_order_release);
}

std::function<void(const record&)> get_sink()
{
	std::lock_guard lock(sink_mutex);
	return sink_callback;
}

bool detail::is_enabled(const source_location& location, std::span<const std::string_view> entry_tags)
{
	std::lock_guard lock(filter_mutex);
	std::string file_name = std::filesystem::path(location.file_name()).filename().string();
	std::string function_name = type_name::pretty_function(location.function_name());
	for (const auto& rule : current_filter.rules)
	{
		if (rule.is_negative && rule_matches(rule, file_name, function_name, entry_tags))
			return false;
	}
	if (current_filter.wildcard_enabled)
		return true;
	return std::any_of(current_filter.rules.begin(), current_filter.rules.end(),
		[&](const filter_rule& rule)
		{
			return !rule.is_negative && rule_matches(rule, file_name, function_name, entry_tags);
		});
}

bool detail::is_logging_enabled()
{
	return logging_enabled.load(std::memory_order_acquire);
}

void detail::write(const record& rec)
{
	std::lock_guard lock(sink_mutex);
	if (sink_callback)
		sink_callback(rec);
}

serialization::object create_base_metadata(const source_location& location)
{
	boost::posix_time::ptime utc_time = boost::posix_time::second_clock::universal_time();
	boost::date_time::c_local_adjustor<boost::posix_time::ptime> local_adjustor;
	boost::posix_time::ptime local_time = local_adjustor.utc_to_local(utc_time);
	long offset_seconds = (local_time - utc_time).total_seconds();
	int offset_hours = offset_seconds / 3600;
	int offset_minutes = (offset_seconds % 3600) / 60;
	std::ostringstream time_stream;
	time_stream << boost::posix_time::to_iso_extended_string(local_time) << std::setw(5) << std::setfill('0')
		<< std::internal << std::showpos << offset_hours * 100 + offset_minutes;

	std::ostringstream thread_stream;
	thread_stream << std::this_thread::get_id();

	serialization::object metadata;
	metadata.v = {
		{"timestamp", time_stream.str()},
		{"file", std::filesystem::path(location.file_name()).filename().string()},
		{"line", static_cast<std::int64_t>(location.line())},
		{"function", type_name::pretty_function(location.function_name())},
		{"thread_id", thread_stream.str()}
	};
	return metadata;
}

} // namespace receiptwire::log
