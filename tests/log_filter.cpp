#include "receiptwire.h"
#include <sstream>

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    std::vector<std::string> records;
    {
      log::scoped_configuration capture{
        [&records](const log::record& rec) { records.push_back(serialization::to_json(rec.context)); },
        "audit"};
      ensure(log::get_filter()) == "audit";
      ensure(log::detail::is_logging_enabled()) == true;
      int attempt = 1;
      log_entry(log::audit{}, "kept", attempt);
      log_entry("not tagged");
      ensure(records.size()) == 1u;
      ensure(records[0]) == R"(["audit","kept",{"attempt":1}])";

      records.clear();
      log::set_filter("*,-warning");
      log_entry(log::warning{}, "denied");
      log_entry(log::audit{}, "allowed");
      ensure(records.size()) == 1u;
      ensure(records[0]).contains("allowed");

      records.clear();
      log::set_filter("@file:log_filter.cpp");
      log_entry(log::audit{}, "matched by file");
      log::set_filter("@file:other_*.cpp");
      log_entry(log::audit{}, "other file");
      ensure(records.size()) == 1u;
      ensure(records[0]).contains("matched by file");

      records.clear();
      log::set_filter("aud?t");
      log_entry(log::audit{}, "wildcard tag");
      ensure(records.size()) == 1u;

#ifndef NDEBUG
      records.clear();
      log::set_filter("scope_enter scope_exit");
      {
        log_scope(attempt);
        ensure(records.size()) == 1u;
      }
      ensure(records.size()) == 2u;
      ensure(records[0]) == R"(["scope_enter",{"attempt":1}])";
      ensure(records[1]) == R"(["scope_exit",{"attempt":1}])";
#endif

      std::ostringstream stream;
      log::set_filter("audit");
      records.clear();
      {
        log::scoped_configuration streaming{log::json_stream_sink(stream), "*"};
        log_entry(log::audit{}, "streamed");
      }
      ensure(records.empty()) == true;
      std::string written = stream.str();
      ensure(written.starts_with("[")) == true;
      ensure(written).contains(R"("file":"log_filter.cpp")");
      ensure(written).contains(R"("log":["audit","streamed"])");
      // the array is closed when the streaming configuration goes away
      ensure(written).contains("]\n");

      // the capturing sink and its filter are back
      ensure(log::get_filter()) == "audit";
      log_entry(log::audit{}, "captured again");
      ensure(records.size()) == 1u;
    }

    ensure(log::detail::is_logging_enabled()) == false;
    ensure(log::get_filter()) == "";
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
