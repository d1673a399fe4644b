#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    std::vector<std::string> warnings;
    log::scoped_configuration capture{
      [&warnings](const log::record& rec) { warnings.push_back(serialization::to_json(rec.context)); },
      "warning"};

    // nested repetition backtracks exponentially on text that never ends with the literal
    const boost::regex runaway = case_sensitive_pattern("(.+)+xyz");
    const std::string endless_spaces(1024, ' ');
    const std::string short_match = std::string(200, ' ') + "xyz";

    boost::smatch match;
    ensure(safe_search(short_match, match, runaway)) == true;
    ensure(warnings.empty()) == true;

    ensure(safe_search(endless_spaces, match, runaway)) == false;
    ensure(warnings.size()) == 1u;
    ensure(warnings[0]).contains("Regular expression search aborted");
    ensure(warnings[0]).contains("(.+)+xyz");

    ensure(safe_find_all(endless_spaces, runaway).empty()) == true;
    ensure(warnings.size()) == 2u;

    // an aborted rule is skipped and the cascade goes on
    std::vector<extraction_rule> rules;
    rules.push_back({runaway, 1, {}});
    rules.push_back({line_pattern("(Vendor)"), 1, {}});
    ensure(first_match(field::vendor_name, endless_spaces + "Vendor", rules)) == "Vendor";
    ensure(warnings.size()) == 3u;

    // an aborted value search next to a matching label finds nothing
    html_document doc = html_document::parse(
      "<table><tr><td>Total</td><td>" + std::string(1024, 'a') + "</td></tr></table>");
    ensure(doc.find_value_next_to_label(line_pattern("(Total)"), runaway).has_value()) == false;
    ensure(warnings.size()) == 4u;
    ensure(warnings[3]).contains("Regular expression search aborted");
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
