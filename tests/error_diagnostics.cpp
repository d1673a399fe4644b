#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    std::string order_id = "A-1";
    bool thrown = false;
    try
    {
      throw make_error("Order lookup failed", errors::program_logic{}, order_id);
    }
    catch (const errors::base& e)
    {
      thrown = true;
      ensure(e.context_count()) == 3u;
      ensure(e.context_string(0)) == "Order lookup failed";
      ensure(e.context_string(1)) == "program logic error";
      ensure(e.context_string(2)) == "order_id: A-1";
      ensure(e.context_type(1) == typeid(errors::program_logic)) == true;
      ensure(errors::contains_type<errors::program_logic>(e)) == true;
      ensure(errors::contains_type<errors::network_failure>(e)) == false;
      std::string message = errors::diagnostic_message(e);
      ensure(message).contains("Error: \"Order lookup failed\"");
      ensure(message).contains("with context \"order_id: A-1\"");
      ensure(message).contains("error_diagnostics.cpp");
    }
    ensure(thrown) == true;

    int retries = 3;
    thrown = false;
    try
    {
      throw_if(retries > 2, "Too many retries", retries);
    }
    catch (const errors::base& e)
    {
      thrown = true;
      ensure(e.context_string(0)) == "retries > 2";
      ensure(e.context_string(1)) == "Too many retries";
      ensure(e.context_string(2)) == "retries: 3";
    }
    ensure(thrown) == true;

    thrown = false;
    try
    {
      try
      {
        throw make_error("Inner failure", errors::network_failure{});
      }
      catch (const std::exception&)
      {
        std::throw_with_nested(make_error("Outer operation"));
      }
    }
    catch (const std::exception& e)
    {
      thrown = true;
      ensure(errors::contains_type<errors::network_failure>(e)) == true;
      std::string message = errors::diagnostic_message(e);
      ensure(message).contains("wrapping at: ");
      // innermost error comes first
      ensure(message.find("Inner failure") < message.find("Outer operation")) == true;
    }
    ensure(thrown) == true;

    std::optional<std::string> missing;
    ensure(stringify(missing)) == "null";
    ensure(stringify(std::make_pair(std::string{"count"}, 2))) == "count: 2";

    ensure(environment::get("RECEIPTWIRE_TEST_SURELY_UNSET").has_value()) == false;
    ensure(environment::get_or("RECEIPTWIRE_TEST_SURELY_UNSET", "fallback")) == "fallback";
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
