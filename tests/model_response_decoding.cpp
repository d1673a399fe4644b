#include "receiptwire.h"
#include <cstdlib>

namespace
{

class canned_model : public receiptwire::model_client
{
public:
  explicit canned_model(std::string reply) : m_reply(std::move(reply)) {}

  std::string complete(const std::string& system_prompt, const std::string& user_prompt) override
  {
    ++calls;
    last_system_prompt = system_prompt;
    last_user_prompt = user_prompt;
    return m_reply;
  }

  int calls = 0;
  std::string last_system_prompt;
  std::string last_user_prompt;

private:
  std::string m_reply;
};

class offline_model : public receiptwire::model_client
{
public:
  std::string complete(const std::string&, const std::string&) override
  {
    throw make_error("Connection refused", receiptwire::errors::network_failure{});
  }
};

} // anonymous namespace

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    canned_model model{
      "```json\n"
      "{\"vendor_name\": \"Acme Corp\", \"amount_due\": 42.5, \"date_due\": null, \"order_number\": \"A-1\",\n"
      " \"items\": [{\"name\": \"Widget\", \"quantity\": 3, \"unit_price\": \"9.99\"}, {\"quantity\": 1}]}\n"
      "```"};
    extracted_record record = parse_via_external_model("Your Acme Corp order A-1", model);
    ensure(model.calls) == 1;
    ensure(model.last_system_prompt) == "Extract structured data from emails.";
    ensure(model.last_user_prompt).contains("vendor_name, amount_due, date_due");
    ensure(model.last_user_prompt).contains("Email Content:\nYour Acme Corp order A-1");
    ensure(record.get(field::vendor_name)) == "Acme Corp";
    ensure(record.get(field::amount_due)) == "42.5";
    ensure(record.get(field::order_number)) == "A-1";
    ensure(record.get(field::date_due).has_value()) == false;
    ensure(record.items.size()) == 1u;
    ensure(record.items[0] == line_item{"Widget", 3u, "9.99", std::nullopt}) == true;

    ensure(decode_model_response("{}") == extracted_record{}) == true;

    for (const std::string reply : {"I could not find any order data.", "[1, 2]", "```\n```"})
    {
      bool thrown = false;
      try
      {
        decode_model_response(reply);
      }
      catch (const errors::base& e)
      {
        thrown = true;
        ensure(errors::contains_type<errors::uninterpretable_response>(e)) == true;
      }
      ensure(thrown) == true;
    }

    offline_model offline;
    bool thrown = false;
    try
    {
      parse_via_external_model("text", offline);
    }
    catch (const std::exception& e)
    {
      thrown = true;
      ensure(errors::contains_type<errors::network_failure>(e)) == true;
      std::string message = errors::diagnostic_message(e);
      ensure(message).contains("Connection refused");
      ensure(message).contains("External model request failed");
    }
    ensure(thrown) == true;

    unsetenv("OPENAI_API_KEY");
    thrown = false;
    try
    {
      openai::chat_client::from_environment();
    }
    catch (const std::exception& e)
    {
      thrown = true;
      ensure(errors::contains_type<errors::missing_configuration>(e)) == true;
    }
    ensure(thrown) == true;

    openai::chat_client unreachable{"test-key", "test-model", "http://127.0.0.1:1", 5};
    ensure(unreachable.model()) == "test-model";
    thrown = false;
    try
    {
      unreachable.complete("system", "user");
    }
    catch (const std::exception& e)
    {
      thrown = true;
      ensure(errors::contains_type<errors::network_failure>(e)) == true;
    }
    ensure(thrown) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
