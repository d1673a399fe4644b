#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(extract_email_from("From: Jane Doe <jane@example.com>")) == "jane@example.com";
    ensure(extract_email_from("Sender: billing@shop.example")) == "billing@shop.example";
    ensure(extract_email_from("Questions? Write to help@contoso.com today.")) == "help@contoso.com";
    ensure(extract_email_from("No address here").has_value()) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
