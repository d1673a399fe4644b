#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(extract_shipping_address("Shipping Address:\n123 Main St\n42 elm road\n\nThanks for shopping")) == "123 Main St, 42 elm road";

    // a line starting with a capital letter ends the block
    ensure(extract_shipping_address("Ship To: 500 Oak Avenue\nSpringfield\n")) == "500 Oak Avenue";

    ensure(extract_shipping_address("Delivery Address: 7   Lake   Drive\n   apt 4")) == "7 Lake Drive, apt 4";
    ensure(extract_shipping_address("Delivered to: 9 Harbour Lane")) == "9 Harbour Lane";
    ensure(extract_shipping_address("No address in this message").has_value()) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
