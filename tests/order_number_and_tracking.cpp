#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(extract_order_number("Order Number: AB-12345")) == "AB-12345";
    ensure(extract_order_number("Confirmation #XYZ_9")) == "XYZ_9";
    ensure(extract_order_number("Reference Number: REF77")) == "REF77";
    ensure(extract_order_number("Invoice Number: INV-2024-001")) == "INV-2024-001";
    ensure(extract_order_number("Nothing relevant in this message.").has_value()) == false;

    ensure(extract_tracking_number("Tracking Number: 1Z999AA10123456784")) == "1Z999AA10123456784";
    ensure(extract_tracking_number("Shipment ID: SHP42")) == "SHP42";
    ensure(extract_tracking_number("Your package can be tracked with 9400100000000000000000")) == "9400100000000000000000";
    ensure(extract_tracking_number("Track your shipment using number ZX81")) == "ZX81";
    ensure(extract_tracking_number("Nothing relevant in this message.").has_value()) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
