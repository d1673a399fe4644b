#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    extracted_record nothing = parse(plain_text_body{"Just wanted to check in about the weekend plans with everyone here"});
    ensure(nothing.fields.empty()) == true;
    ensure(nothing.items.empty()) == true;

    const std::string confirmation =
      "Acme Store\n"
      "Thank you for your order from Acme Store\n"
      "Order Number: A1001\n"
      "2 x Blue Shirt, $15.00\n"
      "Order Total: $30.00\n"
      "Tracking Number: 1Z999\n"
      "Order Date: March 1, 2024";
    extracted_record record = parse(plain_text_body{confirmation});
    ensure(record.get(field::vendor_name)) == "Acme Store";
    ensure(record.get(field::order_number)) == "A1001";
    ensure(record.get(field::order_date)) == "March 1, 2024";
    ensure(record.get(field::total_amount)) == "30.00";
    ensure(record.get(field::amount_due)) == "30.00";
    ensure(record.get(field::tracking_number)) == "1Z999";
    ensure(record.get(field::date_due).has_value()) == false;
    ensure(record.get(field::shipping_address).has_value()) == false;
    ensure(record.get(field::email_from).has_value()) == false;
    ensure(record.items.size()) == 1u;
    ensure(record.items[0] == line_item{"Blue Shirt", 2u, "15.00", std::nullopt}) == true;

    // the same body always gives the same record
    ensure(parse(plain_text_body{confirmation}) == record) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
