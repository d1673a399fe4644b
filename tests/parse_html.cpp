#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(std::holds_alternative<html_body>(detect_body_type("<p>Hello</p>"))) == true;
    ensure(std::holds_alternative<html_body>(detect_body_type("<!DOCTYPE html><html></html>"))) == true;
    ensure(std::holds_alternative<plain_text_body>(detect_body_type("Total < 5 and > 3"))) == true;

    const std::string receipt =
      "<html><body>"
      "<p>Seller: Contoso Shop, Seattle</p>"
      "<table>"
      "<tr><th>Product</th><th>Quantity</th><th>Price</th><th>Subtotal</th></tr>"
      "<tr><td>Coffee Beans</td><td>2</td><td>$12.00</td><td>$24.00</td></tr>"
      "</table>"
      "<table><tr><td>Grand total</td><td>USD 24.00</td></tr></table>"
      "</body></html>";
    extracted_record record = parse(html_body{receipt});
    ensure(record.get(field::vendor_name)) == "Contoso Shop";
    ensure(record.get(field::total_amount)) == "24.00";
    ensure(record.get(field::amount_due)) == "24.00";
    ensure(record.get(field::order_number).has_value()) == false;
    ensure(record.items.size()) == 1u;
    ensure(record.items[0] == line_item{"Coffee Beans", 2u, "12.00", "24.00"}) == true;
    ensure(parse(html_body{receipt}) == record) == true;

    // a table that does not look like an item table leaves items to the text forms
    extracted_record fallback = parse(html_body{
      "<table><tr><th>Item</th><th>Qty</th><th>Price</th></tr><tr><td>Widget</td><td>3</td><td>$9.99</td></tr></table>"
      "<p>1 x Gift Card, $25.00</p>"});
    ensure(fallback.items.size()) == 1u;
    ensure(fallback.items[0] == line_item{"Gift Card", 1u, "25.00", std::nullopt}) == true;

    extracted_record empty = parse(html_body{""});
    ensure(empty.fields.empty()) == true;
    ensure(empty.items.empty()) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
