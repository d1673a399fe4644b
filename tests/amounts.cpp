#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(extract_amount_due("Amount Due: $1,234.56")) == "1,234.56";
    ensure(extract_amount_due("Balance due: \xE2\x82\xAC" "99.00")) == "99.00";
    ensure(extract_amount_due("Please pay 75 by Friday")) == "75";
    ensure(extract_amount_due("Outstanding balance: \xC2\xA3" "12.30")) == "12.30";

    // no amount due label: the order total is used
    ensure(extract_amount_due("Order Total: $42.50")) == "42.50";
    ensure(extract_total_amount("Order Total: $42.50")) == "42.50";
    ensure(extract_total_amount("Grand Total: \xC2\xA3" "310.00")) == "310.00";
    ensure(extract_total_amount("You were charged $18.20 today")) == "18.20";
    ensure(extract_total_amount("Nothing to see here").has_value()) == false;

    // label and value in neighbouring cells
    html_document amount_cells = html_document::parse(
      "<table><tr><td>Amount due</td><td>USD 12.00</td></tr></table>");
    ensure(extract_amount_due(amount_cells.text()).has_value()) == false;
    ensure(extract_amount_due(amount_cells.text(), &amount_cells)) == "12.00";

    html_document total_cells = html_document::parse(
      "<table><tr><th>Grand total</th><td>EUR 80.10</td></tr></table>");
    ensure(extract_total_amount(total_cells.text(), &total_cells)) == "80.10";
    ensure(extract_amount_due(total_cells.text(), &total_cells)) == "80.10";
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
