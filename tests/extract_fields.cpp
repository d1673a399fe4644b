#include "email_parser.h"
#include "diagnostic_message.h"
#include "ensure.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    html_document doc = html_document::parse("<table><tr><td>Amount due</td><td>USD 12.00</td></tr></table>");

    extracted_record with_cells;
    extract_fields(with_cells, doc.text(), &doc);
    ensure(with_cells.get(field::amount_due)) == "12.00";
    ensure(with_cells.get(field::total_amount).has_value()) == false;
    ensure(with_cells.items.empty()) == true;

    extracted_record text_only;
    extract_fields(text_only, doc.text());
    ensure(text_only.get(field::amount_due).has_value()) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
