#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    std::vector<line_item> shirt = extract_text_items("2 x Blue Shirt, $15.00");
    ensure(shirt.size()) == 1u;
    ensure(shirt[0].name) == "Blue Shirt";
    ensure(shirt[0].quantity) == 2u;
    ensure(shirt[0].unit_price) == "15.00";
    ensure(shirt[0].total_price.has_value()) == false;

    std::vector<line_item> mugs = extract_text_items("3 Coffee Mugs @ $4.50");
    ensure(mugs.size()) == 1u;
    ensure(mugs[0] == line_item{"Coffee Mugs", 3u, "4.50", std::nullopt}) == true;

    std::vector<line_item> lamp = extract_text_items("Desk Lamp (1) \xC2\xA3" "25.00");
    ensure(lamp.size()) == 1u;
    ensure(lamp[0] == line_item{"Desk Lamp", 1u, "25.00", std::nullopt}) == true;

    // every form is applied, results are grouped by form
    std::vector<line_item> mixed = extract_text_items("Desk Lamp (1) \xC2\xA3" "25.00\n2 x Blue Shirt, $15.00");
    ensure(mixed.size()) == 2u;
    ensure(mixed[0].name) == "Blue Shirt";
    ensure(mixed[1].name) == "Desk Lamp";

    std::vector<line_item> section = extract_text_items(
      "Your Order\n"
      "  Deluxe Widget     $19.99\n"
      "  spare cable pack   EUR 4.50\n"
      "  gift\n"
      "\n"
      "Thanks!");
    ensure(section.size()) == 2u;
    ensure(section[0] == line_item{"Deluxe Widget", 1u, "19.99", std::nullopt}) == true;
    ensure(section[1] == line_item{"spare cable pack", 1u, "4.50", std::nullopt}) == true;

    ensure(extract_text_items("Just wanted to check in about the weekend plans with everyone here").empty()) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
