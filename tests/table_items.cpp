#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(resolve_column_role("Item")) == column_role::name;
    ensure(resolve_column_role(" Product Description ")) == column_role::name;
    ensure(resolve_column_role("Item Total")) == column_role::name;
    ensure(resolve_column_role("Qty")) == column_role::quantity;
    ensure(resolve_column_role("QUANTITY")) == column_role::quantity;
    ensure(resolve_column_role("Unit Price")) == column_role::price;
    ensure(resolve_column_role("Cost")) == column_role::price;
    ensure(resolve_column_role("Subtotal")) == column_role::total;
    ensure(resolve_column_role("Amount")) == column_role::total;
    ensure(resolve_column_role("Notes").has_value()) == false;

    html_document small_table = html_document::parse(
      "<table>"
      "<tr><th>Item</th><th>Qty</th><th>Price</th></tr>"
      "<tr><td>Widget</td><td>3</td><td>$9.99</td></tr>"
      "</table>");
    ensure(small_table.tables().size()) == 1u;
    std::vector<line_item> widget_items = extract_items_from_table(small_table.tables().front());
    ensure(widget_items.size()) == 1u;
    ensure(widget_items.front() == line_item{"Widget", 3u, "9.99", std::nullopt}) == true;
    // only "item" and "price" occur, the table is not an item table
    ensure(item_likeness_score(small_table.tables().front())) == 2;
    ensure(extract_table_items(small_table).empty()) == true;

    std::vector<line_item> items = extract_table_items(
      "<table>"
      "<tr><th>Product</th><th>Quantity</th><th>Price</th><th>Amount</th></tr>"
      "<tr><td>Blue <b>Shirt</b></td><td>2 pcs</td><td>$15.00</td><td>$30.00</td></tr>"
      "<tr><td> </td><td>1</td><td>$1.00</td><td>$1.00</td></tr>"
      "<tr><td>Short row</td></tr>"
      "<tr><td>Gift wrap</td><td>-</td><td>Free</td><td>0.00</td></tr>"
      "</table>");
    ensure(items.size()) == 2u;
    ensure(items[0] == line_item{"Blue Shirt", 2u, "15.00", "30.00"}) == true;
    ensure(items[1].name) == "Gift wrap";
    ensure(items[1].quantity.has_value()) == false;
    ensure(items[1].unit_price.has_value()) == false;
    ensure(items[1].total_price) == "0.00";

    // without a quantity column the quantity stays unknown
    html_document no_quantity = html_document::parse(
      "<table><tr><th>Product</th><th>Price</th></tr><tr><td>Lamp</td><td>$20</td></tr></table>");
    std::vector<line_item> lamp = extract_items_from_table(no_quantity.tables().front());
    ensure(lamp.size()) == 1u;
    ensure(lamp[0] == line_item{"Lamp", std::nullopt, "20", std::nullopt}) == true;

    // the first qualifying table has no name column and no other table is tried
    std::vector<line_item> none = extract_table_items(
      "<table><tr><th>Quantity</th><th>Price</th><th>Subtotal</th></tr><tr><td>1</td><td>2</td><td>3</td></tr></table>"
      "<table><tr><th>Item</th><th>Quantity</th><th>Price</th></tr><tr><td>Lamp</td><td>1</td><td>$20</td></tr></table>");
    ensure(none.empty()) == true;

    // the first header of a role keeps it
    html_document duplicate_roles = html_document::parse(
      "<table><tr><th>Item</th><th>Description</th><th>Price</th><th>Quantity</th></tr></table>");
    table_column_map columns = map_columns(duplicate_roles.tables().front().rows.front());
    ensure(columns.at(column_role::name)) == 0u;
    ensure(columns.at(column_role::price)) == 2u;
    ensure(columns.at(column_role::quantity)) == 3u;
    ensure(columns.contains(column_role::total)) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
