#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(field_key(field::amount_due)) == "amount_due";
    ensure(field_key(field::email_from)) == "email_from";
    ensure(field_from_key("tracking_number")) == field::tracking_number;
    ensure(field_from_key("subject").has_value()) == false;

    extracted_record record;
    record.fields[field::total_amount] = "30.00";
    record.fields[field::vendor_name] = "Acme";
    record.items.push_back(line_item{"Blue Shirt", 2u, "15.00", std::nullopt});

    ensure(serialization::to_json(serialization::full(record))) ==
      R"({"items":[{"name":"Blue Shirt","quantity":2,"unit_price":"15.00"}],"total_amount":"30.00","vendor_name":"Acme"})";
    ensure(serialization::to_json(serialization::full(extracted_record{}))) == "{}";

    std::vector<std::pair<std::string, std::string>> columns = flatten(record);
    ensure(columns.size()) == 5u;
    // fields in canonical order, not key order
    ensure(columns[0].first) == "vendor_name";
    ensure(columns[1].first) == "total_amount";
    ensure(columns[2].first) == "item1_name";
    ensure(columns[2].second) == "Blue Shirt";
    ensure(columns[3].first) == "item1_quantity";
    ensure(columns[3].second) == "2";
    ensure(columns[4].first) == "item1_unit_price";
    ensure(columns[4].second) == "15.00";
    ensure(flatten(extracted_record{}).empty()) == true;

    ensure(is_valid(line_item{"", 1u, std::nullopt, std::nullopt})) == false;
    ensure(is_valid(line_item{"Mug", std::nullopt, std::nullopt, std::nullopt})) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
