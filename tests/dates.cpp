#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(extract_date_due("Due Date: March 15, 2024.")) == "March 15, 2024";
    ensure(extract_date_due("Payment due by: 1 May 2024.")) == "1 May 2024";

    // a candidate without digits is not a date, the next pattern is tried
    ensure(extract_date_due("Due date: upon receipt.").has_value()) == false;
    ensure(extract_date_due("Due date: upon receipt. Payment deadline: April 30 2024.")) == "April 30 2024";

    ensure(extract_order_date("Order Date: Jan 5, 2024.")) == "Jan 5, 2024";
    ensure(extract_order_date("Ordered on 12 June 2023.")) == "12 June 2023";
    ensure(extract_order_date("Purchase date: yesterday.").has_value()) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
