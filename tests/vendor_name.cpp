#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(extract_vendor_name("Thank you for your order from Acme Corp")) == "Acme Corp";
    ensure(extract_vendor_name("Vendor: Blue Widgets Inc.\n")) == "Blue Widgets Inc.";
    ensure(extract_vendor_name("Northwind Traders Order Confirmation")) == "Northwind Traders";
    ensure(extract_vendor_name("Welcome to Contoso")) == "Contoso";

    // short first line of the message
    ensure(extract_vendor_name("Fabrikam Outlet\nHello Jane,\nYour parcel is on the way.")) == "Fabrikam Outlet";

    // top lines unusable, copyright notice at the end
    std::string signature_only =
      "Hello there, thanks for being a loyal customer of ours!\n"
      "Dear Jane,\n"
      "Visit www.example.com for more deals\n"
      "This paragraph is definitely much too long to be considered a proper name.\n"
      "\n"
      "Regards\n"
      "\xC2\xA9 Tailspin Toys";
    ensure(extract_vendor_name(signature_only)) == "Tailspin Toys";

    ensure(extract_vendor_name("Just wanted to check in about the weekend plans with everyone here").has_value()) == false;
    ensure(extract_vendor_name("").has_value()) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
