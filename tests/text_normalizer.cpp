#include "receiptwire.h"

int main(int argc, char* argv[])
{
  using namespace receiptwire;

  try
  {
    ensure(normalize(
      "<html><head><style>p { color: red; }</style><script>var total = 1;</script></head>"
      "<body><p>Hello&nbsp;<b>World</b></p><!-- hidden note -->\n"
      "<div>  Total:\n  $5 </div></body></html>")) == "Hello World Total: $5";
    ensure(normalize("<table><tr><td>Total</td><td>$5</td></tr></table>")) == "Total $5";
    ensure(normalize("")) == "";
    ensure(normalize("plain words only")) == "plain words only";
    ensure(normalize("<p>Unclosed <b>bold text")).contains("Unclosed bold text");
    // stray closing tags and cells outside a table do not raise
    ensure(normalize("</div></table><td>Broken &amp; stray</b></tr>")).contains("Broken & stray");

    html_document doc = html_document::parse(
      "<table><tr><td>Label <i>inner</i></td><td> Value  one </td></tr>"
      "<tr><td><table><tr><td>Nested</td></tr></table></td></tr></table>");
    ensure(doc.tables().size()) == 2u;
    // rows of nested tables belong to every enclosing table
    ensure(doc.tables()[0].rows.size()) == 3u;
    ensure(doc.tables()[1].rows.size()) == 1u;
    const html_document::row& first_row = doc.tables()[0].rows[0];
    ensure(first_row.cells.size()) == 2u;
    ensure(first_row.cells[0].text) == "Label inner";
    ensure(first_row.cells[0].own_text.size()) == 1u;
    ensure(first_row.cells[0].own_text[0]) == "Label";
    ensure(first_row.cells[1].text) == "Value one";

    boost::regex label{"label", boost::regex::perl | boost::regex::icase};
    boost::regex value{"(value\\s+\\w+)", boost::regex::perl | boost::regex::icase};
    ensure(doc.find_value_next_to_label(label, value)) == "Value one";
    boost::regex missing{"nothing here"};
    ensure(doc.find_value_next_to_label(missing, value).has_value()) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
