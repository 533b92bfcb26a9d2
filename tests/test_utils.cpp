#include "fdv/utils.hpp"

#include "test_support.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fdv;
using fdv_test::approx;

int main() {
  try {
    // Trimming and case helpers.
    assert(trim("  a b \t\r\n") == "a b");
    assert(trim("") == "");
    assert(to_lower("DePtH") == "depth");
    assert(to_upper("egg2a") == "EGG2A");
    assert(starts_with("FM12", "FM"));
    assert(!starts_with("F", "FM"));
    assert(!ends_with("r", ".r"));
    assert(ends_with("site.fdv", ".fdv"));
    assert(strip_utf8_bom("\xEF\xBB\xBFTime") == "Time");
    assert(strip_utf8_bom("Time") == "Time");

    // Quoted CSV fields.
    {
      const auto f = split_csv_row("a,\"b,c\",\"d\"\"e\"", ',');
      assert(f.size() == 3);
      assert(f[0] == "a");
      assert(f[1] == "b,c");
      assert(f[2] == "d\"e");
    }
    {
      const auto f = split_csv_row("1;2;;4\r", ';');
      assert(f.size() == 4);
      assert(f[2].empty());
      assert(f[3] == "4");
    }
    {
      bool threw = false;
      try {
        (void)split_csv_row("a,\"unterminated", ',');
      } catch (const std::runtime_error&) {
        threw = true;
      }
      assert(threw);
    }
    assert(count_delim_outside_quotes("a,\"b,c\",d", ',') == 2);

    // Strict numbers.
    assert(to_int(" 42 ") == 42);
    assert(approx(to_double("1.5"), 1.5));
    assert(approx(to_double("0,25"), 0.25));
    {
      bool threw = false;
      try {
        (void)to_double("12abc");
      } catch (const std::runtime_error&) {
        threw = true;
      }
      assert(threw);
    }

    // Data cells.
    {
      double v = 0.0;
      assert(parse_number_cell("3.25", false, &v) && approx(v, 3.25));
      assert(!parse_number_cell("", false, &v));
      assert(!parse_number_cell("NaN", false, &v));
      assert(!parse_number_cell("n/a", true, &v));
      assert(!parse_number_cell("-", true, &v));
      assert(!parse_number_cell("1,5", false, &v));
      assert(parse_number_cell("1,5", true, &v) && approx(v, 1.5));
      assert(parse_number_cell("1.234,5", true, &v) && approx(v, 1234.5));
      assert(!parse_number_cell("1,2,3", true, &v));
    }

    // Fixed-width formatting used by the FDV writer.
    assert(format_fixed(1.23456, 2) == "1.23");
    assert(format_fixed(-0.001, 2) == "0.00");
    assert(pad_left("12", 5) == "   12");
    assert(pad_left("123456", 5) == "123456");

    assert(sanitize_file_stem("Site 12/a") == "Site_12_a");
    assert(sanitize_file_stem("..x") == "__x");
    assert(sanitize_file_stem("   ") == "Unknown");

    assert(json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");

    {
      const std::string t = random_hex_token(8);
      assert(t.size() == 16);
      for (unsigned char c : t) assert(std::isxdigit(c) != 0);
    }

    // Atomic writes create parent directories and replace existing files.
    {
      const std::string dir = "test_utils_tmp";
      fdv_test::remove_all(dir);
      const std::string path = dir + "/sub/out.txt";
      assert(write_text_file_atomic(path, "first"));
      assert(write_text_file_atomic(path, "second"));
      std::string back;
      assert(read_text_file(path, &back));
      assert(back == "second");
      assert(file_exists(path));
      assert(!read_text_file(dir + "/missing.txt", &back));
      fdv_test::remove_all(dir);
    }

    assert(!now_string_utc().empty());
    assert(now_string_utc().back() == 'Z');

    std::cout << "test_utils: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_utils failed: " << e.what() << "\n";
    return 1;
  }
}
