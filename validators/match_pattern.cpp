#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "error.hpp"
#include "util.hpp"
#include "validator.hpp"

// Checks a candidate file against a pattern with the same validator the
// generator uses: 0 on match, 1 on mismatch or unreadable file, 2 on usage
// error or a pattern the validator refuses.
int main(int argc, char** argv) {
  if (argc != 3) {
    std::cerr << "Usage: " << (argc > 0 ? argv[0] : "genrex_match") << " <pattern> <file_path>\n";
    return 2;
  }
  const std::string pattern = argv[1];
  const std::string file_path = argv[2];

  std::ifstream in(file_path, std::ios::binary);
  if (!in) {
    std::cerr << "Error: File '" << file_path << "' not found.\n";
    return 1;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  std::string data = genrex::trim(oss.str());

  try {
    genrex::Validator validator = genrex::Validator::compile(pattern);
    return validator.is_match(data) ? 0 : 1;
  } catch (const genrex::GenrexError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
