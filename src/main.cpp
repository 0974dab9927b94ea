#include "app.hpp"
#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
  Args args;
  try {
    args = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return run(args, std::cout, std::cerr);
}
