#include "robotics_uri/cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
  return robotics_uri::run_cli(argc, argv, std::cout, std::cerr);
}
