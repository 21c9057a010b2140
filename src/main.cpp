#include "app/Cli.hpp"
#include "collectors/ProcessCollector.hpp"

#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  vigil::collectors::ProcessCollector collector;
  return vigil::app::run_cli(args, collector);
}
