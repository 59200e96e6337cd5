#include "brayton/core/application_runner.hpp"

int main(int argc, char* argv[]) {
  brayton::core::ApplicationRunner runner;
  const auto result = runner.run(argc, argv);
  return result.exit_code;
}
