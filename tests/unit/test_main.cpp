#define CATCH_CONFIG_RUNNER
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "catch2_qunet.hpp"

#include <QuNet/core/context.hpp>
#include <QuNet/core/logger.hpp>
#include <QuNet/core/runtime.hpp>

#include <iostream>
#include <limits>

int main(int argc, char* argv[]) {
  using namespace qunet;

  Catch::Session session;

  // global setup...
  std::cout.precision(std::numeric_limits<double>::max_digits10);
  std::cerr.precision(std::numeric_limits<double>::max_digits10);
  reset_default_context();
  // uncomment to enable verbose output ...
  // Logger::set_instance(1);
  // ... or can instead selectively set/unset particular logging flags
  // Logger::instance().boundary = true;

  return session.run(argc, argv);
}
