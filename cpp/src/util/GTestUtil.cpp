#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/Rendering.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// When it sees --help, gtest prints its own usage and runs no tests, so our options are printed
// first. testing::InitGoogleTest() strips the gtest flags from argv (but leaves --help), so the
// remainder is parsed with the usual BoostUtil machinery, which rejects anything unknown.
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;
  util::Random::Params random_params;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help")
                .add(log_params.make_options_description())
                .add(random_params.make_options_description());

  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
      std::cout << desc << std::endl;
      break;
    }
  }

  testing::InitGoogleTest(&argc, argv);

  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  util::Random::init(random_params);

  // Board printing is compared against plain strings, so never emit ANSI codes.
  util::Rendering::set(util::Rendering::kText);
  return RUN_ALL_TESTS();
}
