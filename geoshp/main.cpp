#include <iostream>

#include "dump.hpp"
#include "error.hpp"
#include "feature_reader.hpp"
#include "log.hpp"

int main(int argc, char **argv) {
  const boost::optional<geoshp::dump_options> options =
    geoshp::parse_arguments(argc, argv);
  if (!options) {
    geoshp::usage(std::cerr);
    return 2;
  }

  geoshp::log::init(options->verbose ? geoshp::log::severity::debug
                                     : geoshp::log::severity::warning);

  try {
    geoshp::feature_reader in(options->path);
    geoshp::dump(in, options->query, std::cout);
  } catch (const geoshp::error& e) {
    std::cerr << "shpdump: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
