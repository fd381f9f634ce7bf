#include "rgwbundle/cli/router.hpp"

int main(int argc, char** argv) {
  // Parsing, logging and the exit-code contract all live in the CLI router.
  return rgwbundle::cli::Dispatch(argc, argv);
}
