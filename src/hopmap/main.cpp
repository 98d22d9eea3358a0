#include "hopmap/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and the exit-code contract live in the CLI router.
  return hopmap::cli::Dispatch(argc, argv);
}
