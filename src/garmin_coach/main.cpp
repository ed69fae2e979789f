#include "garmin_coach/cli/router.hpp"

int main(int argc, char** argv) {
  // Parsing, dispatch and the exit-code contract all live in the router.
  return garmin_coach::cli::Dispatch(argc, argv);
}
