#include "cli/driver.hpp"

/// Main entry point for the bfq compiler.
///
/// Delegates all work to `bfq_main()` which handles argument parsing,
/// logging setup, compilation and error reporting.
int main(int argc, char* argv[]) {
    return bfq_main(argc, argv);
}
