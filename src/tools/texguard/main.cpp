//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the texguard command-line tool.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"
#include "tools/texguard/cli.hpp"

#include <iostream>

/// @brief Entry point for the `texguard` binary.
///
/// @details The source manager is a local so no state survives between
///          invocations; all work is delegated to texguard::tools::runCLI.
int main(int argc, char **argv)
{
    texguard::support::SourceManager sm;
    return texguard::tools::runCLI(argc, argv, std::cout, std::cerr, sm);
}
