//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "tools/texguard/cli.hpp"
#include "texguard/version.hpp"

#include <ostream>

namespace texguard::tools
{

void printVersion(std::ostream &os)
{
    os << "texguard v" << TEXGUARD_VERSION_STR << "\n";
    os << "LaTeX document integrity checker\n";
}

void usage(std::ostream &os)
{
    os << "texguard v" << TEXGUARD_VERSION_STR << " - LaTeX document integrity checker\n"
       << "\n"
       << "Usage: texguard [--config <file.ini>] <command> [options]\n"
       << "\n"
       << "Commands:\n"
       << "  clean <in.tex> [-o out] [--dry-run] [--tables-only]\n"
       << "                                 Escape special characters in prose\n"
       << "  check <in.tex> [--check-anon] [--venue NAME] [--stats] [--no-inputs]\n"
       << "                                 Check environments, markers, sections and\n"
       << "                                 anonymization\n"
       << "  diagnose <file.log> [--tex <in.tex>]\n"
       << "                                 Classify a compiler log\n"
       << "  fix <in.tex> [--log <file.log> | --auto-detect] [-o out] [--dry-run]\n"
       << "      [--rounds N]               Apply automated repairs\n"
       << "  spans <in.tex>                 Dump the region segmentation\n"
       << "\n"
       << "Options:\n"
       << "  --config FILE                  Read settings from an INI file\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Examples:\n"
       << "  texguard clean paper.tex -o paper.clean.tex\n"
       << "  texguard fix paper.tex --auto-detect -o paper.tex\n"
       << "  texguard check paper.tex --venue neurips --stats\n"
       << "\n";
}

} // namespace texguard::tools
