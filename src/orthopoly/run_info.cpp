/*
 * Module for handling run information, such as git revision and state, and
 * the compile-time configuration of the numerical kernels.
 */

#include <orthopoly/run_info.hpp>

#include <boost/version.hpp>

#include <orthopoly/constants.hpp>

namespace OrthoPoly {

RunInfo::RunInfo(const char *git_revision_in, const char *git_repo_state_in)
    : git_revision(git_revision_in), git_repo_state(git_repo_state_in),
      boost_version(BOOST_LIB_VERSION) {}

void RunInfo::report_run_info(std::ostream &os) const {

  os << "Git revision: " << git_revision << "\n";
  os << "Git repo state: " << git_repo_state << "\n";
  os << "Boost: " << boost_version << "\n";

  os << std::endl;

  os << "Small argument threshold: " << Constants::small_argument << "\n";
  os << "Power series cutoff: " << Constants::series_cutoff << "\n";
  os << "Gegenbauer small ratio: " << Constants::small_gegenbauer_ratio
     << "\n";
  os << "Hypergeometric series terms: " << Constants::series_max_terms
     << "\n";
  os << "Hypergeometric series tolerance: " << Constants::series_tolerance
     << "\n";
  os << "2F1 series radius: " << Constants::hyp2f1_radius << "\n";

  os << std::endl;
}

} // namespace OrthoPoly
