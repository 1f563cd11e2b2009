#ifndef __ORTHOPOLY_RUNINFO_H__
#define __ORTHOPOLY_RUNINFO_H__

#include <ostream>
#include <string>

namespace OrthoPoly {

class RunInfo {
public:
  RunInfo(const char *git_revision, const char *git_repo_state);

  const char *git_revision;
  const char *git_repo_state;
  std::string boost_version;

  /*
   * Print run information, the git revision and the numerical configuration
   * the library was built with
   */
  void report_run_info(std::ostream &os) const;
};

} // namespace OrthoPoly

#endif // __ORTHOPOLY_RUNINFO_H__
