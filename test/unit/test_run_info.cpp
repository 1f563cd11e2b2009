#include <orthopoly/revision.hpp>
#include <orthopoly/run_info.hpp>

#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace OrthoPoly;

TEST(RunInfo, Report) {
  RunInfo run_info("abc123", "clean");
  ASSERT_FALSE(run_info.boost_version.empty());

  std::ostringstream os;
  run_info.report_run_info(os);
  const std::string report = os.str();

  ASSERT_NE(report.find("Git revision: abc123"), std::string::npos);
  ASSERT_NE(report.find("Git repo state: clean"), std::string::npos);
  ASSERT_NE(report.find("Boost: " + run_info.boost_version),
            std::string::npos);
  ASSERT_NE(report.find("Small argument threshold"), std::string::npos);
  ASSERT_NE(report.find("2F1 series radius"), std::string::npos);
}

TEST(RunInfo, Revision) {
  RunInfo run_info(version::revision, version::git_state);
  ASSERT_NE(std::string(run_info.git_revision), "");
  ASSERT_NE(std::string(run_info.git_repo_state), "");
}
