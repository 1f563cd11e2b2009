/// Information about the version of orthopoly
///
/// The build system passes the git revision on every configure, which may
/// result in files that include it getting rebuilt. Therefore it
/// should be included in as few places as possible

#ifndef ORTHOPOLY_REVISION_H
#define ORTHOPOLY_REVISION_H

namespace OrthoPoly {
namespace version {
/// The git commit hash
#ifndef ORTHOPOLY_REVISION
constexpr auto revision = "UNKNOWN";
constexpr auto git_state = "UNKNOWN";
#else
// Stringify value passed at compile time
#define BUILDFLAG1_(x) #x
#define BUILDFLAG(x) BUILDFLAG1_(x)
constexpr auto revision = BUILDFLAG(ORTHOPOLY_REVISION);
constexpr auto git_state = BUILDFLAG(ORTHOPOLY_GIT_STATE);
#undef BUILDFLAG1_
#undef BUILDFLAG
#endif
} // namespace version
} // namespace OrthoPoly

#endif // ORTHOPOLY_REVISION_H
