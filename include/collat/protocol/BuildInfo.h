#ifndef COLLAT_PROTOCOL_BUILDINFO_H_INCLUDED
#define COLLAT_PROTOCOL_BUILDINFO_H_INCLUDED

#include <string>

namespace collat {

/** Versioning information for this build. */
namespace BuildInfo {

/** Server version.
    Follows the Semantic Versioning Specification:
    http://semver.org/
*/
std::string const&
getVersionString();

/** Full server version string.
    This includes the name of the server.
*/
std::string const&
getFullVersionString();

}  // namespace BuildInfo

}  // namespace collat

#endif
