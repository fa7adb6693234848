#include <collat/protocol/BuildInfo.h>

namespace collat {

namespace BuildInfo {

//--------------------------------------------------------------------------
//  The build version number. You must edit this for each release
//  and follow the format described at http://semver.org/
//------------------------------------------------------------------------------
// clang-format off
char const* const versionString = "0.1.0"
// clang-format on

#if defined(DEBUG)
       "+"
#ifdef GIT_COMMIT_HASH
       GIT_COMMIT_HASH
       "."
#endif
       "DEBUG"
#endif

    //--------------------------------------------------------------------------
    ;

std::string const&
getVersionString()
{
    static std::string const value = versionString;
    return value;
}

std::string const&
getFullVersionString()
{
    static std::string const value = "collatd-" + getVersionString();
    return value;
}

}  // namespace BuildInfo

}  // namespace collat
