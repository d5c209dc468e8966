#include <mentat/config/build_info.h>

#ifndef MENTAT_AGENT_ID
#error "MENTAT_AGENT_ID must be defined by the build"
#endif

#ifndef MENTAT_VERSION
#define MENTAT_VERSION "0.0.0"
#endif

#ifndef MENTAT_GIT_SHA
#define MENTAT_GIT_SHA "unknown"
#endif

#ifndef MENTAT_BUILD_TYPE
#define MENTAT_BUILD_TYPE "unknown"
#endif

namespace mentat::config
{

std::string_view agent_id()
{
    return MENTAT_AGENT_ID;
}

std::string_view version()
{
    return MENTAT_VERSION;
}

std::string_view git_sha()
{
    return MENTAT_GIT_SHA;
}

std::string_view build_type()
{
    const std::string_view type = MENTAT_BUILD_TYPE;
    return type.empty() ? std::string_view("unknown") : type;
}

} // namespace mentat::config
