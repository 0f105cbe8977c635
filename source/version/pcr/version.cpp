#include <pcr/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view PcrVersion()
{
#ifdef PCR_VERSION
    return TOSTRING(PCR_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view PcrBuildTime()
{
#ifdef PCR_NOW
    return TOSTRING(PCR_NOW);
#else
    return "<unknown build time>";
#endif
}
