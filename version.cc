#include <fmt/format.h>
#include <string>
#include "version.hh"



#define XSTRINGIFY(arg__) STRINGIFY(arg__)
#define STRINGIFY(arg__) #arg__



namespace gameid
{

std::string gameid_version()
{
    return fmt::format("gameid (build: {})", XSTRINGIFY(GAMEID_VERSION_BUILD));
}

}
