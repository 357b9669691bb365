#pragma once



#include <string>
#include <vector>



namespace gameid
{

enum class Platform
{
    GB,
    GBC,
    GBA,
    SNES,
    N64,
    GENESIS,
    PSX,
    PS2,
    PSP,
    GC,
    SATURN,
    SEGACD,
    NEOGEOCD
};


const std::vector<Platform> &platforms_all();

// GameDB naming, e.g. "Genesis", "SegaCD"
std::string platform_string(Platform platform);

// case-insensitive, accepts aliases, UNSUPPORTED_PLATFORM otherwise
Platform string_to_platform(const std::string &name);

// platforms sharing one database index (GB and GBC)
Platform platform_index_family(Platform platform);

}
