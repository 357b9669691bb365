#include <map>
#include "error.hh"
#include "platform.hh"
#include "utils/misc.hh"
#include "utils/strings.hh"



namespace gameid
{

static const std::map<Platform, std::string> PLATFORM_STRING =
{
    {Platform::GB,       "GB"      },
    {Platform::GBC,      "GBC"     },
    {Platform::GBA,      "GBA"     },
    {Platform::SNES,     "SNES"    },
    {Platform::N64,      "N64"     },
    {Platform::GENESIS,  "Genesis" },
    {Platform::PSX,      "PSX"     },
    {Platform::PS2,      "PS2"     },
    {Platform::PSP,      "PSP"     },
    {Platform::GC,       "GC"      },
    {Platform::SATURN,   "Saturn"  },
    {Platform::SEGACD,   "SegaCD"  },
    {Platform::NEOGEOCD, "NeoGeoCD"}
};


// uppercase keys
static const std::map<std::string, Platform> PLATFORM_ALIASES =
{
    {"GB/GBC",    Platform::GB      },
    {"GAMEBOY",   Platform::GB      },
    {"GAMECUBE",  Platform::GC      },
    {"NGC",       Platform::GC      },
    {"MD",        Platform::GENESIS },
    {"MEGADRIVE", Platform::GENESIS },
    {"MCD",       Platform::SEGACD  },
    {"MEGACD",    Platform::SEGACD  },
    {"SS",        Platform::SATURN  },
    {"SAT",       Platform::SATURN  },
    {"NGCD",      Platform::NEOGEOCD},
    {"PS1",       Platform::PSX     },
    {"SFC",       Platform::SNES    }
};


const std::vector<Platform> &platforms_all()
{
    static const std::vector<Platform> PLATFORMS = []()
    {
        std::vector<Platform> platforms;
        for(auto const &p : PLATFORM_STRING)
            platforms.push_back(p.first);
        return platforms;
    }();

    return PLATFORMS;
}


std::string platform_string(Platform platform)
{
    return enum_to_string(platform, PLATFORM_STRING);
}


Platform string_to_platform(const std::string &name)
{
    auto name_upper = str_uppercase(trim(name));

    for(auto const &p : PLATFORM_STRING)
        if(str_uppercase(p.second) == name_upper)
            return p.first;

    auto it = PLATFORM_ALIASES.find(name_upper);
    if(it == PLATFORM_ALIASES.end())
        throw_error(ErrorCode::UNSUPPORTED_PLATFORM, "unsupported platform ({}), possible values: {}", name, dictionary_values(PLATFORM_STRING));

    return it->second;
}


Platform platform_index_family(Platform platform)
{
    return platform == Platform::GBC ? Platform::GB : platform;
}

}
