#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "regions.hh"
#include "utils/strings.hh"



namespace gameid
{

const std::map<char, std::string> SEGA_REGIONS =
{
    {'J', "Japan" },
    {'U', "USA"   },
    {'E', "Europe"}
};


const std::map<char, std::string> SATURN_REGIONS =
{
    {'J', "Japan"        },
    {'T', "Asia NTSC"    },
    {'U', "USA"          },
    {'B', "Brazil"       },
    {'K', "South Korea"  },
    {'A', "Asia PAL"     },
    {'E', "Europe"       },
    {'L', "Latin America"}
};


static const std::map<char, std::string> SEGA_REGIONS_NEW =
{
    {'0', ""   },
    {'1', "J"  },
    {'2', ""   },
    {'3', "J"  },
    {'4', "U"  },
    {'5', "JU" },
    {'6', "U"  },
    {'7', "JU" },
    {'8', "E"  },
    {'9', "JE" },
    {'A', "E"  },
    {'B', "JE" },
    {'C', "UE" },
    {'D', "JUE"},
//   'E' - reserved for Europe, prioritize old style
    {'F', "JUE"}
};


static const std::map<char, std::string> NINTENDO_REGIONS =
{
    {'A', "World"      },
    {'B', "Brazil"     },
    {'C', "China"      },
    {'D', "Germany"    },
    {'E', "USA"        },
    {'F', "France"     },
    {'H', "Netherlands"},
    {'I', "Italy"      },
    {'J', "Japan"      },
    {'K', "South Korea"},
    {'N', "Canada"     },
    {'P', "Europe"     },
    {'S', "Spain"      },
    {'U', "Australia"  },
    {'W', "Sweden"     },
    {'X', "Europe"     },
    {'Y', "Europe"     },
    {'Z', "Europe"     }
};


static const std::vector<std::string> SNES_REGIONS =
{
    "Japan", "USA", "Europe", "Sweden", "Finland", "Denmark", "France", "Netherlands",
    "Spain", "Germany", "Italy", "China", "Indonesia", "South Korea", "", "Canada", "Brazil", "Australia"
};


std::string sony_region(Platform platform, const std::string &prefix)
{
    struct RegionPrefixes
    {
        std::string region;
        std::set<std::string> prefixes;
    };

    // multi region: "DTL", "PBPX", preprod only: "ABCD", "XXXX"
    static const std::map<Platform, std::vector<RegionPrefixes>> REGIONS =
    {
        {Platform::PSX, {
            {"Japan",  {"ESPM", "PAPX", "PCPX", "PDPX", "SCPM", "SCPS", "SCZS", "SIPS", "SLKA", "SLPM", "SLPS"}},
            {"USA",    {"LSP", "PUPX", "SCUS", "SLUS", "SLUSP"}},
            {"Europe", {"PEPX", "SCED", "SCES", "SLED", "SLES"}}
        }},
        {Platform::PS2, {
            {"Japan",       {"PAPX", "PCPX", "PDPX", "PSXC", "SCAJ", "SCPM", "SCPN", "SCPS", "SLAJ", "SLPM", "SLPS", "SRPM"}},
            {"South Korea", {"SCKA", "SLKA"}},
            {"China",       {"SCCS"}},
            {"USA",         {"PUPX", "SCUS", "SLUS"}},
            {"Europe",      {"SCED", "SCES", "SLED", "SLES", "TCES"}}
        }},
        {Platform::PSP, {
            {"Japan",       {"UCJB", "UCJM", "UCJS", "ULJM", "ULJS", "NPJG", "NPJH"}},
            {"South Korea", {"UCKS", "ULKS"}},
            {"Asia",        {"UCAS", "ULAS", "NPHG", "NPHH"}},
            {"USA",         {"UCUS", "ULUS", "NPUG", "NPUH"}},
            {"Europe",      {"UCES", "ULES", "NPEG", "NPEH"}}
        }}
    };

    std::string region;

    auto it = REGIONS.find(platform);
    if(it != REGIONS.end())
    {
        for(auto const &r : it->second)
        {
            if(r.prefixes.find(prefix) != r.prefixes.end())
            {
                region = r.region;
                break;
            }
        }
    }

    return region;
}


std::string nintendo_region(char code)
{
    auto it = NINTENDO_REGIONS.find(code);
    return it == NINTENDO_REGIONS.end() ? "" : it->second;
}


std::string snes_region(uint8_t country)
{
    return country < SNES_REGIONS.size() ? SNES_REGIONS[country] : "";
}


std::set<std::string> sega_regions(std::string codes, const std::map<char, std::string> &letters, bool new_style)
{
    erase_all_inplace(codes, ' ');

    if(new_style && codes.length() == 1)
    {
        auto it = SEGA_REGIONS_NEW.find(codes.front());
        if(it != SEGA_REGIONS_NEW.end())
            codes = it->second;
    }

    std::set<std::string> regions;
    for(auto r : codes)
    {
        auto it = letters.find(r);
        if(it != letters.end())
            regions.insert(it->second);
    }

    return regions;
}


std::string join_regions(const std::set<std::string> &regions)
{
    std::string joined;

    bool comma = false;
    for(auto const &r : regions)
    {
        joined += (comma ? ", " : "") + r;
        comma = true;
    }

    return joined;
}

}
