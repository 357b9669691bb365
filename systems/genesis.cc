#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include "regions.hh"
#include "systems.hh"
#include "utils/strings.hh"



namespace gameid
{

namespace
{

constexpr std::string_view DISC_MAGIC = "SEGADISCSYSTEM";


const std::set<std::string> SYSTEM_TYPES =
{
    "SEGA MEGA DRIVE", "SEGA GENESIS", "SEGA 32X", "SEGA EVERDRIVE", "SEGA SSF", "SEGA MEGAWIFI", "SEGA PICO", "SEGA TERA68K", "SEGA TERA286"
};


const std::map<std::string, std::string> SOFTWARE_TYPES =
{
    {"GM", "Game"             },
    {"AI", "Aid"              },
    {"OS", "Boot ROM (TMSS)"  },
    {"BR", "Boot ROM (Sega CD)"}
};


const std::map<char, std::string> DEVICES =
{
    {'J', "3-button Controller"     },
    {'6', "6-button Controller"     },
    {'0', "Master System Controller"},
    {'A', "Analog Joystick"         },
    {'4', "Multitap"                },
    {'G', "Lightgun"                },
    {'L', "Activator"               },
    {'M', "Mouse"                   },
    {'B', "Trackball"               },
    {'T', "Tablet"                  },
    {'V', "Paddle"                  },
    {'K', "Keyboard or Keypad"      },
    {'R', "RS-232"                  },
    {'P', "Printer"                 },
    {'C', "CD-ROM (Sega CD)"        },
    {'F', "Floppy Drive"            },
    {'D', "Download"                }
};


const std::map<std::string, std::string> MONTHS =
{
    {"JAN", "January"  },
    {"FEB", "February" },
    {"MAR", "March"    },
    {"APR", "April"    },
    {"MAY", "May"      },
    {"JUN", "June"     },
    {"JUL", "July"     },
    {"AUG", "August"   },
    {"SEP", "September"},
    {"OCT", "October"  },
    {"NOV", "November" },
    {"DEC", "December" }
};


std::string device_support(const std::string &codes)
{
    std::set<std::string> devices;
    for(auto c : codes)
    {
        if(c < '!' || c > '~')
            continue;

        auto it = DEVICES.find(c);
        devices.insert(it == DEVICES.end() ? std::string(1, c) : it->second);
    }

    std::string joined;
    for(auto const &d : devices)
        joined += (joined.empty() ? "" : " / ") + d;

    return joined;
}

}


Descriptor descriptor_genesis()
{
    Layout md;
    md.name = "MD";
    md.offset = 0;
    md.size = 0x200;
    md.byte_order = ByteOrder::NATIVE;
    md.fields =
    {
        {"system_type",    0x100, 16, Encoding::PRINTABLE, Transform::NONE      },
        {"publisher",      0x113, 4,  Encoding::PRINTABLE, Transform::NONE      },
        {"release_year",   0x118, 4,  Encoding::PRINTABLE, Transform::NONE      },
        {"release_month",  0x11D, 3,  Encoding::PRINTABLE, Transform::UPPERCASE },
        {"title_domestic", 0x120, 48, Encoding::PRINTABLE, Transform::NONE      },
        {"title_overseas", 0x150, 48, Encoding::PRINTABLE, Transform::NONE      },
        {"software_type",  0x180, 2,  Encoding::PRINTABLE, Transform::NONE      },
        {"serial",         0x182, 9,  Encoding::PRINTABLE, Transform::NONE      },
        {"revision",       0x18C, 2,  Encoding::PRINTABLE, Transform::NONE      },
        {"checksum",       0x18E, 2,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"device_support", 0x190, 16, Encoding::RAW,       Transform::NONE      },
        {"rom_start",      0x1A0, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"rom_end",        0x1A4, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"ram_start",      0x1A8, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"ram_end",        0x1AC, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"extra_memory",   0x1B0, 12, Encoding::HEX,       Transform::NONE      },
        {"modem_support",  0x1BC, 12, Encoding::PRINTABLE, Transform::NONE      },
        {"region_support", 0x1F0, 3,  Encoding::RAW,       Transform::NONE      }
    };

    // cartridges start with the 68000 vector table, Sega CD system areas with the disc magic
    md.validator = [](const std::vector<uint8_t> &header, const FieldValues &values)
    {
        if(std::equal(DISC_MAGIC.begin(), DISC_MAGIC.end(), header.begin()))
            return false;

        return SYSTEM_TYPES.find(values.text("system_type")) != SYSTEM_TYPES.end();
    };

    md.composer = [](const FieldValues &values, Identifier &identifier)
    {
        auto &attributes = identifier.attributes;

        auto it = SOFTWARE_TYPES.find(values.text("software_type"));
        if(it != SOFTWARE_TYPES.end())
            attributes["software_type"] = it->second;
        auto month = MONTHS.find(values.text("release_month"));
        if(month != MONTHS.end())
            attributes["release_month"] = month->second;
        attributes["device_support"] = device_support(values.text("device_support"));

        auto regions = sega_regions(replace_nonprint(values.text("region_support"), ' '), SEGA_REGIONS);
        attributes["region_support"] = join_regions(regions);
        if(!regions.empty())
            identifier.region_hint = join_regions(regions);

        // "GM 00001009-00" style fields, the product code is the first word
        auto serial_words = tokenize(values.text("serial"), " ", nullptr);
        if(!serial_words.empty())
            identifier.serial = serial_words.front();

        auto title = values.text("title_overseas");
        identifier.raw_title = title.empty() ? values.text("title_domestic") : title;

        auto revision = values.text("revision");
        if(!revision.empty())
        {
            identifier.version = revision;

            // some database IDs keep the revision suffix
            if(!identifier.serial.empty())
                identifier.aliases.push_back(identifier.serial + revision);
        }
    };

    return Descriptor{ Platform::GENESIS, Source::CARTRIDGE, nullptr, { md }, SerialStyle::COMPACT };
}

}
