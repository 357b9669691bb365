#include "regions.hh"
#include "systems.hh"



namespace gameid
{

namespace
{

constexpr uint32_t FIXED_VALUE_OFFSET = 0xB2;
constexpr uint8_t FIXED_VALUE = 0x96;
constexpr uint32_t COMPLEMENT_OFFSET = 0xBD;


uint8_t header_complement(const std::vector<uint8_t> &header)
{
    uint8_t complement = 0;
    for(uint32_t i = 0xA0; i < COMPLEMENT_OFFSET; ++i)
        complement -= header[i];

    return complement - 0x19;
}

}


Descriptor descriptor_gba()
{
    Layout agb;
    agb.name = "AGB";
    agb.offset = 0;
    agb.size = 0xC0;
    agb.byte_order = ByteOrder::NATIVE;
    agb.fields =
    {
        {"internal_title",   0xA0, 12, Encoding::PRINTABLE, Transform::NONE      },
        {"game_code",        0xAC, 4,  Encoding::PRINTABLE, Transform::NONE      },
        {"maker_code",       0xB0, 2,  Encoding::PRINTABLE, Transform::NONE      },
        {"main_unit_code",   0xB3, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"device_type",      0xB4, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"software_version", 0xBC, 1,  Encoding::UINT_LE,   Transform::NONE      },
        {"complement_check", 0xBD, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER}
    };

    agb.validator = [](const std::vector<uint8_t> &header, const FieldValues &)
    {
        return header[FIXED_VALUE_OFFSET] == FIXED_VALUE && header[COMPLEMENT_OFFSET] == header_complement(header);
    };

    agb.composer = [](const FieldValues &values, Identifier &identifier)
    {
        auto game_code = values.text("game_code");

        identifier.serial = game_code;
        identifier.raw_title = values.text("internal_title");
        identifier.version = values.text("software_version");
        if(game_code.length() == 4)
        {
            auto region = nintendo_region(game_code[3]);
            if(!region.empty())
                identifier.region_hint = region;
        }
    };

    return Descriptor{ Platform::GBA, Source::CARTRIDGE, nullptr, { agb }, SerialStyle::COMPACT };
}

}
