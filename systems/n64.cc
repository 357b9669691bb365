#include <array>
#include <algorithm>
#include "regions.hh"
#include "systems.hh"



namespace gameid
{

namespace
{

constexpr std::array<uint8_t, 4> FIRST_WORD = { 0x80, 0x37, 0x12, 0x40 };


Layout n64_layout(const std::string &name, ByteOrder byte_order)
{
    Layout layout;
    layout.name = name;
    layout.offset = 0;
    layout.size = 0x40;
    layout.byte_order = byte_order;
    layout.fields =
    {
        {"clock_rate",     0x04, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"boot_address",   0x08, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"crc1",           0x10, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"crc2",           0x14, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"internal_title", 0x20, 20, Encoding::PRINTABLE, Transform::NONE      },
        {"media_format",   0x3B, 1,  Encoding::PRINTABLE, Transform::NONE      },
        {"cartridge_id",   0x3C, 2,  Encoding::RAW,       Transform::NONE      },
        {"country_code",   0x3E, 1,  Encoding::RAW,       Transform::NONE      },
        {"version",        0x3F, 1,  Encoding::UINT_LE,   Transform::NONE      }
    };

    // after byte order normalization
    layout.validator = [](const std::vector<uint8_t> &header, const FieldValues &)
    {
        return std::equal(FIRST_WORD.begin(), FIRST_WORD.end(), header.begin());
    };

    layout.composer = [](const FieldValues &values, Identifier &identifier)
    {
        auto country_code = values.text("country_code");

        identifier.serial = values.text("cartridge_id") + country_code;
        identifier.raw_title = values.text("internal_title");
        identifier.version = values.text("version");

        auto region = nintendo_region(country_code.front());
        if(!region.empty())
            identifier.region_hint = region;
    };

    return layout;
}

}


Descriptor descriptor_n64()
{
    // z64 big endian, v64 byte swapped, n64 word swapped
    return Descriptor{ Platform::N64, Source::CARTRIDGE, nullptr,
        { n64_layout("z64", ByteOrder::NATIVE), n64_layout("v64", ByteOrder::SWAP16), n64_layout("n64", ByteOrder::SWAP32) }, SerialStyle::COMPACT };
}

}
