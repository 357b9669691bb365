#include <array>
#include <fmt/format.h>
#include <memory>
#include <string>
#include "readers/window_reader.hh"
#include "regions.hh"
#include "systems.hh"
#include "utils/strings.hh"



namespace gameid
{

namespace
{

constexpr uint64_t COPIER_HEADER_SIZE = 512;
// cartridge header plus the expansion chip byte in front of it
constexpr uint32_t HEADER_SIZE = 0x21;
constexpr uint64_t MAX_SIZE_CODE = 16;

const std::array<std::string, 3> HARDWARE = { "ROM", "ROM + RAM", "ROM + RAM + Battery" };
const std::array<std::string, 4> COPROCESSOR_HARDWARE = { "ROM + Coprocessor", "ROM + Coprocessor + RAM", "ROM + Coprocessor + RAM + Battery", "ROM + Coprocessor + Battery" };
const std::array<std::string, 6> COPROCESSORS = { "DSP", "GSU / SuperFX", "OBC1", "SA-1", "S-DD1", "S-RTC" };
// cartridge type 0xF?, identified by the expansion chip byte
const std::array<std::string, 4> CUSTOM_COPROCESSORS = { "SPC7110", "ST010 / ST011", "ST018", "CX4" };


// empty if the cartridge type is not a known combination
std::string hardware(uint8_t cartridge_type, uint8_t expansion_chip)
{
    if(cartridge_type < HARDWARE.size())
        return HARDWARE[cartridge_type];

    uint8_t features = cartridge_type & 0x0F;
    uint8_t chip = cartridge_type >> 4;
    if(features < 3 || features > 6)
        return "";

    std::string coprocessor;
    if(chip < COPROCESSORS.size())
        coprocessor = COPROCESSORS[chip];
    else if(chip == 0xE)
        coprocessor = "Super Game Boy / Satellaview";
    else if(chip == 0xF && expansion_chip < CUSTOM_COPROCESSORS.size())
        coprocessor = CUSTOM_COPROCESSORS[expansion_chip];

    auto hardware = COPROCESSOR_HARDWARE[features - 3];
    if(!coprocessor.empty())
        hardware = replace_all(hardware, "Coprocessor", fmt::format("Coprocessor ({})", coprocessor));

    return hardware;
}


// 2^N KiB
std::string size_kib(uint64_t code)
{
    return code < MAX_SIZE_CODE ? std::to_string(1024ull << code) : "Unknown";
}


Layout snes_layout(const std::string &name, uint64_t offset)
{
    Layout layout;
    layout.name = name;
    layout.offset = offset;
    layout.size = HEADER_SIZE;
    layout.byte_order = ByteOrder::NATIVE;
    layout.fields =
    {
        {"expansion_chip",      0,  1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"title",               1,  21, Encoding::PRINTABLE, Transform::NONE      },
        {"internal_title",      1,  21, Encoding::HEX,       Transform::NONE      },
        {"map_mode",            22, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"cartridge_type",      23, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"rom_size",            24, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"ram_size",            25, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"country",             26, 1,  Encoding::UINT_LE,   Transform::NONE      },
        {"developer_id",        27, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"rom_version",         28, 1,  Encoding::UINT_LE,   Transform::NONE      },
        {"checksum_complement", 29, 2,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"checksum",            31, 2,  Encoding::UINT_LE,   Transform::HEX_NUMBER}
    };

    layout.validator = [](const std::vector<uint8_t> &, const FieldValues &values)
    {
        return values.number("checksum") + values.number("checksum_complement") == 0xFFFF;
    };

    layout.composer = [](const FieldValues &values, Identifier &identifier)
    {
        auto map_mode = values.number("map_mode");
        identifier.attributes["fast_slow_rom"] = map_mode & 0x10 ? "FastROM" : "SlowROM";
        identifier.attributes["rom_type"] = std::string(map_mode & 0x04 ? "Ex" : "") + (map_mode & 0x01 ? "HiROM" : "LoROM");

        identifier.attributes["rom_size"] = size_kib(values.number("rom_size"));
        auto ram_size = values.number("ram_size");
        identifier.attributes["ram_size"] = ram_size ? size_kib(ram_size) : "0";
        auto h = hardware((uint8_t)values.number("cartridge_type"), (uint8_t)values.number("expansion_chip"));
        if(!h.empty())
            identifier.attributes["hardware"] = h;

        identifier.serial = fmt::format("{:02X}#{}#{:02X}#{:04X}", values.number("developer_id"), values.text("internal_title"), values.number("rom_version"), values.number("checksum"));
        identifier.raw_title = values.text("title");
        identifier.version = values.text("rom_version");

        auto region = snes_region(values.number("country"));
        if(!region.empty())
            identifier.region_hint = region;
    };

    return layout;
}

}


Descriptor descriptor_snes()
{
    // headered dumps carry a 512 byte copier header in front of the ROM
    auto locator = [](const DataReader &source, const ExtractOptions &)
    {
        Located located;
        if(source.size() % 1024 == COPIER_HEADER_SIZE)
        {
            located.reader = std::make_unique<WindowReader>(source, COPIER_HEADER_SIZE, source.size() - COPIER_HEADER_SIZE);
            located.attributes.set("copier_header", "yes");
        }

        return located;
    };

    return Descriptor{ Platform::SNES, Source::CARTRIDGE, locator, { snes_layout("LoROM", 0x7FBF), snes_layout("HiROM", 0xFFBF), snes_layout("ExHiROM", 0x40FFBF) }, SerialStyle::COMPACT };
}

}
