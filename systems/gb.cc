#include <algorithm>
#include <fmt/format.h>
#include <map>
#include <string>
#include <utility>
#include "systems.hh"



namespace gameid
{

namespace
{

constexpr uint32_t HEADER_OFFSET = 0x100;
constexpr uint32_t TITLE_START = 0x34;
constexpr uint32_t HEADER_CHECKSUM = 0x4D;
constexpr uint64_t GLOBAL_CHECKSUM = 0x14E;
constexpr uint64_t MAX_ROM_SIZE = 8 * 1024 * 1024;
constexpr uint64_t CHUNK_SIZE = 1024 * 1024;
constexpr uint8_t NEW_LICENSEE = 0x33;

const std::map<uint8_t, std::string> CARTRIDGE_TYPES =
{
    { 0x00, "ROM" }, { 0x01, "MBC1" }, { 0x02, "MBC1 + RAM" },
    { 0x03, "MBC1 + RAM + Battery" }, { 0x05, "MBC2" }, { 0x06, "MBC2 + Battery" },
    { 0x08, "ROM + RAM" }, { 0x09, "ROM + RAM + Battery" }, { 0x0B, "MMM01" },
    { 0x0C, "MMM01 + RAM" }, { 0x0D, "MMM01 + RAM + Battery" }, { 0x0F, "MBC3 + Timer + Battery" },
    { 0x10, "MBC3 + Timer + RAM + Battery" }, { 0x11, "MBC3" }, { 0x12, "MBC3 + RAM" },
    { 0x13, "MBC3 + RAM + Battery" }, { 0x19, "MBC5" }, { 0x1A, "MBC5 + RAM" },
    { 0x1B, "MBC5 + RAM + Battery" }, { 0x1C, "MBC5 + Rumble" }, { 0x1D, "MBC5 + Rumble + RAM" },
    { 0x1E, "MBC5 + Rumble + RAM + Battery" }, { 0x20, "MBC6" }, { 0x22, "MBC7 + Sensor + Rumble + RAM + Battery" },
    { 0xFC, "Pocket Camera" }, { 0xFD, "Bandai TAMA5" }, { 0xFE, "HuC3" },
    { 0xFF, "HuC1 + RAM + Battery" }
};


const std::map<std::string, std::string> LICENSEES_NEW =
{
    { "00", "None" }, { "01", "Nintendo R&D1" }, { "08", "Capcom" }, { "13", "Electronic Arts" },
    { "18", "Hudson Soft" }, { "19", "b-ai" }, { "20", "kss" }, { "22", "pow" },
    { "24", "PCM Complete" }, { "25", "san-x" }, { "28", "Kemco Japan" }, { "29", "seta" },
    { "30", "Viacom" }, { "31", "Nintendo" }, { "32", "Bandai" }, { "33", "Ocean/Acclaim" },
    { "34", "Konami" }, { "35", "Hector" }, { "37", "Taito" }, { "38", "Hudson" },
    { "39", "Banpresto" }, { "41", "Ubi Soft" }, { "42", "Atlus" }, { "44", "Malibu" },
    { "46", "angel" }, { "47", "Bullet-Proof" }, { "49", "irem" }, { "50", "Absolute" },
    { "51", "Acclaim" }, { "52", "Activision" }, { "53", "American sammy" }, { "54", "Konami" },
    { "55", "Hi tech entertainment" }, { "56", "LJN" }, { "57", "Matchbox" }, { "58", "Mattel" },
    { "59", "Milton Bradley" }, { "60", "Titus" }, { "61", "Virgin" }, { "64", "LucasArts" },
    { "67", "Ocean" }, { "69", "Electronic Arts" }, { "70", "Infogrames" }, { "71", "Interplay" },
    { "72", "Broderbund" }, { "73", "sculptured" }, { "75", "sci" }, { "78", "THQ" },
    { "79", "Accolade" }, { "80", "misawa" }, { "83", "lozc" }, { "86", "Tokuma Shoten Intermedia" },
    { "87", "Tsukuda Original" }, { "91", "Chunsoft" }, { "92", "Video system" }, { "93", "Ocean/Acclaim" },
    { "95", "Varie" }, { "96", "Yonezawa/s'pal" }, { "97", "Kaneko" }, { "99", "Pack in soft" },
    { "A4", "Konami (Yu-Gi-Oh!)" }
};


// 0x33 selects the new licensee code
const std::map<uint8_t, std::string> LICENSEES_OLD =
{
    { 0x00, "None" }, { 0x01, "Nintendo" }, { 0x08, "Capcom" }, { 0x09, "Hot-B" },
    { 0x0A, "Jaleco" }, { 0x0B, "Coconuts Japan" }, { 0x0C, "Elite Systems" }, { 0x13, "EA (Electronic Arts)" },
    { 0x18, "Hudsonsoft" }, { 0x19, "ITC Entertainment" }, { 0x1A, "Yanoman" }, { 0x1D, "Japan Clary" },
    { 0x1F, "Virgin Interactive" }, { 0x24, "PCM Complete" }, { 0x25, "San-X" }, { 0x28, "Kotobuki Systems" },
    { 0x29, "Seta" }, { 0x30, "Infogrames" }, { 0x31, "Nintendo" }, { 0x32, "Bandai" },
    { 0x34, "Konami" }, { 0x35, "HectorSoft" }, { 0x38, "Capcom" }, { 0x39, "Banpresto" },
    { 0x3C, ".Entertainment i" }, { 0x3E, "Gremlin" }, { 0x41, "Ubisoft" }, { 0x42, "Atlus" },
    { 0x44, "Malibu" }, { 0x46, "Angel" }, { 0x47, "Spectrum Holoby" }, { 0x49, "Irem" },
    { 0x4A, "Virgin Interactive" }, { 0x4D, "Malibu" }, { 0x4F, "U.S. Gold" }, { 0x50, "Absolute" },
    { 0x51, "Acclaim" }, { 0x52, "Activision" }, { 0x53, "American Sammy" }, { 0x54, "GameTek" },
    { 0x55, "Park Place" }, { 0x56, "LJN" }, { 0x57, "Matchbox" }, { 0x59, "Milton Bradley" },
    { 0x5A, "Mindscape" }, { 0x5B, "Romstar" }, { 0x5C, "Naxat Soft" }, { 0x5D, "Tradewest" },
    { 0x60, "Titus" }, { 0x61, "Virgin Interactive" }, { 0x67, "Ocean Interactive" }, { 0x69, "EA (Electronic Arts)" },
    { 0x6E, "Elite Systems" }, { 0x6F, "Electro Brain" }, { 0x70, "Infogrames" }, { 0x71, "Interplay" },
    { 0x72, "Broderbund" }, { 0x73, "Sculptered Soft" }, { 0x75, "The Sales Curve" }, { 0x78, "t.hq" },
    { 0x79, "Accolade" }, { 0x7A, "Triffix Entertainment" }, { 0x7C, "Microprose" }, { 0x7F, "Kemco" },
    { 0x80, "Misawa Entertainment" }, { 0x83, "Lozc" }, { 0x86, "Tokuma Shoten Intermedia" }, { 0x8B, "Bullet-Proof Software" },
    { 0x8C, "Vic Tokai" }, { 0x8E, "Ape" }, { 0x8F, "I'Max" }, { 0x91, "Chunsoft Co." },
    { 0x92, "Video System" }, { 0x93, "Tsubaraya Productions Co." }, { 0x95, "Varie Corporation" }, { 0x96, "Yonezawa/S'Pal" },
    { 0x97, "Kaneko" }, { 0x99, "Arc" }, { 0x9A, "Nihon Bussan" }, { 0x9B, "Tecmo" },
    { 0x9C, "Imagineer" }, { 0x9D, "Banpresto" }, { 0x9F, "Nova" }, { 0xA1, "Hori Electric" },
    { 0xA2, "Bandai" }, { 0xA4, "Konami" }, { 0xA6, "Kawada" }, { 0xA7, "Takara" },
    { 0xA9, "Technos Japan" }, { 0xAA, "Broderbund" }, { 0xAC, "Toei Animation" }, { 0xAD, "Toho" },
    { 0xAF, "Namco" }, { 0xB0, "acclaim" }, { 0xB1, "ASCII or Nexsoft" }, { 0xB2, "Bandai" },
    { 0xB4, "Square Enix" }, { 0xB6, "HAL Laboratory" }, { 0xB7, "SNK" }, { 0xB9, "Pony Canyon" },
    { 0xBA, "Culture Brain" }, { 0xBB, "Sunsoft" }, { 0xBD, "Sony Imagesoft" }, { 0xBF, "Sammy" },
    { 0xC0, "Taito" }, { 0xC2, "Kemco" }, { 0xC3, "Squaresoft" }, { 0xC4, "Tokuma Shoten Intermedia" },
    { 0xC5, "Data East" }, { 0xC6, "Tonkinhouse" }, { 0xC8, "Koei" }, { 0xC9, "UFL" },
    { 0xCA, "Ultra" }, { 0xCB, "Vap" }, { 0xCC, "Use Corporation" }, { 0xCD, "Meldac" },
    { 0xCE, ".Pony Canyon or" }, { 0xCF, "Angel" }, { 0xD0, "Taito" }, { 0xD1, "Sofel" },
    { 0xD2, "Quest" }, { 0xD3, "Sigma Enterprises" }, { 0xD4, "ASK Kodansha Co." }, { 0xD6, "Naxat Soft" },
    { 0xD7, "Copya System" }, { 0xD9, "Banpresto" }, { 0xDA, "Tomy" }, { 0xDB, "LJN" },
    { 0xDD, "NCS" }, { 0xDE, "Human" }, { 0xDF, "Altron" }, { 0xE0, "Jaleco" },
    { 0xE1, "Towa Chiki" }, { 0xE2, "Yutaka" }, { 0xE3, "Varie" }, { 0xE5, "Epcoh" },
    { 0xE7, "Athena" }, { 0xE8, "Asmik ACE Entertainment" }, { 0xE9, "Natsume" }, { 0xEA, "King Records" },
    { 0xEB, "Atlus" }, { 0xEC, "Epic/Sony Records" }, { 0xEE, "IGS" }, { 0xF0, "A Wave" },
    { 0xF3, "Extreme Entertainment" }, { 0xFF, "LJN" }
};


// (bytes, banks)
const std::map<uint8_t, std::pair<uint32_t, uint32_t>> ROM_SIZES =
{
    { 0x00, { 32768, 2 } }, { 0x01, { 65536, 4 } }, { 0x02, { 131072, 8 } }, { 0x03, { 262144, 16 } },
    { 0x04, { 524288, 32 } }, { 0x05, { 1048576, 64 } }, { 0x06, { 2097152, 128 } }, { 0x07, { 4194304, 256 } },
    { 0x08, { 8388608, 512 } }, { 0x52, { 1179648, 72 } }, { 0x53, { 1310720, 80 } }, { 0x54, { 1572864, 96 } }
};


const std::map<uint8_t, std::pair<uint32_t, uint32_t>> RAM_SIZES =
{
    { 0x00, { 0, 0 } }, { 0x01, { 2048, 1 } }, { 0x02, { 8192, 1 } }, { 0x03, { 32768, 4 } }, { 0x04, { 131072, 16 } }, { 0x05, { 65536, 8 } }
};


// over the title .. ROM version range
uint8_t header_checksum(const uint8_t *data)
{
    uint8_t checksum = 0;
    for(uint32_t i = 0; i < HEADER_CHECKSUM - TITLE_START; ++i)
        checksum = checksum - data[i] - 1;

    return checksum;
}


// 16-bit sum of every ROM byte but the global checksum itself
uint16_t global_checksum(const DataReader &source)
{
    uint16_t checksum = 0;

    for(uint64_t offset = 0; offset < source.size(); offset += CHUNK_SIZE)
    {
        auto chunk = source.readVector(offset, std::min(CHUNK_SIZE, source.size() - offset));
        for(uint64_t i = 0; i < chunk.size(); ++i)
            if(offset + i != GLOBAL_CHECKSUM && offset + i != GLOBAL_CHECKSUM + 1)
                checksum += chunk[i];
    }

    return checksum;
}


template<typename K>
std::string table_value(const std::map<K, std::string> &table, const K &key)
{
    auto it = table.find(key);
    return it == table.end() ? "Unknown" : it->second;
}


void set_size(Identifier &identifier, const std::string &name, const std::map<uint8_t, std::pair<uint32_t, uint32_t>> &sizes, uint8_t code)
{
    auto it = sizes.find(code);
    identifier.attributes[name + "_size"] = it == sizes.end() ? "Unknown" : std::to_string(it->second.first);
    identifier.attributes[name + "_banks"] = it == sizes.end() ? "Unknown" : std::to_string(it->second.second);
}

}


Descriptor descriptor_gb(Platform platform)
{
    bool color = platform == Platform::GBC;

    Layout dmg;
    dmg.name = "DMG";
    dmg.offset = HEADER_OFFSET;
    dmg.size = 0x50;
    dmg.byte_order = ByteOrder::NATIVE;
    dmg.fields =
    {
        {"title_long",          0x34, 16, Encoding::PRINTABLE, Transform::NONE      },
        {"title_short",         0x34, 11, Encoding::PRINTABLE, Transform::NONE      },
        {"manufacturer_code",   0x3F, 4,  Encoding::RAW,       Transform::NONE      },
        {"cgb_flag",            0x43, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"new_licensee_code",   0x44, 2,  Encoding::PRINTABLE, Transform::NONE      },
        {"sgb_flag",            0x46, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"cartridge_type",      0x47, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"rom_size",            0x48, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"ram_size",            0x49, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"destination_code",    0x4A, 1,  Encoding::UINT_LE,   Transform::NONE      },
        {"old_licensee_code",   0x4B, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"rom_version",         0x4C, 1,  Encoding::UINT_LE,   Transform::NONE      },
        {"header_checksum",     0x4D, 1,  Encoding::UINT_LE,   Transform::HEX_NUMBER},
        {"global_checksum",     0x4E, 2,  Encoding::UINT_BE,   Transform::HEX_NUMBER}
    };

    // CGB flag: 0x80 supports GB, 0xC0 GBC only
    dmg.validator = [color](const std::vector<uint8_t> &header, const FieldValues &values)
    {
        auto cgb_flag = values.number("cgb_flag");
        if(color ? cgb_flag != 0x80 && cgb_flag != 0xC0 : cgb_flag == 0xC0)
            return false;

        return header_checksum(&header[TITLE_START]) == header[HEADER_CHECKSUM];
    };

    dmg.composer = [](const FieldValues &values, Identifier &identifier)
    {
        // newer carts shorten the title in favour of a manufacturer code
        auto manufacturer_code = values.text("manufacturer_code");
        bool short_title = std::all_of(manufacturer_code.begin(), manufacturer_code.end(), [](char c) { return c >= 'A' && c <= 'Z'; });

        std::string title = values.text(short_title ? "title_short" : "title_long");
        identifier.attributes["internal_title"] = title;
        if(!short_title)
            identifier.attributes.erase("manufacturer_code");

        auto cgb_flag = values.number("cgb_flag");
        identifier.attributes["cgb_mode"] = cgb_flag == 0xC0 ? "GBC only" : (cgb_flag == 0x80 ? "GBC (supports GB)" : (cgb_flag & 0x0C ? "PGB" : "GB"));
        identifier.attributes["sgb_support"] = values.number("sgb_flag") == 0x03 ? "yes" : "no";

        identifier.attributes["cartridge_type"] = table_value(CARTRIDGE_TYPES, (uint8_t)values.number("cartridge_type"));
        set_size(identifier, "rom", ROM_SIZES, (uint8_t)values.number("rom_size"));
        set_size(identifier, "ram", RAM_SIZES, (uint8_t)values.number("ram_size"));

        auto old_licensee = (uint8_t)values.number("old_licensee_code");
        identifier.attributes["licensee"] = old_licensee == NEW_LICENSEE ? table_value(LICENSEES_NEW, values.text("new_licensee_code")) : table_value(LICENSEES_OLD, old_licensee);

        identifier.serial = fmt::format("{}#{:04X}", title, values.number("global_checksum"));
        identifier.raw_title = title;
        identifier.version = values.text("rom_version");
        if(values.number("destination_code") == 0)
            identifier.region_hint = "Japan";
    };

    auto locator = [](const DataReader &source, const ExtractOptions &)
    {
        Located located;

        if(source.contains(HEADER_OFFSET + TITLE_START, HEADER_CHECKSUM - TITLE_START))
        {
            auto data = source.readVector(HEADER_OFFSET + TITLE_START, HEADER_CHECKSUM - TITLE_START);
            located.attributes.set("header_checksum_actual", field_hex_number(header_checksum(data.data()), 1));
        }

        // oversized sources are not GB cartridges, skip the full read
        if(source.size() <= MAX_ROM_SIZE)
            located.attributes.set("global_checksum_actual", field_hex_number(global_checksum(source), 2));

        return located;
    };

    return Descriptor{ platform, Source::CARTRIDGE, locator, { dmg }, SerialStyle::COMPACT };
}

}
