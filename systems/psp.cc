#include <algorithm>
#include <map>
#include <string>
#include <string_view>
#include "disc_volume.hh"
#include "regions.hh"
#include "systems.hh"



namespace gameid
{

namespace
{

constexpr uint32_t SERIAL_LENGTH = 10;
constexpr char SERIAL_TERMINATOR = '|';
constexpr std::string_view SFO_MAGIC("\0PSF", 4);
constexpr uint32_t SFO_HEADER_SIZE = 20;
constexpr uint32_t SFO_ENTRY_SIZE = 16;


// PARAM.SFO string values
std::map<std::string, std::string> read_sfo(const DataReader &reader)
{
    std::map<std::string, std::string> sfo;

    if(reader.size() < SFO_HEADER_SIZE)
        return sfo;
    auto magic = reader.readVector(0, SFO_MAGIC.size());
    if(std::string_view((const char *)magic.data(), magic.size()) != SFO_MAGIC)
        return sfo;

    auto key_table = reader.readUint<uint32_t>(8, false);
    auto data_table = reader.readUint<uint32_t>(12, false);
    auto count = reader.readUint<uint32_t>(16, false);

    for(uint32_t i = 0; i < count; ++i)
    {
        uint64_t entry = SFO_HEADER_SIZE + (uint64_t)i * SFO_ENTRY_SIZE;
        if(!reader.contains(entry, SFO_ENTRY_SIZE))
            break;

        auto key_offset = reader.readUint<uint16_t>(entry, false);
        auto data_length = reader.readUint<uint32_t>(entry + 4, false);
        auto data_offset = reader.readUint<uint32_t>(entry + 12, false);

        uint64_t key_start = (uint64_t)key_table + key_offset;
        if(key_start >= reader.size())
            continue;
        auto key_data = reader.readVector(key_start, std::min<uint64_t>(reader.size() - key_start, 64));
        std::string key((const char *)key_data.data(), key_data.size());
        key = key.substr(0, key.find('\0'));

        uint64_t value_start = (uint64_t)data_table + data_offset;
        if(!reader.contains(value_start, data_length))
            continue;
        auto value = reader.readString(value_start, data_length);
        sfo[key] = value.substr(0, value.find('\0'));
    }

    return sfo;
}


Located locate_umd_data(const Volume &volume, const ExtractOptions &)
{
    Located located;
    located.reader = volume.open("UMD_DATA.BIN");
    located.attributes = volume_attributes(volume);

    if(auto param_sfo = volume.find("PSP_GAME/PARAM.SFO"))
    {
        auto sfo = read_sfo(*param_sfo);
        if(auto it = sfo.find("TITLE"); it != sfo.end())
            located.attributes.set("sfo_title", it->second);
        if(auto it = sfo.find("DISC_VERSION"); it != sfo.end())
            located.attributes.set("disc_version", it->second);
    }

    return located;
}

}


Descriptor descriptor_psp()
{
    Layout umd;
    umd.name = "UMD";
    umd.offset = 0;
    umd.size = SERIAL_LENGTH + 1;
    umd.byte_order = ByteOrder::NATIVE;
    umd.fields =
    {
        {"umd_serial", 0, SERIAL_LENGTH, Encoding::STRING, Transform::NONE}
    };

    umd.validator = [](const std::vector<uint8_t> &header, const FieldValues &)
    {
        return header[SERIAL_LENGTH] == SERIAL_TERMINATOR;
    };

    umd.composer = [](const FieldValues &values, Identifier &identifier)
    {
        identifier.serial = values.text("umd_serial");

        auto title = values.text("sfo_title");
        if(!title.empty())
            identifier.raw_title = title;
        auto version = values.text("disc_version");
        if(!version.empty())
            identifier.version = version;

        auto region = sony_region(Platform::PSP, identifier.serial.substr(0, 4));
        if(!region.empty())
            identifier.region_hint = region;
    };

    return Descriptor{ Platform::PSP, Source::FILESYSTEM, image_locator(locate_umd_data), { umd }, SerialStyle::PREFIXED, locate_umd_data };
}

}
