#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>
#include "disc_volume.hh"
#include "regions.hh"
#include "systems.hh"
#include "utils/misc.hh"
#include "utils/strings.hh"



namespace gameid
{

namespace
{

constexpr std::string_view SYSTEM_MAGIC = "SEGA SEGASATURN";
constexpr uint32_t YEAR_SYMBOLS = 4;
constexpr uint32_t MONTH_SYMBOLS = 2;
constexpr uint32_t DAY_SYMBOLS = 2;


std::string extract_date(std::string date)
{
    if(date.length() < YEAR_SYMBOLS + MONTH_SYMBOLS + DAY_SYMBOLS)
        return "";

    auto year_index = str_to_uint64(std::string(date, 0, YEAR_SYMBOLS));
    if(!year_index || !number_is_year(*year_index))
        return "";
    auto month_index = str_to_uint64(std::string(date, YEAR_SYMBOLS, MONTH_SYMBOLS));
    if(!month_index || !number_is_month(*month_index))
        return "";
    auto day_index = str_to_uint64(std::string(date, YEAR_SYMBOLS + MONTH_SYMBOLS, DAY_SYMBOLS));
    if(!day_index || !number_is_day(*day_index))
        return "";
    date.insert(4, "-");
    date.insert(7, "-");
    return date;
}


std::pair<std::string, std::string> extract_serial_version(std::string serialversion)
{
    auto p = serialversion.rfind('V');
    std::string serial = serialversion.substr(0, p);
    trim_inplace(serial);

    std::string version;
    if(p != std::string::npos)
    {
        auto v = serialversion.substr(p + 1);
        erase_all_inplace(v, ' ');

        if(std::all_of(v.begin(), v.end(), [](char c) { return std::isdigit((unsigned char)c) || c == '.'; }))
            version = v;
    }

    return std::pair(version, serial);
}

}


Descriptor descriptor_saturn()
{
    Layout ip;
    ip.name = "IP";
    ip.offset = 0;
    ip.size = 0x100;
    ip.byte_order = ByteOrder::NATIVE;
    ip.fields =
    {
        {"system_name",   0x00, 16,  Encoding::RAW,       Transform::NONE},
        {"maker_id",      0x10, 16,  Encoding::PRINTABLE, Transform::NONE},
        {"serialversion", 0x20, 16,  Encoding::RAW,       Transform::NONE},
        {"date",          0x30, 8,   Encoding::PRINTABLE, Transform::NONE},
        {"device_info",   0x38, 8,   Encoding::PRINTABLE, Transform::NONE},
        {"regions",       0x40, 10,  Encoding::RAW,       Transform::NONE},
        {"peripherals",   0x50, 16,  Encoding::PRINTABLE, Transform::NONE},
        {"internal_title", 0x60, 112, Encoding::PRINTABLE, Transform::NONE}
    };

    ip.validator = [](const std::vector<uint8_t> &, const FieldValues &values)
    {
        return values.text("system_name").compare(0, SYSTEM_MAGIC.size(), SYSTEM_MAGIC) == 0;
    };

    ip.composer = [](const FieldValues &values, Identifier &identifier)
    {
        auto date = extract_date(values.text("date"));
        if(!date.empty())
            identifier.attributes["build_date"] = date;

        auto [version, serial] = extract_serial_version(replace_nonprint(values.text("serialversion"), ' '));
        identifier.attributes["serial"] = serial;

        // "T-12705H  V1.000", the product number is the first word
        auto serial_words = tokenize(serial, " ", nullptr);
        if(!serial_words.empty())
            identifier.serial = serial_words.front();
        if(!version.empty())
            identifier.version = version;

        auto regions = sega_regions(replace_nonprint(values.text("regions"), ' '), SATURN_REGIONS, false);
        if(!regions.empty())
            identifier.region_hint = join_regions(regions);

        identifier.raw_title = values.text("internal_title");
    };

    return Descriptor{ Platform::SATURN, Source::SYSTEM_AREA, locate_system_area, { ip }, SerialStyle::COMPACT };
}

}
