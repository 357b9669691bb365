#include <algorithm>
#include <fmt/format.h>
#include <map>
#include <set>
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

constexpr std::string_view SYSTEM_MAGIC = "SEGADISCSYSTEM";
constexpr uint32_t ROM_HEADER_OFFSET = 0x100;
constexpr uint32_t DEVICE_SUPPORT_OFFSET = 0x90;
constexpr uint32_t DATE_OFFSET = 8;
constexpr uint32_t YEAR_SYMBOLS = 4;
constexpr uint32_t MONTH_SYMBOLS = 3;


const std::map<std::string, uint32_t> MONTHS =
{
    {"JAN",  1},
    {"FEB",  2},
    {"MAR",  3},
    {"APR",  4},
    {"MAY",  5},
    {"JUN",  6},
    {"JUL",  7},
    {"AUG",  8},
    {"SEP",  9},
    {"OCT", 10},
    {"NOV", 11},
    {"DEC", 12},
};


const std::set<char> DATE_DELIMITERS =
{
    '.', ' ', ',', '_'
};


std::pair<uint32_t, uint32_t> decode_date(std::string header_date)
{
    std::pair<uint32_t, uint32_t> date(0, 0);

    if(header_date.length() >= YEAR_SYMBOLS)
    {
        // 4-digit year
        if(auto year_index = str_to_uint64(std::string(header_date, 0, YEAR_SYMBOLS)))
        {
            date.first = *year_index;
        }
        // 2-digit year
        else if(header_date[0] == ' ' && header_date[1] == ' ')
        {
            if(auto year_index = str_to_uint64(std::string(header_date, 2, YEAR_SYMBOLS - 2)))
                date.first = *year_index + 1900;
        }

        // extract month
        if(header_date.length() > YEAR_SYMBOLS)
        {
            size_t month_start = YEAR_SYMBOLS;

            // skip delimiter if used
            if(DATE_DELIMITERS.find(header_date[YEAR_SYMBOLS]) != DATE_DELIMITERS.end())
                ++month_start;

            std::string month(header_date, std::min(month_start, header_date.length()), MONTH_SYMBOLS);
            auto it = MONTHS.find(str_uppercase(month));
            if(it == MONTHS.end())
            {
                // attempt to decode numeric month value
                if(auto month_index = str_to_uint64(std::string(month, 0, month.find(' '))); month_index && number_is_month(*month_index))
                    date.second = *month_index;
            }
            else
                date.second = it->second;
        }
    }

    return date;
}


std::string extract_date(const std::string &publisher_date_title)
{
    // check the usual date location
    auto date = decode_date(std::string(publisher_date_title, DATE_OFFSET));
    if(!date.first)
    {
        // find potential date
        for(size_t i = 0; i < publisher_date_title.length(); ++i)
        {
            auto d = decode_date(std::string(publisher_date_title, i));
            if(number_is_year(d.first))
            {
                date = d;
                break;
            }
        }
    }

    return date.first ? fmt::format("{:04}-{:02}", date.first, date.second) : "";
}

}


Descriptor descriptor_segacd()
{
    Layout ip;
    ip.name = "IP";
    ip.offset = 0;
    ip.size = 0x200;
    ip.byte_order = ByteOrder::NATIVE;
    ip.fields =
    {
        {"system_name",          0x000, 16, Encoding::PRINTABLE, Transform::NONE},
        {"publisher_date_title", 0x110, 64, Encoding::RAW,       Transform::NONE},
        {"title_domestic",       0x120, 48, Encoding::PRINTABLE, Transform::NONE},
        {"title_international",  0x150, 48, Encoding::PRINTABLE, Transform::NONE},
        {"serial_short",         0x180, 14, Encoding::RAW,       Transform::NONE},
        {"serial_checksum",      0x18E, 2,  Encoding::UINT_LE,   Transform::NONE},
        {"serial_long",          0x180, 16, Encoding::RAW,       Transform::NONE},
        {"device_support",       0x190, 16, Encoding::PRINTABLE, Transform::NONE},
        {"regions",              0x1F0, 3,  Encoding::RAW,       Transform::NONE}
    };

    // Power Factory (USA)
    // data is shifted due to one space character missing between serial and device support
    ip.fixup = [](std::vector<uint8_t> &header)
    {
        if(header.back() == '\0')
        {
            header.pop_back();
            header.insert(header.begin() + ROM_HEADER_OFFSET + DEVICE_SUPPORT_OFFSET - 1, ' ');
        }
    };

    ip.validator = [](const std::vector<uint8_t> &, const FieldValues &values)
    {
        return values.text("system_name").compare(0, SYSTEM_MAGIC.size(), SYSTEM_MAGIC) == 0;
    };

    ip.composer = [](const FieldValues &values, Identifier &identifier)
    {
        auto date = extract_date(values.text("publisher_date_title"));
        if(!date.empty())
            identifier.attributes["build_date"] = date;

        // MCD often reuse checksum field for serial
        std::string serial(values.number("serial_checksum") == 1 ? values.text("serial_short") : values.text("serial_long"));
        // erase software type if specified
        if(serial.length() > 2 && serial[2] == ' ')
            serial.erase(serial.begin(), serial.begin() + 2);
        serial = replace_nonprint(serial, ' ');
        erase_all_inplace(serial, ' ');
        identifier.serial = serial;

        auto regions = sega_regions(replace_nonprint(values.text("regions"), ' '), SEGA_REGIONS);
        if(!regions.empty())
            identifier.region_hint = join_regions(regions);

        auto title = values.text("title_international");
        identifier.raw_title = title.empty() ? values.text("title_domestic") : title;
    };

    return Descriptor{ Platform::SEGACD, Source::SYSTEM_AREA, locate_system_area, { ip }, SerialStyle::COMPACT };
}

}
