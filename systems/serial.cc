#include <string_view>
#include "serial.hh"
#include "systems.hh"



namespace gameid
{

std::string normalize_serial(const std::string &serial, SerialStyle style)
{
    constexpr std::string_view SEPARATORS = "-_. ";

    std::string normalized;
    for(auto c : serial)
    {
        auto b = (uint8_t)c;

        // filesystem padding and non ASCII bytes
        if(b < 0x21 || b >= 0x7F)
            continue;
        if(SEPARATORS.find(c) != std::string_view::npos)
            continue;

        normalized += b >= 'a' && b <= 'z' ? (char)(b - 'a' + 'A') : c;
    }

    if(style == SerialStyle::PREFIXED)
    {
        size_t prefix_length = 0;
        while(prefix_length < normalized.length() && normalized[prefix_length] >= 'A' && normalized[prefix_length] <= 'Z')
            ++prefix_length;

        if(prefix_length && prefix_length < normalized.length())
            normalized.insert(prefix_length, 1, '-');
    }

    return normalized;
}


std::string normalize_serial(Platform platform, const std::string &serial)
{
    return normalize_serial(serial, descriptor(platform).serial_style);
}

}
