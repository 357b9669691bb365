#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <iomanip>
#include <sstream>
#include <string>
#include "hex_bin.hh"



namespace gameid
{

std::string hexdump(const uint8_t *data, uint32_t offset, uint32_t size)
{
    auto data_offset = data + offset;

    std::stringstream ss;
    ss << std::setfill('0');
    for(uint32_t row_offset = 0; row_offset < size; row_offset += 16)
    {
        uint32_t row_size = std::min(size - row_offset, 16u);

        ss << std::hex << std::uppercase;
        ss << std::setw(4) << offset + row_offset << " : ";

        for(uint32_t i = 0; i < 16; ++i)
        {
            if(i == 8)
                ss << ' ';
            if(i < row_size)
                ss << std::setw(2) << (uint32_t)data_offset[row_offset + i] << ' ';
            else
                ss << "   ";
        }

        ss << std::dec << "  ";

        for(uint32_t i = 0; i < row_size; ++i)
        {
            auto c = data_offset[row_offset + i];
            ss << (c >= 0x20 && c < 0x80 ? (char)c : '.');
        }
        ss << std::endl;
    }

    return ss.str();
}


std::string bin2hex(const uint8_t *data, uint32_t size)
{
    std::string hex_string;

    for(uint32_t i = 0; i < size; ++i)
        hex_string += fmt::format("{:02X}", data[i]);

    return hex_string;
}

}
