#pragma once



#include <cstdint>
#include <string>



namespace gameid
{

std::string hexdump(const uint8_t *data, uint32_t offset, uint32_t size);
std::string bin2hex(const uint8_t *data, uint32_t size);

}
