#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>
#include "cd/cdrom.hh"
#include "iso9660_defs.hh"
#include "utils/endian.hh"
#include "utils/misc.hh"
#include "utils/strings.hh"



namespace gameid::iso9660
{

bool directory_record_is_valid(const DirectoryRecord &dr)
{
    return dr.offset.lsb == endian_swap((uint32_t)dr.offset.msb) && dr.data_length.lsb == endian_swap((uint32_t)dr.data_length.msb);
}


std::vector<std::pair<std::string, DirectoryRecord>> directory_extent_get_records(const std::vector<uint8_t> &extent)
{
    std::vector<std::pair<std::string, DirectoryRecord>> directory_records;

    for(uint32_t i = 0, n = (uint32_t)extent.size(); i < n;)
    {
        uint32_t next_sector = round_down(i, FORM1_DATA_SIZE) + FORM1_DATA_SIZE;

        uint8_t length = extent[i];
        if(length >= sizeof(DirectoryRecord) && length <= next_sector - i && i + length <= n)
        {
            DirectoryRecord dr;
            memcpy(&dr, &extent[i], sizeof(dr));

            // garbage after (or before) legit entries is common on mastered discs,
            // lsb and msb of offset and data length have to agree
            if(!directory_record_is_valid(dr) || sizeof(dr) + dr.file_identifier_length > length)
                break;

            std::string identifier((const char *)&extent[i + sizeof(dr)], dr.file_identifier_length);
            directory_records.emplace_back(identifier, dr);

            i += length;
        }
        // skip sector boundary
        else
            i = next_sector;
    }

    return directory_records;
}


std::string split_identifier(uint32_t &version, std::string identifier)
{
    auto s = identifier.find_last_of((char)Characters::SEPARATOR2);

    version = 0;
    if(s != std::string::npos)
    {
        if(auto v = str_to_uint64(identifier.substr(s + 1)))
            version = *v;
    }

    return identifier.substr(0, s);
}


std::string identifier_to_string(const char *identifier, size_t size)
{
    return trim(std::string(identifier, size).c_str());
}

}
