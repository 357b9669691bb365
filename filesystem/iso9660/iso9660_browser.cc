#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "cd/cdrom.hh"
#include "iso9660_browser.hh"



namespace gameid::iso9660
{

std::vector<uint8_t> Browser::readSystemArea(const SectorReader &sector_reader)
{
    uint32_t sectors_count = std::min(sector_reader.sectorsCount(), SYSTEM_AREA_SIZE);

    return sector_reader.readVector(0, sectors_count);
}


bool Browser::findDescriptor(VolumeDescriptor &descriptor, const SectorReader &sector_reader, VolumeDescriptorType type)
{
    bool found = false;

    // the first descriptor has to be there, TRUNCATED_INPUT otherwise
    for(uint32_t s = SYSTEM_AREA_SIZE; s == SYSTEM_AREA_SIZE || s < sector_reader.sectorsCount(); ++s)
    {
        sector_reader.read((uint8_t *)&descriptor, s, 1);

        std::string_view si((const char *)descriptor.standard_identifier, sizeof(descriptor.standard_identifier));
        if(si != STANDARD_IDENTIFIER && si != STANDARD_IDENTIFIER_CDI)
            break;

        if(descriptor.type == type)
        {
            found = true;
            break;
        }
        else if(descriptor.type == VolumeDescriptorType::SET_TERMINATOR)
            break;
    }

    return found;
}


std::shared_ptr<Entry> Browser::rootDirectory(const SectorReader &sector_reader, const PrimaryVolumeDescriptor &pvd)
{
    return std::make_shared<Entry>(sector_reader, std::string(""), 1, pvd.root_directory_record);
}


std::string Browser::volumeUUID(const PrimaryVolumeDescriptor &pvd)
{
    constexpr uint32_t UUID_OFFSET = offsetof(PrimaryVolumeDescriptor, volume_creation_date_time);
    constexpr uint32_t UUID_SIZE = 16;

    auto data = (const uint8_t *)&pvd;

    // usually at 813, some mastering tools shift it, the text is followed by '$' or '.'
    uint32_t uuid_offset = UUID_OFFSET;
    for(uint32_t i = UUID_OFFSET; i < UUID_OFFSET + 17; ++i)
    {
        if(data[i] == '$' || data[i] == '.')
        {
            uuid_offset = i - UUID_SIZE;
            break;
        }
    }

    std::string uuid((const char *)data + uuid_offset, UUID_SIZE);
    if(!std::all_of(uuid.begin(), uuid.end(), [](char c) { return c >= ' ' && c <= '~'; }))
        return "";

    std::string out(uuid, 0, 4);
    for(uint32_t i = 4; i < uuid.length(); i += 2)
        out += "-" + uuid.substr(i, 2);

    return out;
}

}
