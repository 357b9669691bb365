#pragma once



#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "iso9660_defs.hh"
#include "iso9660_entry.hh"
#include "readers/sector_reader.hh"



namespace gameid::iso9660
{

class Browser
{
public:
    static std::vector<uint8_t> readSystemArea(const SectorReader &sector_reader);
    static bool findDescriptor(VolumeDescriptor &descriptor, const SectorReader &sector_reader, VolumeDescriptorType type);
    static std::shared_ptr<Entry> rootDirectory(const SectorReader &sector_reader, const PrimaryVolumeDescriptor &pvd);

    // creation date text, YYYY-MM-DD-HH-MM-SS-CC
    static std::string volumeUUID(const PrimaryVolumeDescriptor &pvd);
};

}
