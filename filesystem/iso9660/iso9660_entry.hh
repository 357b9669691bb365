#pragma once



#include <cstdint>
#include <list>
#include <memory>
#include <string>
#include <vector>
#include "iso9660_defs.hh"
#include "readers/memory_reader.hh"
#include "readers/sector_reader.hh"



namespace gameid::iso9660
{

class Entry
{
public:
    Entry(const SectorReader &sector_reader, const std::string &name, uint32_t version, const DirectoryRecord &directory_record);

    const std::string &name() const;
    uint32_t version() const;
    uint32_t sectorsLBA() const;
    uint32_t sectorsSize() const;
    uint32_t size() const;
    bool isDirectory() const;

    std::list<std::shared_ptr<Entry>> entries() const;
    std::shared_ptr<Entry> subEntry(const std::string &path) const;

    std::vector<uint8_t> read() const;
    std::unique_ptr<MemoryReader> reader() const;

private:
    const SectorReader &_sectorReader;
    std::string _name;
    uint32_t _version;
    DirectoryRecord _directoryRecord;
};

}
