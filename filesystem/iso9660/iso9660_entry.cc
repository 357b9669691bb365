#include <cstdint>
#include <list>
#include <memory>
#include <string>
#include <vector>
#include "cd/cdrom.hh"
#include "iso9660_entry.hh"
#include "utils/misc.hh"
#include "utils/strings.hh"



namespace gameid::iso9660
{

Entry::Entry(const SectorReader &sector_reader, const std::string &name, uint32_t version, const DirectoryRecord &directory_record)
    : _sectorReader(sector_reader)
    , _name(name)
    , _version(version)
    , _directoryRecord(directory_record)
{
    ;
}


const std::string &Entry::name() const
{
    return _name;
}


uint32_t Entry::version() const
{
    return _version;
}


uint32_t Entry::sectorsLBA() const
{
    return _directoryRecord.offset.lsb;
}


uint32_t Entry::sectorsSize() const
{
    return scale_up(_directoryRecord.data_length.lsb, FORM1_DATA_SIZE);
}


uint32_t Entry::size() const
{
    return _directoryRecord.data_length.lsb;
}


bool Entry::isDirectory() const
{
    return _directoryRecord.file_flags & (uint8_t)DirectoryRecord::FileFlags::DIRECTORY;
}


std::list<std::shared_ptr<Entry>> Entry::entries() const
{
    std::list<std::shared_ptr<Entry>> entries;

    if(isDirectory())
    {
        // read whole directory record to memory
        std::vector<uint8_t> directory_extent(read());

        auto directory_records = directory_extent_get_records(directory_extent);
        for(auto const &dr : directory_records)
        {
            // skip current and parent records
            if(dr.first == std::string(1, (char)Characters::DIR_CURRENT) || dr.first == std::string(1, (char)Characters::DIR_PARENT))
                continue;

            uint32_t version;
            std::string name = split_identifier(version, dr.first);

            entries.push_back(std::make_shared<Entry>(_sectorReader, name, version, dr.second));
        }
    }

    return entries;
}


std::shared_ptr<Entry> Entry::subEntry(const std::string &path) const
{
    std::shared_ptr<Entry> entry;

    auto components = tokenize(path, "/\\", nullptr);
    for(auto const &c : components)
    {
        uint32_t version;
        std::string name = str_uppercase(split_identifier(version, c));

        bool found = false;

        auto directories = entry ? entry->entries() : entries();
        for(auto &d : directories)
        {
            if(name == str_uppercase(d->name()) && (!version || version == d->version()))
            {
                entry = d;
                found = true;
                break;
            }
        }

        if(!found)
        {
            entry.reset();
            break;
        }
    }

    return entry;
}


std::vector<uint8_t> Entry::read() const
{
    auto sectors = _sectorReader.readVector(sectorsLBA(), sectorsSize());
    sectors.resize(_directoryRecord.data_length.lsb);

    return sectors;
}


std::unique_ptr<MemoryReader> Entry::reader() const
{
    return std::make_unique<MemoryReader>(read());
}

}
