#include <algorithm>
#include "disc_volume.hh"
#include "error.hh"
#include "readers/memory_reader.hh"
#include "utils/logger.hh"



namespace gameid
{

DiscVolume::DiscVolume(const DataReader &source, const ExtractOptions &options)
    : _sectorReader(source)
{
    if(!iso9660::Browser::findDescriptor((iso9660::VolumeDescriptor &)_pvd, _sectorReader, iso9660::VolumeDescriptorType::PRIMARY))
        throw_error(ErrorCode::FORMAT_MISMATCH, "ISO9660 primary volume descriptor not found");

    // directories are read on first access
    _root = iso9660::Browser::rootDirectory(_sectorReader, _pvd);

    _volumeID = options.volume_id ? *options.volume_id : iso9660::identifier_to_string(_pvd.volume_identifier, sizeof(_pvd.volume_identifier));
    _uuid = options.uuid ? *options.uuid : iso9660::Browser::volumeUUID(_pvd);
}


std::unique_ptr<DataReader> DiscVolume::find(const std::string &path) const
{
    auto entry = _root->subEntry(path);
    if(!entry || entry->isDirectory())
        return nullptr;

    return entry->reader();
}


std::vector<std::string> DiscVolume::rootFiles() const
{
    std::vector<std::string> files;

    for(auto const &e : _root->entries())
        if(!e->isDirectory())
            files.push_back(e->name());
    std::sort(files.begin(), files.end());

    return files;
}


FieldValues DiscVolume::attributes() const
{
    FieldValues values;

    values.set("system_id", iso9660::identifier_to_string(_pvd.system_identifier, sizeof(_pvd.system_identifier)));
    values.set("volume_id", _volumeID);
    values.set("publisher_id", iso9660::identifier_to_string(_pvd.publisher_identifier, sizeof(_pvd.publisher_identifier)));
    values.set("data_preparer_id", iso9660::identifier_to_string(_pvd.data_preparer_identifier, sizeof(_pvd.data_preparer_identifier)));
    values.set("uuid", _uuid);

    return values;
}


Located locate_system_area(const DataReader &source, const ExtractOptions &options)
{
    Located located;

    SectorReader sector_reader(source);
    located.reader = std::make_unique<MemoryReader>(iso9660::Browser::readSystemArea(sector_reader));

    iso9660::VolumeDescriptor descriptor;
    if(sector_reader.sectorsCount() > iso9660::SYSTEM_AREA_SIZE && iso9660::Browser::findDescriptor(descriptor, sector_reader, iso9660::VolumeDescriptorType::PRIMARY))
    {
        DiscVolume volume(source, options);
        located.attributes = volume.attributes();

        // the header lives in the system area, a damaged root directory only costs the file list
        try
        {
            located.attributes = volume_attributes(volume);
        }
        catch(const Error &e)
        {
            if(e.code() != ErrorCode::TRUNCATED_INPUT)
                throw;

            LOG("warning: root directory is unreadable ({})", e.what());
        }
    }
    else
    {
        if(options.volume_id)
            located.attributes.set("volume_id", *options.volume_id);
        if(options.uuid)
            located.attributes.set("uuid", *options.uuid);
    }

    return located;
}

}
