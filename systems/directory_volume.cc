#include <algorithm>
#include "directory_volume.hh"
#include "filesystem/iso9660/iso9660_defs.hh"
#include "readers/file_reader.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"



namespace gameid
{

namespace
{

// disc names are case insensitive and may carry an ISO9660 version suffix on either side
bool name_matches(const std::string &name, const std::string &disc_name)
{
    uint32_t version = 0;
    uint32_t disc_version = 0;
    auto a = str_uppercase(iso9660::split_identifier(version, name));
    auto b = str_uppercase(iso9660::split_identifier(disc_version, disc_name));

    return a == b && (!version || !disc_version || version == disc_version);
}

}


DirectoryVolume::DirectoryVolume(const std::filesystem::path &directory, const ExtractOptions &options)
    : _directory(directory)
    , _volumeID(options.volume_id)
    , _uuid(options.uuid)
{
    if(!std::filesystem::is_directory(_directory))
        throw_line("not a directory ({})", _directory.string());
}


std::unique_ptr<DataReader> DirectoryVolume::find(const std::string &path) const
{
    auto current = _directory;

    auto components = tokenize(path, "/\\", nullptr);
    for(auto const &c : components)
    {
        bool found = false;
        for(auto const &e : std::filesystem::directory_iterator(current))
        {
            if(name_matches(c, e.path().filename().string()))
            {
                current = e.path();
                found = true;
                break;
            }
        }

        if(!found)
            return nullptr;
    }

    if(components.empty() || !std::filesystem::is_regular_file(current))
        return nullptr;

    return std::make_unique<FileReader>(current);
}


std::vector<std::string> DirectoryVolume::rootFiles() const
{
    std::vector<std::string> files;

    for(auto const &e : std::filesystem::directory_iterator(_directory))
        if(e.is_regular_file())
            files.push_back(e.path().filename().string());
    std::sort(files.begin(), files.end());

    return files;
}


FieldValues DirectoryVolume::attributes() const
{
    FieldValues values;

    if(_volumeID)
        values.set("volume_id", *_volumeID);
    if(_uuid)
        values.set("uuid", *_uuid);

    return values;
}

}
