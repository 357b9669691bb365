#include "error.hh"
#include "volume.hh"



namespace gameid
{

std::unique_ptr<DataReader> Volume::open(const std::string &path) const
{
    auto reader = find(path);
    if(!reader)
        throw_error(ErrorCode::FORMAT_MISMATCH, "file not found ({})", path);

    return reader;
}


FieldValues volume_attributes(const Volume &volume)
{
    auto values = volume.attributes();

    std::string root_files;
    for(auto const &f : volume.rootFiles())
        root_files += (root_files.empty() ? "" : " / ") + f;
    values.set("root_files", root_files);

    return values;
}

}
