#pragma once



#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "descriptor.hh"
#include "volume.hh"



namespace gameid
{

// mounted disc or extracted image directory, there is no volume descriptor to read
// so volume_id / uuid come from the caller only
class DirectoryVolume : public Volume
{
public:
    DirectoryVolume(const std::filesystem::path &directory, const ExtractOptions &options);

    std::unique_ptr<DataReader> find(const std::string &path) const override;
    std::vector<std::string> rootFiles() const override;
    FieldValues attributes() const override;

private:
    std::filesystem::path _directory;
    std::optional<std::string> _volumeID;
    std::optional<std::string> _uuid;
};

}
