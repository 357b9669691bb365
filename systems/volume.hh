#pragma once



#include <memory>
#include <string>
#include <vector>
#include "descriptor.hh"
#include "readers/data_reader.hh"



namespace gameid
{

// file tree of a disc, either parsed from an image or a mounted directory
class Volume
{
public:
    virtual ~Volume() {}

    // regular file contents, nullptr if there is no such file
    virtual std::unique_ptr<DataReader> find(const std::string &path) const = 0;

    // sorted root directory file names
    virtual std::vector<std::string> rootFiles() const = 0;

    // system_id, volume_id, publisher_id, data_preparer_id, uuid where known
    virtual FieldValues attributes() const = 0;

    // FORMAT_MISMATCH if missing
    std::unique_ptr<DataReader> open(const std::string &path) const;
};


// attributes plus root_files, " / " separated
FieldValues volume_attributes(const Volume &volume);

}
