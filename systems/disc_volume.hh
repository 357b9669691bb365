#pragma once



#include <memory>
#include <string>
#include <vector>
#include "descriptor.hh"
#include "filesystem/iso9660/iso9660_browser.hh"
#include "readers/data_reader.hh"
#include "readers/sector_reader.hh"
#include "volume.hh"



namespace gameid
{

// ISO9660 volume of a disc image, FORMAT_MISMATCH if there is no primary volume descriptor
class DiscVolume : public Volume
{
public:
    DiscVolume(const DataReader &source, const ExtractOptions &options);

    DiscVolume(const DiscVolume &) = delete;
    DiscVolume &operator=(const DiscVolume &) = delete;

    std::unique_ptr<DataReader> find(const std::string &path) const override;
    std::vector<std::string> rootFiles() const override;
    FieldValues attributes() const override;

private:
    SectorReader _sectorReader;
    iso9660::PrimaryVolumeDescriptor _pvd;
    std::shared_ptr<iso9660::Entry> _root;
    std::string _volumeID;
    std::string _uuid;
};


// first 16 sectors plus volume attributes when the image carries ISO9660
Located locate_system_area(const DataReader &source, const ExtractOptions &options);

// descriptor locator over an image, for locators written against a Volume
template<typename F>
auto image_locator(F volume_locator)
{
    return [volume_locator](const DataReader &source, const ExtractOptions &options)
    {
        DiscVolume volume(source, options);
        return volume_locator(volume, options);
    };
}

}
