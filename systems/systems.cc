#include <map>
#include "error.hh"
#include "systems.hh"



namespace gameid
{

const Descriptor &descriptor(Platform platform)
{
    static const std::map<Platform, Descriptor> DESCRIPTORS = []()
    {
        std::map<Platform, Descriptor> descriptors;

        for(auto d : { descriptor_gb(Platform::GB), descriptor_gb(Platform::GBC), descriptor_gba(), descriptor_snes(), descriptor_n64(), descriptor_genesis(), descriptor_psx(), descriptor_ps2(),
                 descriptor_psp(), descriptor_gc(), descriptor_saturn(), descriptor_segacd(), descriptor_neogeocd() })
            descriptors.emplace(d.platform, d);

        return descriptors;
    }();

    auto it = DESCRIPTORS.find(platform);
    if(it == DESCRIPTORS.end())
        throw_error(ErrorCode::UNSUPPORTED_PLATFORM, "no descriptor for platform ({})", (int)platform);

    return it->second;
}

}
