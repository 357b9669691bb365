#include <algorithm>
#include <array>
#include "disc_volume.hh"
#include "error.hh"
#include "sony.hh"
#include "systems.hh"



namespace gameid
{

namespace
{

constexpr std::array<uint8_t, 4> EXE_MAGIC = { 0x7F, 0x45, 0x4C, 0x46 };


Located locate_elf(const Volume &volume, const ExtractOptions &)
{
    auto system_cnf = load_cnf(volume, "SYSTEM.CNF");
    auto it = system_cnf.find("BOOT2");
    if(it == system_cnf.end())
        throw_error(ErrorCode::FORMAT_MISMATCH, "SYSTEM.CNF BOOT2 entry not found");

    auto exe_path = boot_path(it->second);
    if(exe_path.empty())
        throw_error(ErrorCode::FORMAT_MISMATCH, "unexpected BOOT2 entry ({})", it->second);

    Located located;
    located.reader = volume.open(exe_path);
    located.attributes = volume_attributes(volume);
    located.attributes.set("boot_file", exe_path);

    it = system_cnf.find("VER");
    if(it != system_cnf.end())
        located.attributes.set("disc_version", it->second);

    return located;
}

}


Descriptor descriptor_ps2()
{
    Layout elf;
    elf.name = "ELF";
    elf.offset = 0;
    elf.size = EXE_MAGIC.size();
    elf.byte_order = ByteOrder::NATIVE;
    elf.fields =
    {
        {"exe_magic", 0, (uint32_t)EXE_MAGIC.size(), Encoding::HEX, Transform::NONE}
    };

    elf.validator = [](const std::vector<uint8_t> &header, const FieldValues &)
    {
        return std::equal(EXE_MAGIC.begin(), EXE_MAGIC.end(), header.begin());
    };

    elf.composer = [](const FieldValues &values, Identifier &identifier)
    {
        compose_sony_serial(Platform::PS2, values, identifier);

        auto version = values.text("disc_version");
        if(!version.empty())
            identifier.version = version;
    };

    return Descriptor{ Platform::PS2, Source::FILESYSTEM, image_locator(locate_elf), { elf }, SerialStyle::PREFIXED, locate_elf };
}

}
