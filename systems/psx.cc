#include <string_view>
#include "disc_volume.hh"
#include "error.hh"
#include "sony.hh"
#include "systems.hh"



namespace gameid
{

namespace
{

constexpr std::string_view EXE_MAGIC = "PS-X EXE";


// boot executable named by SYSTEM.CNF, discs without one start PSX.EXE
std::string find_exe(const Volume &volume)
{
    auto cnf = load_cnf(volume, "SYSTEM.CNF");
    if(cnf.empty())
        return volume.find("PSX.EXE") ? "PSX.EXE" : "";

    // BOOT = cdrom:\SCUS_944.23;1, some discs misspell the key (BOOT1, BOOTFILE)
    for(auto const &[key, value] : cnf)
        if(key.rfind("BOOT", 0) == 0)
            if(auto path = boot_path(value); !path.empty())
                return path;

    return "";
}


Located locate_exe(const Volume &volume, const ExtractOptions &)
{
    auto exe_path = find_exe(volume);
    if(exe_path.empty())
        throw_error(ErrorCode::FORMAT_MISMATCH, "boot executable not found");

    Located located;
    located.reader = volume.open(exe_path);
    located.attributes = volume_attributes(volume);
    located.attributes.set("boot_file", exe_path);

    return located;
}

}


Descriptor descriptor_psx()
{
    Layout exe;
    exe.name = "EXE";
    exe.offset = 0;
    exe.size = EXE_MAGIC.size();
    exe.byte_order = ByteOrder::NATIVE;
    exe.fields =
    {
        {"exe_magic", 0, (uint32_t)EXE_MAGIC.size(), Encoding::RAW, Transform::NONE}
    };

    exe.validator = [](const std::vector<uint8_t> &, const FieldValues &values)
    {
        return values.text("exe_magic") == EXE_MAGIC;
    };

    exe.composer = [](const FieldValues &values, Identifier &identifier)
    {
        compose_sony_serial(Platform::PSX, values, identifier);
    };

    return Descriptor{ Platform::PSX, Source::FILESYSTEM, image_locator(locate_exe), { exe }, SerialStyle::PREFIXED, locate_exe };
}

}
