#include <regex>
#include "disc_volume.hh"
#include "error.hh"
#include "systems.hh"
#include "utils/strings.hh"



namespace gameid
{

namespace
{

Located locate_ipl(const Volume &volume, const ExtractOptions &)
{
    Located located;
    located.reader = volume.open("IPL.TXT");
    located.attributes = volume_attributes(volume);

    return located;
}

}


Descriptor descriptor_neogeocd()
{
    // whole IPL.TXT
    Layout ipl;
    ipl.name = "IPL";
    ipl.offset = 0;
    ipl.size = 0;
    ipl.byte_order = ByteOrder::NATIVE;

    // first line is a load entry, e.g. "PROG.PRG,0,0"
    ipl.validator = [](const std::vector<uint8_t> &header, const FieldValues &)
    {
        std::string text(header.begin(), header.end());
        auto lines = tokenize(text, "\r\n", nullptr);

        return !lines.empty() && std::regex_search(lines.front(), std::regex("^\\s*[A-Za-z0-9_]+\\.[A-Za-z0-9_]+\\s*,"));
    };

    ipl.composer = [](const FieldValues &values, Identifier &identifier)
    {
        auto volume_id = values.text("volume_id");
        if(volume_id.empty())
            throw_error(ErrorCode::FORMAT_MISMATCH, "volume identifier is empty");

        auto uuid = values.text("uuid");
        identifier.serial = uuid.empty() ? volume_id : uuid + "#" + volume_id;
        identifier.aliases.push_back(volume_id);
    };

    return Descriptor{ Platform::NEOGEOCD, Source::FILESYSTEM, image_locator(locate_ipl), { ipl }, SerialStyle::COMPACT, locate_ipl };
}

}
