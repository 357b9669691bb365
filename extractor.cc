#include <algorithm>
#include "error.hh"
#include "extractor.hh"
#include "readers/swap_reader.hh"
#include "systems/serial.hh"
#include "systems/systems.hh"
#include "systems/volume.hh"
#include "utils/throw_line.hh"



namespace gameid
{

namespace
{

std::vector<const Layout *> ordered_layouts(const Descriptor &descriptor, const std::vector<std::string> &layout_order)
{
    std::vector<const Layout *> layouts;

    if(layout_order.empty())
    {
        for(auto const &l : descriptor.layouts)
            layouts.push_back(&l);
    }
    else
    {
        for(auto const &name : layout_order)
        {
            auto it = std::find_if(descriptor.layouts.begin(), descriptor.layouts.end(), [&name](const Layout &l) { return l.name == name; });
            if(it == descriptor.layouts.end())
            {
                std::string names;
                for(auto const &l : descriptor.layouts)
                    names += (names.empty() ? "" : ", ") + l.name;
                throw_line("unknown layout ({}), possible values: {}", name, names);
            }

            layouts.push_back(&*it);
        }
    }

    return layouts;
}


// returns false if the layout doesn't fit the data
bool read_header(std::vector<uint8_t> &header, const DataReader &reader, const Layout &layout)
{
    SwapReader swapped(reader, layout.byte_order);

    if(layout.offset > swapped.size())
        return false;
    uint64_t size = layout.size ? layout.size : swapped.size() - layout.offset;
    if(!size || !swapped.contains(layout.offset, size))
        return false;

    header = swapped.readVector(layout.offset, size);
    if(layout.fixup)
        layout.fixup(header);

    return true;
}


Located locate(const Descriptor &d, const DataReader &source, const ExtractOptions &options)
{
    Located located;
    if(d.locator)
        located = d.locator(source, options);

    return located;
}


Located locate(const Descriptor &d, const Volume &volume, const ExtractOptions &options)
{
    if(!d.volume_locator)
        throw_error(ErrorCode::UNSUPPORTED_PLATFORM, "{} can't be read from a mounted disc", platform_string(d.platform));

    auto located = d.volume_locator(volume, options);
    if(!located.reader)
        throw_line("{} locator returned no data", platform_string(d.platform));

    return located;
}


Identifier extract_layouts(const Descriptor &d, const Located &located, const DataReader &reader, const ExtractOptions &options)
{
    auto platform = d.platform;

    bool attempted = false;
    for(auto layout : ordered_layouts(d, options.layout_order))
    {
        std::vector<uint8_t> header;
        if(!read_header(header, reader, *layout))
            continue;
        attempted = true;

        auto values = decode_fields(header, layout->fields);
        values.merge(located.attributes);
        if(!layout->validator(header, values))
            continue;

        Identifier identifier;
        identifier.platform = platform;
        identifier.layout = layout->name;
        identifier.attributes = values.texts();
        layout->composer(values, identifier);

        identifier.serial = normalize_serial(identifier.serial, d.serial_style);
        if(identifier.serial.empty())
            throw_error(ErrorCode::FORMAT_MISMATCH, "{} header carries no serial (layout: {})", platform_string(platform), layout->name);

        std::vector<std::string> aliases;
        for(auto const &a : identifier.aliases)
        {
            auto alias = normalize_serial(a, d.serial_style);
            if(!alias.empty() && alias != identifier.serial && std::find(aliases.begin(), aliases.end(), alias) == aliases.end())
                aliases.push_back(alias);
        }
        identifier.aliases = aliases;

        return identifier;
    }

    if(!attempted)
        throw_error(ErrorCode::TRUNCATED_INPUT, "source is too short for any {} header layout (size: {})", platform_string(platform), reader.size());

    throw_error(ErrorCode::FORMAT_MISMATCH, "no {} header layout validates", platform_string(platform));
}

}


Identifier extract(const DataReader &source, Platform platform, const ExtractOptions &options)
{
    auto &d = descriptor(platform);

    auto located = locate(d, source, options);
    return extract_layouts(d, located, located.reader ? *located.reader : source, options);
}


Identifier extract(const Volume &volume, Platform platform, const ExtractOptions &options)
{
    auto &d = descriptor(platform);

    auto located = locate(d, volume, options);
    return extract_layouts(d, located, *located.reader, options);
}


namespace
{

template<typename T>
std::vector<Platform> probe_platforms(const T &input, const ExtractOptions &options)
{
    std::vector<Platform> platforms;

    // layout names are platform specific
    ExtractOptions probe_options(options);
    probe_options.layout_order.clear();

    for(auto p : platforms_all())
    {
        try
        {
            extract(input, p, probe_options);
            platforms.push_back(p);
        }
        catch(const Error &e)
        {
            if(e.code() != ErrorCode::TRUNCATED_INPUT && e.code() != ErrorCode::FORMAT_MISMATCH && e.code() != ErrorCode::UNSUPPORTED_PLATFORM)
                throw;
        }
    }

    return platforms;
}

}


std::vector<Platform> probe(const DataReader &source, const ExtractOptions &options)
{
    return probe_platforms(source, options);
}


std::vector<Platform> probe(const Volume &volume, const ExtractOptions &options)
{
    return probe_platforms(volume, options);
}


namespace
{

std::vector<uint8_t> layout_header(const Descriptor &d, const DataReader &reader, const Identifier &identifier)
{
    auto it = std::find_if(d.layouts.begin(), d.layouts.end(), [&identifier](const Layout &l) { return l.name == identifier.layout; });
    if(it == d.layouts.end())
        throw_line("unknown layout ({})", identifier.layout);

    std::vector<uint8_t> header;
    if(!read_header(header, reader, *it))
        throw_error(ErrorCode::TRUNCATED_INPUT, "layout doesn't fit the source ({})", identifier.layout);

    return header;
}

}


std::vector<uint8_t> extract_header(const DataReader &source, const Identifier &identifier, const ExtractOptions &options)
{
    auto &d = descriptor(identifier.platform);

    auto located = locate(d, source, options);
    return layout_header(d, located.reader ? *located.reader : source, identifier);
}


std::vector<uint8_t> extract_header(const Volume &volume, const Identifier &identifier, const ExtractOptions &options)
{
    auto &d = descriptor(identifier.platform);

    auto located = locate(d, volume, options);
    return layout_header(d, *located.reader, identifier);
}

}
