#pragma once



#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "identifier.hh"
#include "readers/data_reader.hh"
#include "readers/swap_reader.hh"
#include "systems/platform.hh"



namespace gameid
{

struct ExtractOptions
{
    // candidate layout priority override, unlisted layouts are not attempted
    std::vector<std::string> layout_order;

    // caller supplied disc attributes, take precedence over the ISO9660 ones
    std::optional<std::string> volume_id;
    std::optional<std::string> uuid;
};


class FieldValues
{
public:
    void set(const std::string &name, const std::string &text, std::optional<uint64_t> number = std::nullopt);
    void merge(const FieldValues &values);

    bool contains(const std::string &name) const;
    std::string text(const std::string &name) const;
    uint64_t number(const std::string &name) const;

    const std::map<std::string, std::string> &texts() const;

private:
    std::map<std::string, std::string> _texts;
    std::map<std::string, uint64_t> _numbers;
};


enum class Encoding
{
    // bytes as is
    RAW,
    // cut at NUL, trimmed
    STRING,
    // non printable replaced with space, trimmed
    PRINTABLE,
    // uppercase hex digits
    HEX,
    UINT_LE,
    UINT_BE
};


enum class Transform
{
    NONE,
    UPPERCASE,
    ERASE_SPACES,
    // integers rendered as 0x prefixed hex, two digits per byte
    HEX_NUMBER
};


struct Field
{
    std::string name;
    uint32_t offset;
    uint32_t length;
    Encoding encoding;
    Transform transform;
};


struct Layout
{
    std::string name;
    uint64_t offset;
    // 0: everything from offset to the end of the located data
    uint64_t size;
    ByteOrder byte_order;
    std::vector<Field> fields;

    // optional in place header repair, applied before fields are decoded
    std::function<void(std::vector<uint8_t> &header)> fixup;
    std::function<bool(const std::vector<uint8_t> &header, const FieldValues &values)> validator;
    std::function<void(const FieldValues &values, Identifier &identifier)> composer;
};


enum class Source
{
    CARTRIDGE,
    SYSTEM_AREA,
    FILESYSTEM
};


enum class SerialStyle
{
    // separators dropped
    COMPACT,
    // separators dropped, one dash between the letter prefix and the rest
    PREFIXED
};


struct Located
{
    // nullptr: layouts are read from the source itself
    std::unique_ptr<DataReader> reader;
    FieldValues attributes;
};


class Volume;

struct Descriptor
{
    Platform platform;
    Source source;
    std::function<Located(const DataReader &source, const ExtractOptions &options)> locator;
    std::vector<Layout> layouts;
    SerialStyle serial_style;
    // set for platforms that can be read from a mounted disc
    std::function<Located(const Volume &volume, const ExtractOptions &options)> volume_locator;
};


FieldValues decode_fields(const std::vector<uint8_t> &header, const std::vector<Field> &fields);
std::string field_hex_number(uint64_t value, uint32_t length);

}
