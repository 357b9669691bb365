#include <fmt/format.h>
#include "descriptor.hh"
#include "utils/endian.hh"
#include "utils/hex_bin.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"



namespace gameid
{

void FieldValues::set(const std::string &name, const std::string &text, std::optional<uint64_t> number)
{
    _texts[name] = text;
    if(number)
        _numbers[name] = *number;
    else
        _numbers.erase(name);
}


void FieldValues::merge(const FieldValues &values)
{
    for(auto const &t : values._texts)
        _texts[t.first] = t.second;
    for(auto const &n : values._numbers)
        _numbers[n.first] = n.second;
}


bool FieldValues::contains(const std::string &name) const
{
    return _texts.find(name) != _texts.end();
}


std::string FieldValues::text(const std::string &name) const
{
    auto it = _texts.find(name);
    return it == _texts.end() ? std::string() : it->second;
}


uint64_t FieldValues::number(const std::string &name) const
{
    auto it = _numbers.find(name);
    if(it == _numbers.end())
        throw_line("field is not numeric ({})", name);

    return it->second;
}


const std::map<std::string, std::string> &FieldValues::texts() const
{
    return _texts;
}


std::string field_hex_number(uint64_t value, uint32_t length)
{
    return fmt::format("0x{:0{}X}", value, length * 2);
}


FieldValues decode_fields(const std::vector<uint8_t> &header, const std::vector<Field> &fields)
{
    FieldValues values;

    for(auto const &f : fields)
    {
        if((uint64_t)f.offset + f.length > header.size())
            throw_line("field exceeds header ({}, offset: 0x{:X}, length: {})", f.name, f.offset, f.length);

        const uint8_t *data = header.data() + f.offset;

        std::string text;
        std::optional<uint64_t> number;
        switch(f.encoding)
        {
        case Encoding::RAW:
            text = std::string((const char *)data, f.length);
            break;

        case Encoding::STRING:
            text = std::string((const char *)data, f.length);
            text = trim(text.substr(0, text.find('\0')));
            break;

        case Encoding::PRINTABLE:
            text = trim(replace_nonprint(std::string((const char *)data, f.length), ' '));
            break;

        case Encoding::HEX:
            text = bin2hex(data, f.length);
            break;

        case Encoding::UINT_LE:
        case Encoding::UINT_BE:
        {
            bool big_endian = f.encoding == Encoding::UINT_BE;
            if(f.length == 1)
                number = data[0];
            else if(f.length == 2)
                number = decode_uint<uint16_t>(data, big_endian);
            else if(f.length == 4)
                number = decode_uint<uint32_t>(data, big_endian);
            else if(f.length == 8)
                number = decode_uint<uint64_t>(data, big_endian);
            else
                throw_line("unsupported integer field length ({}, length: {})", f.name, f.length);

            text = f.transform == Transform::HEX_NUMBER ? field_hex_number(*number, f.length) : std::to_string(*number);
        }
        break;
        }

        if(f.transform == Transform::UPPERCASE)
            text = str_uppercase(text);
        else if(f.transform == Transform::ERASE_SPACES)
            erase_all_inplace(text, ' ');

        values.set(f.name, text, number);
    }

    return values;
}

}
