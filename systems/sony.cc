#include <algorithm>
#include <cctype>
#include "error.hh"
#include "regions.hh"
#include "sony.hh"
#include "utils/strings.hh"



namespace gameid
{

namespace
{

bool is_digits(const std::string &s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit((unsigned char)c); });
}

}


std::map<std::string, std::string> load_cnf(const Volume &volume, const std::string &cnf_file)
{
    std::map<std::string, std::string> cnf;

    auto reader = volume.find(cnf_file);
    if(!reader)
        return cnf;

    auto data = reader->readVector(0, reader->size());
    for(auto const &line : tokenize(std::string(data.begin(), data.end()), "\r\n", nullptr))
    {
        auto s = line.find('=');
        if(s == std::string::npos)
            continue;

        auto key = str_uppercase(trim(line.substr(0, s)));
        if(!key.empty())
            cnf.emplace(key, trim(line.substr(s + 1)));
    }

    return cnf;
}


std::string boot_path(const std::string &value)
{
    auto device_end = value.find(':');
    if(device_end == std::string::npos)
        return "";

    auto device = str_uppercase(trim(value.substr(0, device_end)));
    if(device != "CDROM" && device != "CDROM0")
        return "";

    auto path = value.substr(device_end + 1);
    path = path.substr(0, path.find(';'));
    path = trim(path);
    path.erase(0, path.find_first_not_of("\\/"));

    return str_uppercase(path);
}


std::pair<std::string, std::string> exe_serial(const std::string &exe_path)
{
    auto name = exe_path.substr(exe_path.find_last_of("\\/") + 1);
    name = name.substr(0, name.find(';'));

    // PREFIX[_-]NUMBER.DIGITS, the extension may end with a letter
    auto dot = name.find('.');
    if(dot == std::string::npos)
        return {};
    auto stem = name.substr(0, dot);
    auto extension = name.substr(dot + 1);
    if(!extension.empty() && std::isalpha((unsigned char)extension.back()))
        extension.pop_back();
    if(!is_digits(extension))
        return {};

    auto prefix_end = std::find_if(stem.begin(), stem.end(), [](char c) { return !std::isupper((unsigned char)c); });
    std::string prefix(stem.begin(), prefix_end);
    std::string number(prefix_end, stem.end());
    if(!number.empty() && (number.front() == '_' || number.front() == '-'))
        number.erase(0, 1);

    // one letter is allowed in front of the digits
    bool lettered = number.size() > 1 && std::isupper((unsigned char)number.front()) && is_digits(number.substr(1));
    if(prefix.empty() || (!lettered && !is_digits(number)))
        return {};

    return { prefix, number + extension };
}


void compose_sony_serial(Platform platform, const FieldValues &values, Identifier &identifier)
{
    auto volume_id = values.text("volume_id");

    auto [prefix, number] = exe_serial(values.text("boot_file"));
    if(!number.empty())
    {
        identifier.serial = prefix + "-" + number;

        // 5 letter prefixes are listed under their 4 letter form (SLUSP -> SLUS)
        if(prefix.length() == 5)
            identifier.aliases.push_back(prefix.substr(0, 4) + "-" + number);

        auto region = sony_region(platform, prefix);
        if(!region.empty())
            identifier.region_hint = region;
    }
    else if(!volume_id.empty())
        identifier.serial = volume_id;
    else
        throw_error(ErrorCode::FORMAT_MISMATCH, "unable to deduce serial ({})", values.text("boot_file"));

    // volume identifiers often carry the serial, SLUS_012.34 or SLUS-01234_XX
    if(!volume_id.empty())
    {
        auto parts = tokenize(replace_all(volume_id, "-", "_"), "_", nullptr);
        if(parts.size() >= 2)
            identifier.aliases.push_back(parts[0] + "_" + parts[1]);
        else
            identifier.aliases.push_back(volume_id);
    }

    for(auto const &f : tokenize(values.text("root_files"), "/", nullptr))
    {
        auto [p, n] = exe_serial(str_uppercase(trim(f)));
        if(!p.empty() && !n.empty())
            identifier.aliases.push_back(p + "-" + n);
    }
}

}
