#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string_view>
#include "error.hh"
#include "gamedb.hh"
#include "systems/serial.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"



namespace gameid
{

namespace
{

constexpr std::string_view TABLE_SUFFIX = ".data.tsv";


// empty fields are kept
std::vector<std::string> split_row(const std::string &line)
{
    std::vector<std::string> fields;

    std::stringstream ss(line);
    std::string field;
    while(std::getline(ss, field, '\t'))
        fields.push_back(trim(field));
    if(!line.empty() && line.back() == '\t')
        fields.emplace_back();

    return fields;
}


std::string attribute(const Record &record, const std::string &name)
{
    auto it = record.attributes.find(name);
    return it == record.attributes.end() ? "" : it->second;
}


// "NUS-NSME-USA" -> "NSME"
std::string middle_part(const std::string &id)
{
    auto parts = tokenize(id, "-", nullptr);
    return parts.size() >= 2 ? parts[1] : id;
}


std::string first_word(const std::string &id)
{
    auto words = tokenize(id, " ", nullptr);
    return words.empty() ? id : words.front();
}


std::optional<std::string> gb_key(const Record &record)
{
    auto checksum = str_to_uint64_prefixed(attribute(record, "global_checksum_expected"));
    if(!checksum || !record.attributes.count("internal_title"))
        return std::nullopt;

    return fmt::format("{}#{:04X}", attribute(record, "internal_title"), *checksum);
}


std::optional<std::string> snes_key(const Record &record)
{
    auto developer = str_to_uint64_prefixed(attribute(record, "developer_ID"));
    auto version = str_to_uint64_prefixed(attribute(record, "rom_version"));
    auto checksum = str_to_uint64_prefixed(attribute(record, "checksum"));
    if(!developer || !version || !checksum)
        return std::nullopt;

    auto title = str_uppercase(attribute(record, "internal_title"));
    if(title.compare(0, 2, "0X") == 0)
        title.erase(0, 2);

    return fmt::format("{:02X}#{}#{:02X}#{:04X}", *developer, title, *version, *checksum);
}

}


std::optional<Platform> gamedb_table_platform(const std::filesystem::path &table_path)
{
    auto name = table_path.filename().string();
    if(name.length() <= TABLE_SUFFIX.length() || name.compare(name.length() - TABLE_SUFFIX.length(), TABLE_SUFFIX.length(), TABLE_SUFFIX) != 0)
        return std::nullopt;
    name.erase(name.length() - TABLE_SUFFIX.length());

    for(auto p : platforms_all())
        if(platform_string(p) == name)
            return p;

    return std::nullopt;
}


std::vector<Record> gamedb_read_table(const std::filesystem::path &table_path, Platform platform)
{
    std::vector<Record> records;

    std::fstream fs(table_path, std::fstream::in);
    if(!fs.is_open())
        throw_error(ErrorCode::DATABASE_UNAVAILABLE, "unable to open database table ({})", table_path.string());

    std::string line;
    if(!std::getline(fs, line))
        throw_error(ErrorCode::DATABASE_UNAVAILABLE, "database table is empty ({})", table_path.string());
    if(!line.empty() && line.back() == '\r')
        line.pop_back();

    auto header = split_row(line);
    std::optional<size_t> id_column;
    for(size_t i = 0; i < header.size(); ++i)
        if(str_uppercase(header[i]) == "ID")
            id_column = i;
    if(!id_column)
        throw_error(ErrorCode::DATABASE_UNAVAILABLE, "database table header has no ID column ({})", table_path.string());

    for(uint32_t row_number = 2; std::getline(fs, line); ++row_number)
    {
        if(!line.empty() && line.back() == '\r')
            line.pop_back();
        if(trim(line).empty())
            continue;

        auto row = split_row(line);
        if(row.size() > header.size())
        {
            LOG("warning: {}:{}: unexpected number of columns ({}, expected: {}), skipping", table_path.filename().string(), row_number, row.size(), header.size());
            continue;
        }
        row.resize(header.size());

        Record record;
        record.platform = platform;
        record.id = row[*id_column];
        if(record.id.empty())
        {
            LOG("warning: {}:{}: empty ID, skipping", table_path.filename().string(), row_number);
            continue;
        }

        for(size_t i = 0; i < header.size(); ++i)
        {
            if(i == *id_column || row[i].empty())
                continue;

            auto column = header[i];
            if(column == "title")
                record.title = row[i];
            else if(column == "developer")
                record.developer = row[i];
            else if(column == "publisher")
                record.publisher = row[i];
            else if(column == "rating")
                record.rating = row[i];
            else if(column == "region")
                record.region = row[i];
            else if(column == "release_date")
                record.release_date = row[i];
            else
                record.attributes[column] = row[i];
        }

        auto keys = gamedb_record_keys(record);
        if(keys.empty())
        {
            LOG("warning: {}:{}: unable to derive lookup key ({}), skipping", table_path.filename().string(), row_number, record.id);
            continue;
        }
        record.serial = keys.front();

        records.push_back(record);
    }

    return records;
}


std::vector<std::string> gamedb_record_keys(const Record &record)
{
    std::vector<std::string> keys;

    std::optional<std::string> key;
    std::vector<std::string> extra;
    switch(record.platform)
    {
    case Platform::GB:
    case Platform::GBC:
        key = gb_key(record);
        break;

    case Platform::SNES:
        key = snes_key(record);
        break;

    case Platform::N64:
    {
        auto code = middle_part(record.id);
        key = code.length() > 1 ? code.substr(1) : code;
    }
    break;

    case Platform::GBA:
    case Platform::GC:
        key = middle_part(record.id);
        break;

    case Platform::GENESIS:
    case Platform::SATURN:
        key = first_word(record.id);
        break;

    case Platform::NEOGEOCD:
    {
        auto volume_id = attribute(record, "volume_ID");
        auto uuid = attribute(record, "uuid");
        if(!volume_id.empty())
        {
            key = uuid.empty() ? volume_id : uuid + "#" + volume_id;
            extra.push_back(volume_id);
        }
    }
    break;

    case Platform::PSX:
    case Platform::PS2:
        key = record.id;
        if(auto redump_name = attribute(record, "redump_name"); !redump_name.empty())
            extra.push_back(redump_name);
        break;

    default:
        key = record.id;
    }

    if(key)
        extra.insert(extra.begin(), *key);

    for(auto const &k : extra)
    {
        auto normalized = normalize_serial(record.platform, k);
        if(!normalized.empty() && std::find(keys.begin(), keys.end(), normalized) == keys.end())
            keys.push_back(normalized);
    }

    return keys;
}

}
