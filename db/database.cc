#include <algorithm>
#include "database.hh"
#include "error.hh"
#include "gamedb.hh"
#include "systems/serial.hh"



namespace gameid
{

Database::Database()
    : _available(false)
{
    ;
}


Database::Database(std::vector<Record> records)
    : _available(false)
{
    build(std::move(records));
}


void Database::load(const std::filesystem::path &path)
{
    clear();

    std::error_code ec;
    std::vector<std::filesystem::path> tables;
    if(std::filesystem::is_directory(path, ec))
    {
        for(auto const &entry : std::filesystem::directory_iterator(path, ec))
            if(entry.is_regular_file(ec) && gamedb_table_platform(entry.path()))
                tables.push_back(entry.path());
        if(ec)
            throw_error(ErrorCode::DATABASE_UNAVAILABLE, "unable to read database directory ({}, {})", path.string(), ec.message());
        std::sort(tables.begin(), tables.end());
    }
    else if(std::filesystem::is_regular_file(path, ec))
    {
        if(!gamedb_table_platform(path))
            throw_error(ErrorCode::DATABASE_UNAVAILABLE, "unrecognized database table name ({}), expected <Console>.data.tsv", path.string());
        tables.push_back(path);
    }
    else
        throw_error(ErrorCode::DATABASE_UNAVAILABLE, "database not found ({})", path.string());

    if(tables.empty())
        throw_error(ErrorCode::DATABASE_UNAVAILABLE, "no database tables found ({})", path.string());

    std::vector<Record> records;
    for(auto const &t : tables)
    {
        auto table = gamedb_read_table(t, *gamedb_table_platform(t));
        records.insert(records.end(), table.begin(), table.end());
    }

    build(std::move(records));
    _path = path;
}


void Database::reload()
{
    if(_path.empty())
        throw_error(ErrorCode::DATABASE_UNAVAILABLE, "database was never loaded from a path");

    auto path = _path;
    try
    {
        load(path);
    }
    catch(const std::exception &)
    {
        clear();
        _path = path;
        throw;
    }
}


bool Database::available() const
{
    return _available;
}


size_t Database::size() const
{
    return _records.size();
}


std::vector<Record> Database::lookup(Platform platform, const std::string &serial) const
{
    checkAvailable();

    auto family = _index.find(platform_index_family(platform));
    if(family == _index.end())
        return {};

    auto it = family->second.find(normalize_serial(platform, serial));
    return it == family->second.end() ? std::vector<Record>() : collect(it->second);
}


std::vector<Record> Database::lookupPrefix(Platform platform, const std::string &prefix) const
{
    checkAvailable();

    auto family = platform_index_family(platform);
    auto keys = _keys.find(family);
    if(keys == _keys.end())
        return {};

    auto normalized = normalize_serial(platform, prefix);

    std::vector<uint32_t> indices;
    for(auto it = std::lower_bound(keys->second.begin(), keys->second.end(), normalized); it != keys->second.end() && it->compare(0, normalized.length(), normalized) == 0; ++it)
    {
        auto const &key_indices = _index.at(family).at(*it);
        for(auto i : key_indices)
            if(std::find(indices.begin(), indices.end(), i) == indices.end())
                indices.push_back(i);
    }

    return collect(indices);
}


void Database::build(std::vector<Record> records)
{
    clear();

    _records = std::move(records);
    for(uint32_t i = 0; i < _records.size(); ++i)
    {
        auto &r = _records[i];
        auto keys = gamedb_record_keys(r);
        if(r.serial.empty() && !keys.empty())
            r.serial = keys.front();

        auto family = platform_index_family(r.platform);
        for(auto const &k : keys)
        {
            auto &indices = _index[family][k];
            if(indices.empty())
                _keys[family].push_back(k);
            indices.push_back(i);
        }
    }

    for(auto &k : _keys)
        std::sort(k.second.begin(), k.second.end());

    _available = true;
}


void Database::clear()
{
    _available = false;
    _path.clear();
    _records.clear();
    _index.clear();
    _keys.clear();
}


void Database::checkAvailable() const
{
    if(!_available)
        throw_error(ErrorCode::DATABASE_UNAVAILABLE, "database is not loaded");
}


std::vector<Record> Database::collect(const std::vector<uint32_t> &indices) const
{
    std::vector<Record> records;
    for(auto i : indices)
        records.push_back(_records[i]);

    return records;
}

}
