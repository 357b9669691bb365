#pragma once



#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "record.hh"
#include "systems/platform.hh"



namespace gameid
{

// caller owned, read-only after load, every lookup throws DATABASE_UNAVAILABLE until loaded
class Database
{
public:
    Database();
    Database(std::vector<Record> records);

    // GameDB data directory or a single "<Console>.data.tsv" table
    void load(const std::filesystem::path &path);

    // re-reads the loaded path, the handle becomes unavailable on failure
    void reload();

    bool available() const;
    size_t size() const;

    // DATABASE_UNAVAILABLE if not loaded
    void checkAvailable() const;

    std::vector<Record> lookup(Platform platform, const std::string &serial) const;
    std::vector<Record> lookupPrefix(Platform platform, const std::string &prefix) const;

private:
    bool _available;
    std::filesystem::path _path;
    std::vector<Record> _records;

    // (index family, normalized key) -> record indices
    std::map<Platform, std::unordered_map<std::string, std::vector<uint32_t>>> _index;
    // sorted keys per index family
    std::map<Platform, std::vector<std::string>> _keys;


    void build(std::vector<Record> records);
    void clear();
    std::vector<Record> collect(const std::vector<uint32_t> &indices) const;
};

}
