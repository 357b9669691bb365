#pragma once



#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "record.hh"
#include "systems/platform.hh"



namespace gameid
{

// "<Console>.data.tsv" table name to platform
std::optional<Platform> gamedb_table_platform(const std::filesystem::path &table_path);

// records of one GameDB table, malformed rows are skipped with a warning
std::vector<Record> gamedb_read_table(const std::filesystem::path &table_path, Platform platform);

// normalized lookup keys derived the same way the extractor composes serials, primary key first
std::vector<std::string> gamedb_record_keys(const Record &record);

}
