#include <algorithm>
#include <iterator>
#include <map>
#include "reconciler.hh"
#include "utils/misc.hh"
#include "utils/strings.hh"



namespace gameid
{

namespace
{

std::optional<std::string> merge_field(const std::optional<std::string> &disk, const std::string &database, bool prefer_database)
{
    if(prefer_database && !database.empty())
        return database;
    if(disk)
        return disk;
    if(!database.empty())
        return database;

    return std::nullopt;
}


std::optional<std::string> disk_attribute(const Identifier &identifier, const std::string &name)
{
    auto it = identifier.attributes.find(name);
    return it == identifier.attributes.end() ? std::nullopt : std::optional<std::string>(it->second);
}


std::vector<std::string> region_tokens(const std::string &region)
{
    auto tokens = tokenize(region, ",/", nullptr);
    for(auto &t : tokens)
        t = str_uppercase(trim(t));

    return tokens;
}


bool region_matches(const std::string &hint, const std::string &region)
{
    auto hint_tokens = region_tokens(hint);
    auto record_tokens = region_tokens(region);

    return std::any_of(hint_tokens.begin(), hint_tokens.end(),
        [&record_tokens](const std::string &t) { return std::find(record_tokens.begin(), record_tokens.end(), t) != record_tokens.end(); });
}


bool version_matches(const std::string &version, const std::string &record_version)
{
    if(str_uppercase(trim(version)) == str_uppercase(trim(record_version)))
        return true;

    auto a = str_to_uint64_prefixed(trim(version));
    auto b = str_to_uint64_prefixed(trim(record_version));
    return a && b && *a == *b;
}


// applies the filter only if something survives
template<typename F>
void narrow(std::vector<Record> &records, F filter)
{
    std::vector<Record> filtered;
    std::copy_if(records.begin(), records.end(), std::back_inserter(filtered), filter);
    if(!filtered.empty())
        records.swap(filtered);
}


Metadata merge(const Identifier &identifier, const Record &record, bool prefer_database)
{
    Metadata metadata;

    metadata.platform = record.platform;
    metadata.serial = identifier.serial;
    metadata.canonical_id = record.id;

    metadata.title = merge_field(identifier.raw_title, record.title, prefer_database);
    metadata.developer = merge_field(disk_attribute(identifier, "developer"), record.developer, prefer_database);
    metadata.publisher = merge_field(disk_attribute(identifier, "publisher"), record.publisher, prefer_database);
    metadata.rating = merge_field(std::nullopt, record.rating, prefer_database);
    metadata.region = merge_field(identifier.region_hint, record.region, prefer_database);
    metadata.release_date = merge_field(std::nullopt, record.release_date, prefer_database);
    metadata.version = merge_field(identifier.version, record_version(record), prefer_database);

    metadata.attributes = prefer_database ? record.attributes : identifier.attributes;
    for(auto const &a : prefer_database ? identifier.attributes : record.attributes)
        metadata.attributes.emplace(a.first, a.second);

    return metadata;
}

}


std::string match_status_string(Match::Status status)
{
    static const std::map<Match::Status, std::string> STATUS_STRING =
    {
        {Match::Status::FOUND,     "found"    },
        {Match::Status::NOT_FOUND, "not found"},
        {Match::Status::AMBIGUOUS, "ambiguous"}
    };

    return enum_to_string(status, STATUS_STRING);
}


std::string record_version(const Record &record)
{
    for(auto const &name : { "version", "rom_version", "revision", "software_version", "disc_version" })
    {
        auto it = record.attributes.find(name);
        if(it != record.attributes.end() && !it->second.empty())
            return it->second;
    }

    return "";
}


Match reconcile(const Identifier &identifier, const std::vector<Record> &candidates, bool prefer_database)
{
    Match match;
    match.serial = identifier.serial;

    auto narrowed = candidates;
    if(identifier.region_hint)
        narrow(narrowed, [&identifier](const Record &r) { return region_matches(*identifier.region_hint, r.region); });
    if(narrowed.size() > 1 && identifier.version)
        narrow(narrowed, [&identifier](const Record &r) { return version_matches(*identifier.version, record_version(r)); });

    if(narrowed.empty())
        match.status = Match::Status::NOT_FOUND;
    else if(narrowed.size() == 1)
    {
        match.status = Match::Status::FOUND;
        match.metadata = merge(identifier, narrowed.front(), prefer_database);
    }
    else
    {
        match.status = Match::Status::AMBIGUOUS;
        match.candidates = narrowed;
    }

    return match;
}

}
