#pragma once



#include <map>
#include <optional>
#include <string>
#include <vector>
#include "db/record.hh"
#include "identifier.hh"



namespace gameid
{

struct Metadata
{
    Platform platform;
    std::string serial;
    std::string canonical_id;

    std::optional<std::string> title;
    std::optional<std::string> developer;
    std::optional<std::string> publisher;
    std::optional<std::string> rating;
    std::optional<std::string> region;
    std::optional<std::string> release_date;
    std::optional<std::string> version;

    std::map<std::string, std::string> attributes;
};


struct Match
{
    enum class Status
    {
        FOUND,
        NOT_FOUND,
        AMBIGUOUS
    };

    Status status;

    // attempted serial
    std::string serial;

    // FOUND only
    std::optional<Metadata> metadata;

    // AMBIGUOUS only
    std::vector<Record> candidates;
};


std::string match_status_string(Match::Status status);

// prefer_database: database values win wherever the record defines them,
// otherwise on-disk values win wherever the identifier defines them
Match reconcile(const Identifier &identifier, const std::vector<Record> &candidates, bool prefer_database);

// record version from the usual GameDB columns, empty if none
std::string record_version(const Record &record);

}
