#pragma once



#include <map>
#include <optional>
#include <string>
#include <vector>
#include "systems/platform.hh"



namespace gameid
{

struct Identifier
{
    Platform platform;

    // normalized, database key form
    std::string serial;

    std::optional<std::string> raw_title;
    std::optional<std::string> region_hint;
    std::optional<std::string> version;

    // normalized alternative keys, tried in order when the serial has no match
    std::vector<std::string> aliases;

    // every decoded header field plus disc attributes
    std::map<std::string, std::string> attributes;

    // candidate layout that validated
    std::string layout;
};

}
