#pragma once



#include <map>
#include <string>
#include "systems/platform.hh"



namespace gameid
{

struct Record
{
    Platform platform;

    // normalized primary lookup key
    std::string serial;

    // database ID as published
    std::string id;

    std::string title;
    std::string developer;
    std::string publisher;
    std::string rating;
    std::string region;
    std::string release_date;

    // every other column
    std::map<std::string, std::string> attributes;
};

}
