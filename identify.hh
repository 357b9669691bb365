#pragma once



#include <string>
#include <vector>
#include "db/database.hh"
#include "identifier.hh"
#include "readers/data_reader.hh"
#include "reconciler.hh"
#include "systems/descriptor.hh"
#include "systems/volume.hh"



namespace gameid
{

struct IdentifyOptions
{
    ExtractOptions extract;
    bool prefer_database = false;

    // image file name without extension or directory name, last resort key for PSX / PS2
    std::string name_hint;
};


struct Identification
{
    Identifier identifier;
    Match match;
};


// serial first, then aliases, first key with candidates wins
std::vector<Record> lookup_identifier(const Identifier &identifier, const Database &database, const std::string &name_hint = "");

Identification identify(const DataReader &source, Platform platform, const Database &database, const IdentifyOptions &options = IdentifyOptions());
Identification identify(const Volume &volume, Platform platform, const Database &database, const IdentifyOptions &options = IdentifyOptions());

}
