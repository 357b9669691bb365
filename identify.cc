#include "extractor.hh"
#include "identify.hh"



namespace gameid
{

std::vector<Record> lookup_identifier(const Identifier &identifier, const Database &database, const std::string &name_hint)
{
    auto candidates = database.lookup(identifier.platform, identifier.serial);

    for(auto it = identifier.aliases.begin(); candidates.empty() && it != identifier.aliases.end(); ++it)
        candidates = database.lookup(identifier.platform, *it);

    if(candidates.empty() && !name_hint.empty() && (identifier.platform == Platform::PSX || identifier.platform == Platform::PS2))
        candidates = database.lookup(identifier.platform, name_hint);

    return candidates;
}


Identification identify(const DataReader &source, Platform platform, const Database &database, const IdentifyOptions &options)
{
    // fail before touching the source
    database.checkAvailable();

    Identification identification;
    identification.identifier = extract(source, platform, options.extract);
    identification.match = reconcile(identification.identifier, lookup_identifier(identification.identifier, database, options.name_hint), options.prefer_database);

    return identification;
}


Identification identify(const Volume &volume, Platform platform, const Database &database, const IdentifyOptions &options)
{
    database.checkAvailable();

    Identification identification;
    identification.identifier = extract(volume, platform, options.extract);
    identification.match = reconcile(identification.identifier, lookup_identifier(identification.identifier, database, options.name_hint), options.prefer_database);

    return identification;
}

}
