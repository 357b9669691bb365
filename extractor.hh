#pragma once



#include <vector>
#include "identifier.hh"
#include "readers/data_reader.hh"
#include "systems/descriptor.hh"
#include "systems/platform.hh"
#include "systems/volume.hh"



namespace gameid
{

// TRUNCATED_INPUT if no candidate layout fits the source, FORMAT_MISMATCH if none validates
Identifier extract(const DataReader &source, Platform platform, const ExtractOptions &options = ExtractOptions());

// mounted disc, UNSUPPORTED_PLATFORM for platforms identified by raw image data
Identifier extract(const Volume &volume, Platform platform, const ExtractOptions &options = ExtractOptions());

// platforms whose extraction succeeds, never used to pick the platform for extract()
std::vector<Platform> probe(const DataReader &source, const ExtractOptions &options = ExtractOptions());
std::vector<Platform> probe(const Volume &volume, const ExtractOptions &options = ExtractOptions());

// header bytes of the validated layout, for diagnostics
std::vector<uint8_t> extract_header(const DataReader &source, const Identifier &identifier, const ExtractOptions &options = ExtractOptions());
std::vector<uint8_t> extract_header(const Volume &volume, const Identifier &identifier, const ExtractOptions &options = ExtractOptions());

}
