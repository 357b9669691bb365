#pragma once



#include <filesystem>
#include <list>
#include <string>
#include <utility>
#include "options.hh"



namespace gameid
{

// (file, data track) entries in cue sheet order
std::list<std::pair<std::string, bool>> cue_get_entries(const std::filesystem::path &cue_path);

// cue sheets resolve to their first data track file, everything else is used as is
std::filesystem::path resolve_image_path(const std::filesystem::path &path);

int gameid(Options &options);

}
