#pragma once



#include <cstdint>
#include <map>
#include <set>
#include <string>
#include "platform.hh"



namespace gameid
{

// Sony serial prefix (SLUS, SCES, ULJM...), empty if unknown or multi region
std::string sony_region(Platform platform, const std::string &prefix);

// Nintendo game code destination letter (N64, GC, GBA)
std::string nintendo_region(char code);

// SNES header country byte
std::string snes_region(uint8_t country);

// Sega header region letters, old style ("JUE") or, if allowed, new style single hex digit
std::set<std::string> sega_regions(std::string codes, const std::map<char, std::string> &letters, bool new_style = true);

std::string join_regions(const std::set<std::string> &regions);


extern const std::map<char, std::string> SEGA_REGIONS;
extern const std::map<char, std::string> SATURN_REGIONS;

}
