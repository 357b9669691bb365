#pragma once



#include <map>
#include <string>
#include <utility>
#include "identifier.hh"
#include "systems/descriptor.hh"
#include "systems/volume.hh"



namespace gameid
{

// KEY = VALUE lines of SYSTEM.CNF, empty if the file is missing
std::map<std::string, std::string> load_cnf(const Volume &volume, const std::string &cnf_file);

// "cdrom:\EXE\SLPS_004.35;1" -> "EXE\SLPS_004.35", empty if the value doesn't point to the disc
std::string boot_path(const std::string &value);

// executable file name to (prefix, number), e.g. "SCUS_944.23" -> ("SCUS", "94423")
std::pair<std::string, std::string> exe_serial(const std::string &exe_path);

// serial from the boot executable name, the volume identifier if the name carries none
void compose_sony_serial(Platform platform, const FieldValues &values, Identifier &identifier);

}
