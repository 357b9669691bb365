#pragma once



#include <string>
#include "descriptor.hh"
#include "platform.hh"



namespace gameid
{

// deterministic and idempotent, shared by extraction and database indexing
std::string normalize_serial(const std::string &serial, SerialStyle style);
std::string normalize_serial(Platform platform, const std::string &serial);

}
