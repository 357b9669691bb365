#pragma once



#include <string>



namespace gameid
{

std::string gameid_version();

}
