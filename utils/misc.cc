#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include "misc.hh"



namespace gameid
{

std::string system_date_time(std::string fmt)
{
    auto time_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::stringstream ss;
    ss << std::put_time(localtime(&time_now), fmt.c_str());
    return ss.str();
}


bool number_is_year(uint32_t year)
{
    // reasonable unixtime range
    return year >= 1970 && year < 2038;
}


bool number_is_month(uint32_t month)
{
    return month >= 1 && month <= 12;
}


bool number_is_day(uint32_t day)
{
    return day >= 1 && day <= 31;
}

}
