#pragma once



#include <cassert>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include "throw_line.hh"



namespace gameid
{

template<typename T, typename U, class = typename std::enable_if_t<std::is_unsigned_v<U>>>
constexpr T scale_up(T value, U multiple)
{
    assert(multiple);
    T sign = value > 0 ? +1 : (value < 0 ? -1 : 0);
    return (value - sign) / (T)multiple + sign;
}


template<typename T, typename U, class = typename std::enable_if_t<std::is_unsigned_v<U>>>
constexpr T scale_down(T value, U multiple)
{
    assert(multiple);
    return value / (T)multiple;
}


template<typename T, typename U, class = typename std::enable_if_t<std::is_unsigned_v<U>>>
constexpr T round_down(T value, U multiple)
{
    return scale_down(value, multiple) * (T)multiple;
}


template<typename T>
std::string dictionary_values(const std::map<T, std::string> &dictionary)
{
    std::string values;

    std::string delimiter;
    for(auto &d : dictionary)
    {
        values += delimiter + d.second;
        if(delimiter.empty())
            delimiter = ", ";
    }

    return values;
}


template<typename T>
std::string enum_to_string(T value, const std::map<T, std::string> &dictionary)
{
    auto it = dictionary.find(value);
    if(it == dictionary.end())
        throw_line("enum_to_string failed, no such value in dictionary (possible values: {})", dictionary_values(dictionary));

    return it->second;
}


std::string system_date_time(std::string fmt);
bool number_is_year(uint32_t year);
bool number_is_month(uint32_t month);
bool number_is_day(uint32_t day);

}
