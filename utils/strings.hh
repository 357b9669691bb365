#pragma once



#include <cstdint>
#include <optional>
#include <string>
#include <vector>



namespace gameid
{

void trim_left_inplace(std::string &s);
void trim_right_inplace(std::string &s);
void trim_inplace(std::string &s);
std::string trim(std::string s);
void erase_all_inplace(std::string &s, char c);
void replace_all_inplace(std::string &s, std::string from, std::string to);
std::string replace_all(std::string s, const std::string &from, const std::string &to);
std::string str_uppercase(const std::string &s);
std::string str_quoted_if_space(const std::string &s);
std::vector<std::string> tokenize(const std::string &str, const char *delimiters, const char *quotes);
void replace_nonprint_inplace(std::string &s, char r);
std::string replace_nonprint(std::string s, char r);
std::optional<uint64_t> str_to_uint64(std::string::const_iterator str_begin, std::string::const_iterator str_end);
std::optional<uint64_t> str_to_uint64(const std::string &str);
std::optional<uint64_t> str_to_uint64_prefixed(const std::string &str);

}
