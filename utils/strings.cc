#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "strings.hh"
#include "throw_line.hh"



namespace gameid
{

void trim_left_inplace(std::string &s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); }));
}


void trim_right_inplace(std::string &s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), s.end());
}


void trim_inplace(std::string &s)
{
    trim_right_inplace(s);
    trim_left_inplace(s);
}


std::string trim(std::string s)
{
    trim_inplace(s);
    return s;
}


void erase_all_inplace(std::string &s, char c)
{
    s.erase(std::remove(s.begin(), s.end(), c), s.end());
}


void replace_all_inplace(std::string &s, std::string from, std::string to)
{
    for(size_t pos = 0; (pos = s.find(from, pos)) != std::string::npos; pos += to.length())
        s.replace(pos, from.length(), to);
}


std::string replace_all(std::string s, const std::string &from, const std::string &to)
{
    replace_all_inplace(s, from, to);
    return s;
}


// ASCII only, independent of the current locale
std::string str_uppercase(const std::string &s)
{
    std::string str_uc;
    std::transform(s.begin(), s.end(), std::back_inserter(str_uc), [](char c) { return c >= 'a' && c <= 'z' ? (char)(c - 'a' + 'A') : c; });

    return str_uc;
}


std::string str_quoted_if_space(const std::string &s)
{
    const std::string quote("\"");

    return s.find(' ') == std::string::npos ? s : quote + s + quote;
}


std::vector<std::string> tokenize(const std::string &str, const char *delimiters, const char *quotes)
{
    std::vector<std::string> tokens;

    std::set<char> delimiter;
    for(auto d = delimiters; *d != '\0'; ++d)
        delimiter.insert(*d);

    bool in = false;
    std::string::const_iterator s;
    for(auto it = str.begin(); it < str.end(); ++it)
    {
        if(in)
        {
            // quoted
            if(quotes != nullptr && *s == quotes[0])
            {
                if(*it == quotes[1])
                {
                    ++s;
                    tokens.emplace_back(s, it);
                    in = false;
                }
            }
            // unquoted
            else
            {
                if(delimiter.find(*it) != delimiter.end())
                {
                    tokens.emplace_back(s, it);
                    in = false;
                }
            }
        }
        else
        {
            if(delimiter.find(*it) == delimiter.end())
            {
                s = it;
                in = true;
            }
        }
    }

    // remaining entry
    if(in)
        tokens.emplace_back(s, str.end());

    return tokens;
}


void replace_nonprint_inplace(std::string &s, char r)
{
    std::transform(s.begin(), s.end(), s.begin(), [r](char c) { return c >= ' ' && c <= '~' ? c : r; });
}


std::string replace_nonprint(std::string s, char r)
{
    replace_nonprint_inplace(s, r);
    return s;
}


std::optional<uint64_t> str_to_uint64(std::string::const_iterator str_begin, std::string::const_iterator str_end)
{
    uint64_t value = 0;

    bool valid = false;
    for(auto it = str_begin; it != str_end; ++it)
    {
        if(std::isdigit((unsigned char)*it))
        {
            value = (value * 10) + (*it - '0');
            valid = true;
        }
        else
        {
            valid = false;
            break;
        }
    }

    return valid ? std::make_optional(value) : std::nullopt;
}


std::optional<uint64_t> str_to_uint64(const std::string &str)
{
    return str_to_uint64(str.cbegin(), str.cend());
}


// decimal, or hexadecimal with 0x prefix
std::optional<uint64_t> str_to_uint64_prefixed(const std::string &str)
{
    if(str.length() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X'))
    {
        uint64_t value = 0;
        for(auto it = str.begin() + 2; it != str.end(); ++it)
        {
            char c = *it;
            uint8_t digit;
            if(c >= '0' && c <= '9')
                digit = c - '0';
            else if(c >= 'a' && c <= 'f')
                digit = c - 'a' + 0x0A;
            else if(c >= 'A' && c <= 'F')
                digit = c - 'A' + 0x0A;
            else
                return std::nullopt;

            value = value << 4 | digit;
        }

        return value;
    }

    return str_to_uint64(str);
}

}
