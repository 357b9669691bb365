#pragma once



#include <fmt/format.h>
#include <stdexcept>
#include <string>



namespace gameid
{

enum class ErrorCode
{
    TRUNCATED_INPUT,
    FORMAT_MISMATCH,
    UNSUPPORTED_PLATFORM,
    DATABASE_UNAVAILABLE
};


class Error : public std::runtime_error
{
public:
    Error(ErrorCode code, const std::string &message);

    ErrorCode code() const;

private:
    ErrorCode _code;
};


std::string error_code_string(ErrorCode code);

}


// same shape as throw_line, carrying an error code
#ifdef NDEBUG
#define throw_error(code__, ...) throw gameid::Error(code__, fmt::format(__VA_ARGS__))
#else
#define throw_error(code__, ...) throw gameid::Error(code__, fmt::format("{} {{{}:{}}}", fmt::format(__VA_ARGS__), __FILE__, __LINE__))
#endif
