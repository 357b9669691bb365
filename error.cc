#include <map>
#include <string>
#include "error.hh"
#include "utils/misc.hh"



namespace gameid
{

Error::Error(ErrorCode code, const std::string &message)
    : std::runtime_error(message)
    , _code(code)
{
    ;
}


ErrorCode Error::code() const
{
    return _code;
}


std::string error_code_string(ErrorCode code)
{
    static const std::map<ErrorCode, std::string> ERROR_CODE_STRING = {
        { ErrorCode::TRUNCATED_INPUT,      "truncated input"      },
        { ErrorCode::FORMAT_MISMATCH,      "format mismatch"      },
        { ErrorCode::UNSUPPORTED_PLATFORM, "unsupported platform" },
        { ErrorCode::DATABASE_UNAVAILABLE, "database unavailable" }
    };

    return enum_to_string(code, ERROR_CODE_STRING);
}

}
