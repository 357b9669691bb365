#pragma once



#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>



namespace gameid
{

class Logger
{
public:
    static Logger &get();

    template<typename... Args>
    void log(bool file, const std::string &fmt, const Args &...args)
    {
        auto message = fmt::vformat(fmt, fmt::make_format_args(args...));

        std::cout << message;

        if(file && _fs.is_open())
            _fs << message;
    }

    bool reset(std::filesystem::path log_path);

    void NL(bool file = true);
    void flush(bool file);

private:
    static Logger _logger;

    std::filesystem::path _log_path;
    std::fstream _fs;
};


// log message followed by a new line (console & file)
template<typename... Args>
void LOG(const std::string &fmt, const Args &...args)
{
    auto &logger = Logger::get();
    logger.log(true, fmt, args...);
    logger.NL(true);
}


// log message and flush, no new line (console & file)
template<typename... Args>
void LOG_F(const std::string &fmt, const Args &...args)
{
    auto &logger = Logger::get();
    logger.log(true, fmt, args...);
    logger.flush(true);
}


// log message followed by a new line (console only)
template<typename... Args>
void LOGC(const std::string &fmt, const Args &...args)
{
    auto &logger = Logger::get();
    logger.log(false, fmt, args...);
    logger.NL(false);
}


}
