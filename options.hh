#pragma once



#include <memory>
#include <string>
#include <vector>



namespace gameid
{

struct Options
{
    std::string command;
    std::string arguments;
    std::vector<std::string> files;

    bool help;
    bool version;
    bool verbose;

    std::string console;
    std::string database;
    bool prefer_gamedb;
    std::string output;
    std::string delimiter;
    std::unique_ptr<std::string> disc_uuid;
    std::unique_ptr<std::string> disc_label;
    std::string layout_order;
    std::string search;
    std::string log_path;


    Options(int argc, const char *argv[]);

    void printUsage();
};

}
