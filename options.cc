#include <algorithm>
#include <array>
#include "options.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"



namespace gameid
{

static const std::array<std::string, 5> COMMANDS = { "identify", "extract", "probe", "search", "platforms" };


Options::Options(int argc, const char *argv[])
    : help(false)
    , version(false)
    , verbose(false)
    , prefer_gamedb(false)
    , delimiter("\t")
{
    for(int i = 1; i < argc; ++i)
        arguments += str_quoted_if_space(argv[i]) + " ";
    if(!arguments.empty())
        arguments.pop_back();

    std::string *s_value = nullptr;
    for(int i = 1; i < argc; ++i)
    {
        std::string o(argv[i]);

        // option
        if(o.length() > 1 && o[0] == '-')
        {
            std::string key;
            auto value_pos = o.find("=");
            if(value_pos == std::string::npos)
            {
                key = o;
                o.clear();
            }
            else
            {
                key = std::string(o, 0, value_pos);
                o = std::string(o, value_pos + 1);
            }

            if(s_value == nullptr)
            {
                if(key == "--help" || key == "-h")
                    help = true;
                else if(key == "--version")
                    version = true;
                else if(key == "--verbose")
                    verbose = true;
                else if(key == "--console")
                    s_value = &console;
                else if(key == "--database")
                    s_value = &database;
                else if(key == "--prefer-gamedb")
                    prefer_gamedb = true;
                else if(key == "--output")
                    s_value = &output;
                else if(key == "--delimiter")
                    s_value = &delimiter;
                else if(key == "--disc-uuid")
                {
                    disc_uuid = std::make_unique<std::string>();
                    s_value = disc_uuid.get();
                }
                else if(key == "--disc-label")
                {
                    disc_label = std::make_unique<std::string>();
                    s_value = disc_label.get();
                }
                else if(key == "--layout-order")
                    s_value = &layout_order;
                else if(key == "--search")
                    s_value = &search;
                else if(key == "--log")
                    s_value = &log_path;
                // unknown option
                else
                {
                    throw_line("unknown option ({})", key);
                }
            }
            else
                throw_line("option value expected ({})", argv[i - 1]);
        }

        if(!o.empty())
        {
            if(s_value != nullptr)
            {
                *s_value = o;
                s_value = nullptr;
            }
            else
            {
                if(command.empty() && files.empty() && std::find(COMMANDS.begin(), COMMANDS.end(), o) != COMMANDS.end())
                    command = o;
                else
                    files.push_back(o);
            }
        }
    }

    if(s_value != nullptr)
        throw_line("option value expected ({})", argv[argc - 1]);

    if(command.empty())
        command = "identify";

    if(delimiter == "\\t")
        delimiter = "\t";
}


void Options::printUsage()
{
    LOGC("usage: gameid [command] [options] FILE...");
    LOGC("");

    LOGC("COMMANDS:");
    LOGC("\tidentify  \textracts the identifier and matches it against the database (default)");
    LOGC("\textract   \textracts the identifier only, no database required");
    LOGC("\tprobe     \tlists platforms whose header layouts validate against the file");
    LOGC("\tsearch    \tlists database records whose serial starts with the --search value");
    LOGC("\tplatforms \tlists supported platforms");
    LOGC("");

    LOGC("OPTIONS:");
    LOGC("\t(general)");
    LOGC("\t--help,-h             \tprint usage");
    LOGC("\t--version             \tprint version");
    LOGC("\t--verbose             \tverbose output, dumps validated header");
    LOGC("\t--log=VALUE           \tlog file");
    LOGC("");
    LOGC("\t(identification)");
    LOGC("\t--console=VALUE       \tplatform of the input files, see platforms command");
    LOGC("\t--database=VALUE      \tGameDB data directory or <Console>.data.tsv table");
    LOGC("\t--prefer-gamedb       \tdatabase values take precedence over on-disk values");
    LOGC("\t--disc-uuid=VALUE     \toverride disc volume creation UUID");
    LOGC("\t--disc-label=VALUE    \toverride disc volume identifier");
    LOGC("\t--layout-order=VALUE  \tcomma separated header layout priority, e.g. HiROM,LoROM");
    LOGC("\t--search=VALUE        \tserial prefix for search command");
    LOGC("");
    LOGC("\t(output)");
    LOGC("\t--output=VALUE        \toutput file, stdout if not provided, never overwritten");
    LOGC("\t--delimiter=VALUE     \tkey / value delimiter (default: \\t)");
}

}
