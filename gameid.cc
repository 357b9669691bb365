#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "db/database.hh"
#include "error.hh"
#include "extractor.hh"
#include "gameid.hh"
#include "identify.hh"
#include "readers/file_reader.hh"
#include "readers/gzip_reader.hh"
#include "systems/directory_volume.hh"
#include "systems/platform.hh"
#include "utils/hex_bin.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"
#include "version.hh"



namespace gameid
{

using Fields = std::vector<std::pair<std::string, std::string>>;


struct Context
{
    std::optional<Platform> platform;
    Database database;
    ExtractOptions extract_options;

    std::ofstream ofs;
    std::ostream *out;
    std::string delimiter;
};


std::list<std::pair<std::string, bool>> cue_get_entries(const std::filesystem::path &cue_path)
{
    std::list<std::pair<std::string, bool>> entries;

    std::fstream fs(cue_path, std::fstream::in);
    if(!fs.is_open())
        throw_line("unable to open file ({})", cue_path.filename().string());

    std::pair<std::string, bool> entry;
    std::string line;
    while(std::getline(fs, line))
    {
        auto tokens(tokenize(line, " \t\r", "\"\""));
        if(tokens.size() == 3)
        {
            if(tokens[0] == "FILE")
                entry.first = tokens[1];
            else if(tokens[0] == "TRACK" && !entry.first.empty())
            {
                entry.second = tokens[2] != "AUDIO";
                entries.push_back(entry);
                entry.first.clear();
            }
        }
    }

    return entries;
}


std::filesystem::path resolve_image_path(const std::filesystem::path &path)
{
    if(str_uppercase(path.extension().string()) != ".CUE")
        return path;

    auto entries = cue_get_entries(path);
    if(entries.empty())
        throw_line("no FILE entries in cue sheet ({})", path.filename().string());

    auto it = std::find_if(entries.begin(), entries.end(), [](const std::pair<std::string, bool> &e) { return e.second; });
    if(it == entries.end())
        it = entries.begin();

    return path.parent_path() / it->first;
}


// image reader or mounted disc directory
struct Input
{
    std::filesystem::path path;
    std::unique_ptr<DataReader> reader;
    std::unique_ptr<Volume> volume;
    std::string name_hint;
};


static Input open_input(const Context &ctx, const std::string &file)
{
    Input input;

    std::filesystem::path path(file);
    if(std::filesystem::is_directory(path))
    {
        input.path = path;
        input.volume = std::make_unique<DirectoryVolume>(path, ctx.extract_options);
        input.name_hint = path.filename().string();
        if(input.name_hint.empty())
            input.name_hint = path.parent_path().filename().string();

        return input;
    }

    input.path = resolve_image_path(path);
    if(is_gzip_path(input.path))
    {
        input.reader = std::make_unique<GzipReader>(input.path);
        input.name_hint = input.path.stem().stem().string();
    }
    else
    {
        input.reader = std::make_unique<FileReader>(input.path);
        input.name_hint = input.path.stem().string();
    }

    return input;
}


static void write_fields(Context &ctx, const Fields &fields)
{
    for(auto const &f : fields)
        *ctx.out << f.first << ctx.delimiter << f.second << std::endl;
    *ctx.out << std::endl;
}


static void append_optional(Fields &fields, const std::string &key, const std::optional<std::string> &value)
{
    if(value)
        fields.emplace_back(key, *value);
}


static void append_attributes(Fields &fields, const std::map<std::string, std::string> &attributes)
{
    for(auto const &[key, value] : attributes)
        fields.emplace_back(key, value);
}


static Fields identifier_fields(const Identifier &identifier)
{
    Fields fields;

    fields.emplace_back("platform", platform_string(identifier.platform));
    fields.emplace_back("serial", identifier.serial);
    for(auto const &a : identifier.aliases)
        fields.emplace_back("alias", a);
    fields.emplace_back("layout", identifier.layout);
    append_optional(fields, "title", identifier.raw_title);
    append_optional(fields, "region", identifier.region_hint);
    append_optional(fields, "version", identifier.version);
    append_attributes(fields, identifier.attributes);

    return fields;
}


static Fields match_fields(const Identification &identification)
{
    Fields fields;

    auto const &match = identification.match;
    fields.emplace_back("status", match_status_string(match.status));

    if(match.status == Match::Status::FOUND)
    {
        auto const &m = *match.metadata;
        fields.emplace_back("platform", platform_string(m.platform));
        fields.emplace_back("serial", m.serial);
        fields.emplace_back("ID", m.canonical_id);
        append_optional(fields, "title", m.title);
        append_optional(fields, "developer", m.developer);
        append_optional(fields, "publisher", m.publisher);
        append_optional(fields, "rating", m.rating);
        append_optional(fields, "region", m.region);
        append_optional(fields, "release_date", m.release_date);
        append_optional(fields, "version", m.version);
        append_attributes(fields, m.attributes);
    }
    else if(match.status == Match::Status::AMBIGUOUS)
    {
        fields.emplace_back("platform", platform_string(identification.identifier.platform));
        fields.emplace_back("serial", match.serial);
        for(auto const &c : match.candidates)
            fields.emplace_back("candidate", c.id);
    }
    else
    {
        auto identifier = identifier_fields(identification.identifier);
        fields.insert(fields.end(), identifier.begin(), identifier.end());
    }

    return fields;
}


static void log_header(const Input &input, const Identifier &identifier, const ExtractOptions &options)
{
    auto header = input.volume ? extract_header(*input.volume, identifier, options) : extract_header(*input.reader, identifier, options);
    LOG("{} header ({}, {} bytes):", platform_string(identifier.platform), identifier.layout, header.size());
    LOG_F("{}", hexdump(header.data(), 0, (uint32_t)header.size()));
}


using FileHandler = void (*)(Context &, Options &, const Input &);


static void file_identify(Context &ctx, Options &options, const Input &input)
{
    IdentifyOptions identify_options;
    identify_options.extract = ctx.extract_options;
    identify_options.prefer_database = options.prefer_gamedb;
    identify_options.name_hint = input.name_hint;

    auto identification = input.volume ? identify(*input.volume, *ctx.platform, ctx.database, identify_options)
                                       : identify(*input.reader, *ctx.platform, ctx.database, identify_options);

    if(options.verbose)
        log_header(input, identification.identifier, ctx.extract_options);

    auto fields = match_fields(identification);
    fields.emplace(fields.begin(), "file", input.path.filename().string());
    write_fields(ctx, fields);
}


static void file_extract(Context &ctx, Options &options, const Input &input)
{
    auto identifier = input.volume ? extract(*input.volume, *ctx.platform, ctx.extract_options) : extract(*input.reader, *ctx.platform, ctx.extract_options);

    if(options.verbose)
        log_header(input, identifier, ctx.extract_options);

    auto fields = identifier_fields(identifier);
    fields.emplace(fields.begin(), "file", input.path.filename().string());
    write_fields(ctx, fields);
}


static void file_probe(Context &ctx, Options &, const Input &input)
{
    Fields fields;
    fields.emplace_back("file", input.path.filename().string());
    for(auto p : input.volume ? probe(*input.volume, ctx.extract_options) : probe(*input.reader, ctx.extract_options))
        fields.emplace_back("platform", platform_string(p));
    write_fields(ctx, fields);
}


static int process_files(Context &ctx, Options &options, FileHandler handler)
{
    int exit_code = 0;

    if(options.files.empty())
        throw_line("no input files");

    bool batch = options.files.size() > 1;
    for(auto const &f : options.files)
    {
        try
        {
            auto input = open_input(ctx, f);
            handler(ctx, options, input);
        }
        catch(const Error &e)
        {
            if(!batch || e.code() == ErrorCode::DATABASE_UNAVAILABLE)
                throw;

            LOG("warning: {}: {}: {}", f, error_code_string(e.code()), e.what());
            exit_code = 1;
        }
        catch(const std::runtime_error &e)
        {
            if(!batch)
                throw;

            LOG("warning: {}: {}", f, e.what());
            exit_code = 1;
        }
    }

    return exit_code;
}


int gameid_identify(Context &ctx, Options &options)
{
    return process_files(ctx, options, file_identify);
}


int gameid_extract(Context &ctx, Options &options)
{
    return process_files(ctx, options, file_extract);
}


int gameid_probe(Context &ctx, Options &options)
{
    return process_files(ctx, options, file_probe);
}


int gameid_search(Context &ctx, Options &options)
{
    if(options.search.empty())
        throw_line("search prefix is not provided (--search)");

    auto records = ctx.database.lookupPrefix(*ctx.platform, options.search);
    for(auto const &r : records)
    {
        Fields fields;
        fields.emplace_back("ID", r.id);
        fields.emplace_back("serial", r.serial);
        fields.emplace_back("title", r.title);
        if(!r.region.empty())
            fields.emplace_back("region", r.region);
        write_fields(ctx, fields);
    }

    return records.empty() ? 1 : 0;
}


int gameid_platforms(Context &ctx, Options &)
{
    for(auto p : platforms_all())
        *ctx.out << platform_string(p) << std::endl;

    return 0;
}


struct Command
{
    using Handler = int (*)(Context &, Options &);

    bool console_required;
    bool database_required;
    Handler handler;
};


const std::map<std::string, Command> COMMANDS{
    // NAME         CONSOLE DATABASE HANDLER
    { "identify",  { true, true, gameid_identify }     },
    { "extract",   { true, false, gameid_extract }     },
    { "probe",     { false, false, gameid_probe }      },
    { "search",    { true, true, gameid_search }       },
    { "platforms", { false, false, gameid_platforms }  },
};


int gameid(Options &options)
{
    if(!options.log_path.empty())
        Logger::get().reset(options.log_path);

    auto it = COMMANDS.find(options.command);
    if(it == COMMANDS.end())
        throw_line("unknown command ({})", options.command);

    auto const &command = it->second;

    Context ctx;
    ctx.out = &std::cout;
    ctx.delimiter = options.delimiter;

    if(!options.console.empty())
        ctx.platform = string_to_platform(options.console);
    else if(command.console_required)
        throw_line("console is not provided (--console)");

    if(command.database_required)
    {
        if(options.database.empty())
            throw_line("database is not provided (--database)");
        ctx.database.load(options.database);
    }

    ctx.extract_options.layout_order = tokenize(options.layout_order, ",", nullptr);
    if(options.disc_uuid)
        ctx.extract_options.uuid = *options.disc_uuid;
    if(options.disc_label)
        ctx.extract_options.volume_id = *options.disc_label;

    if(!options.output.empty())
    {
        if(std::filesystem::exists(options.output))
            throw_line("output file already exists ({})", options.output);

        ctx.ofs.open(options.output, std::ofstream::out);
        if(!ctx.ofs.is_open())
            throw_line("unable to create file ({})", options.output);
        ctx.out = &ctx.ofs;
    }

    if(options.verbose)
    {
        LOG("{}", gameid_version());
        LOG("arguments: {}", options.arguments);
        if(ctx.database.available())
            LOG("database: {} ({} records)", options.database, ctx.database.size());
        LOG("");
    }

    return command.handler(ctx, options);
}

}
