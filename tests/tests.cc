#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <zlib.h>
#include "db/database.hh"
#include "db/gamedb.hh"
#include "error.hh"
#include "extractor.hh"
#include "gameid.hh"
#include "identify.hh"
#include "image_builder.hh"
#include "readers/gzip_reader.hh"
#include "readers/memory_reader.hh"
#include "readers/sector_reader.hh"
#include "reconciler.hh"
#include "systems/directory_volume.hh"
#include "systems/platform.hh"
#include "systems/serial.hh"
#include "utils/hex_bin.hh"
#include "utils/strings.hh"



using namespace gameid;
using namespace gameid::test;



namespace
{

std::optional<ErrorCode> error_code_of(const std::function<void()> &f)
{
    try
    {
        f();
    }
    catch(const Error &e)
    {
        return e.code();
    }

    return std::nullopt;
}


std::string error_string(const std::optional<ErrorCode> &code)
{
    return code ? error_code_string(*code) : "none";
}


// prints "success" or the failure reason, returns the check result
bool report(bool ok, const std::string &failure)
{
    if(ok)
        std::cout << "success";
    else
        std::cout << "failure, " << failure;
    std::cout << std::endl;

    return ok;
}


bool check_serial(const std::string &name, const std::vector<uint8_t> &image, Platform platform, const std::string &expected, const ExtractOptions &options = ExtractOptions())
{
    std::cout << fmt::format("extract {} ({}) -> {}... ", name, platform_string(platform), expected) << std::flush;

    MemoryReader reader(image);
    try
    {
        auto identifier = extract(reader, platform, options);
        return report(identifier.serial == expected, fmt::format("serial: {}", identifier.serial));
    }
    catch(const std::exception &e)
    {
        return report(false, e.what());
    }
}


bool check_error(const std::string &name, const std::vector<uint8_t> &image, Platform platform, ErrorCode expected, const ExtractOptions &options = ExtractOptions())
{
    std::cout << fmt::format("extract {} ({}) -> {}... ", name, platform_string(platform), error_code_string(expected)) << std::flush;

    MemoryReader reader(image);
    auto code = error_code_of([&]() { extract(reader, platform, options); });

    return report(code == expected, fmt::format("error: {}", error_string(code)));
}


Identifier extract_image(const std::vector<uint8_t> &image, Platform platform, const ExtractOptions &options = ExtractOptions())
{
    MemoryReader reader(image);
    return extract(reader, platform, options);
}


std::string attribute(const Identifier &identifier, const std::string &name)
{
    auto it = identifier.attributes.find(name);
    return it == identifier.attributes.end() ? "<missing>" : it->second;
}


Record make_record(Platform platform, const std::string &id, const std::string &title, const std::string &region)
{
    Record record;
    record.platform = platform;
    record.id = id;
    record.title = title;
    record.region = region;

    return record;
}


void write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream fs(path, std::ofstream::binary);
    fs.write((const char *)data.data(), data.size());
}


void write_gzip(const std::filesystem::path &path, const std::vector<uint8_t> &data)
{
    auto gz = gzopen(path.string().c_str(), "wb");
    gzwrite(gz, data.data(), (unsigned)data.size());
    gzclose(gz);
}


std::vector<uint8_t> read_file(const std::filesystem::path &path)
{
    std::ifstream fs(path, std::ifstream::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(fs), std::istreambuf_iterator<char>());
}


std::vector<uint8_t> psx_image(bool raw)
{
    IsoBuilder iso("SLUS_00594", "PLAYSTATION");
    iso.addFile("SYSTEM.CNF", text_data("BOOT = cdrom:\\SLUS_005.94;1\r\nTCB = 4\r\nEVENT = 10\r\nSTACK = 801FFFF0\r\n"));
    iso.addFile("SLUS_005.94", text_data(std::string("PS-X EXE") + std::string(0x800 - 8, '\0')));

    return iso.build(raw);
}

}


bool test_normalize_serial()
{
    bool success = true;

    struct Case
    {
        std::string serial;
        SerialStyle style;
        std::string expected;
    };

    std::vector<Case> cases = {
        { "SLUS_005.94",          SerialStyle::PREFIXED, "SLUS-00594"        },
        { "slus-00594",           SerialStyle::PREFIXED, "SLUS-00594"        },
        { "SLUS 005 94",          SerialStyle::PREFIXED, "SLUS-00594"        },
        { "ULUS-10041",           SerialStyle::PREFIXED, "ULUS-10041"        },
        { "94423",                SerialStyle::PREFIXED, "94423"             },
        { "SCES",                 SerialStyle::PREFIXED, "SCES"              },
        { "MK-1079",              SerialStyle::COMPACT,  "MK1079"            },
        { "T-12705H",             SerialStyle::COMPACT,  "T12705H"           },
        { "Tetris#1234",          SerialStyle::COMPACT,  "TETRIS#1234"       },
        { std::string("AB\0\xFF", 4) + "CD", SerialStyle::COMPACT, "ABCD"    },
        { "",                     SerialStyle::COMPACT,  ""                  }
    };

    for(auto const &c : cases)
    {
        auto normalized = normalize_serial(c.serial, c.style);
        std::cout << fmt::format("normalize_serial({}) -> {}... ", replace_nonprint(c.serial, '?'), c.expected) << std::flush;
        success &= report(normalized == c.expected, fmt::format("result: {}", normalized));

        std::cout << fmt::format("normalize_serial({}) is idempotent... ", c.expected) << std::flush;
        success &= report(normalize_serial(normalized, c.style) == normalized, normalize_serial(normalized, c.style));
    }

    return success;
}


bool test_platform()
{
    bool success = true;

    std::vector<std::pair<std::string, Platform>> cases = {
        { "GB",        Platform::GB       },
        { "GB/GBC",    Platform::GB       },
        { "gbc",       Platform::GBC      },
        { "Genesis",   Platform::GENESIS  },
        { "MegaDrive", Platform::GENESIS  },
        { "SegaCD",    Platform::SEGACD   },
        { "MCD",       Platform::SEGACD   },
        { "ss",        Platform::SATURN   },
        { "NGCD",      Platform::NEOGEOCD },
        { "PS1",       Platform::PSX      }
    };

    for(auto const &c : cases)
    {
        std::cout << fmt::format("string_to_platform({}) -> {}... ", c.first, platform_string(c.second)) << std::flush;
        try
        {
            auto p = string_to_platform(c.first);
            success &= report(p == c.second, fmt::format("result: {}", platform_string(p)));
        }
        catch(const std::exception &e)
        {
            success &= report(false, e.what());
        }
    }

    std::cout << "string_to_platform(Dreamcast) -> unsupported platform... " << std::flush;
    auto code = error_code_of([]() { string_to_platform("Dreamcast"); });
    success &= report(code == ErrorCode::UNSUPPORTED_PLATFORM, error_string(code));

    std::cout << "platform_index_family(GBC) -> GB... " << std::flush;
    success &= report(platform_index_family(Platform::GBC) == Platform::GB, platform_string(platform_index_family(Platform::GBC)));

    return success;
}


bool test_sector_reader()
{
    bool success = true;

    IsoBuilder iso("VOLUME");
    iso.addFile("FILE.BIN", std::vector<uint8_t>(10, 0xAA));
    auto cooked = iso.build(false);
    auto raw = iso.build(true);

    MemoryReader cooked_reader(cooked);
    MemoryReader raw_reader(raw);
    SectorReader cooked_sectors(cooked_reader);
    SectorReader raw_sectors(raw_reader);

    std::cout << "sector reader detects cooked and raw images... " << std::flush;
    success &= report(!cooked_sectors.raw() && raw_sectors.raw() && cooked_sectors.sectorsCount() == raw_sectors.sectorsCount(),
        fmt::format("cooked: {}, raw: {}", cooked_sectors.sectorsCount(), raw_sectors.sectorsCount()));

    std::cout << "sector reader user data matches... " << std::flush;
    success &= report(cooked_sectors.readVector(16, 2) == raw_sectors.readVector(16, 2), "user data differs");

    std::cout << "sector reader past the end -> truncated input... " << std::flush;
    auto code = error_code_of([&]() { raw_sectors.readVector(raw_sectors.sectorsCount() - 1, 2); });
    success &= report(code == ErrorCode::TRUNCATED_INPUT, error_string(code));

    auto broken = raw;
    broken[16 * 2352 + 1] = 0x00;
    MemoryReader broken_reader(broken);
    SectorReader broken_sectors(broken_reader);
    std::cout << "sector reader broken sync -> format mismatch... " << std::flush;
    code = error_code_of([&]() { broken_sectors.readVector(16, 1); });
    success &= report(code == ErrorCode::FORMAT_MISMATCH, error_string(code));

    std::cout << "data reader past the end -> truncated input... " << std::flush;
    code = error_code_of([&]() { cooked_reader.readVector(cooked_reader.size() - 4, 8); });
    success &= report(code == ErrorCode::TRUNCATED_INPUT, error_string(code));

    return success;
}


bool test_gb()
{
    bool success = true;

    auto gb = build_gb("TETRIS", 0x00, 0x16BF, 0x00);
    auto gbc = build_gb("POKEMON SILVER", 0x80, 0x2D68, 0x01);
    auto gbc_only = build_gb("ZELDA", 0xC0, 0xABCD, 0x01);

    success &= check_serial("GB", gb, Platform::GB, "TETRIS#16BF");
    success &= check_serial("GBC compatible", gbc, Platform::GBC, "POKEMONSILVER#2D68");
    success &= check_serial("GBC compatible", gbc, Platform::GB, "POKEMONSILVER#2D68");
    success &= check_serial("GBC only", gbc_only, Platform::GBC, "ZELDA#ABCD");
    success &= check_error("GBC only", gbc_only, Platform::GB, ErrorCode::FORMAT_MISMATCH);
    success &= check_error("GB", gb, Platform::GBC, ErrorCode::FORMAT_MISMATCH);

    auto corrupted = gb;
    corrupted[0x14D] ^= 0xFF;
    success &= check_error("corrupted header checksum", corrupted, Platform::GB, ErrorCode::FORMAT_MISMATCH);

    success &= check_error("truncated", std::vector<uint8_t>(gb.begin(), gb.begin() + 0x120), Platform::GB, ErrorCode::TRUNCATED_INPUT);

    auto identifier = extract_image(gb, Platform::GB);
    std::cout << "GB title, region and attributes... " << std::flush;
    success &= report(identifier.raw_title == "TETRIS" && identifier.region_hint == "Japan" && attribute(identifier, "cgb_mode") == "GB" && attribute(identifier, "sgb_support") == "no",
        fmt::format("title: {}, region: {}, cgb_mode: {}", identifier.raw_title.value_or(""), identifier.region_hint.value_or(""), attribute(identifier, "cgb_mode")));

    identifier = extract_image(gbc, Platform::GBC);
    std::cout << "GBC international cart has no region hint... " << std::flush;
    success &= report(!identifier.region_hint, identifier.region_hint.value_or(""));

    auto mbc5 = gb;
    mbc5[0x147] = 0x1B;
    mbc5[0x148] = 0x05;
    mbc5[0x149] = 0x03;
    put_string(mbc5, 0x144, "01");
    mbc5[0x14B] = 0x33;
    update_gb_header_checksum(mbc5);

    auto unknown = gb;
    unknown[0x147] = 0x60;
    unknown[0x148] = 0x30;
    unknown[0x149] = 0x09;
    put_string(unknown, 0x144, "ZZ");
    unknown[0x14B] = 0x33;
    update_gb_header_checksum(unknown);

    auto old_licensee = gb;
    old_licensee[0x14B] = 0xB4;
    update_gb_header_checksum(old_licensee);

    struct DecodedField
    {
        std::string image;
        const std::vector<uint8_t> &data;
        std::string field;
        std::string expected;
    };
    std::vector<DecodedField> decoded =
    {
        { "GB",           gb,           "cartridge_type",         "MBC1"                 },
        { "GB",           gb,           "rom_size",               "32768"                },
        { "GB",           gb,           "rom_banks",              "2"                    },
        { "GB",           gb,           "ram_size",               "0"                    },
        { "GB",           gb,           "ram_banks",              "0"                    },
        { "GB",           gb,           "licensee",               "Nintendo"             },
        { "GB",           gb,           "header_checksum_actual", "0x0A"                 },
        { "GB",           gb,           "global_checksum_actual", "0x01E7"               },
        { "MBC5",         mbc5,         "cartridge_type",         "MBC5 + RAM + Battery" },
        { "MBC5",         mbc5,         "rom_size",               "1048576"              },
        { "MBC5",         mbc5,         "rom_banks",              "64"                   },
        { "MBC5",         mbc5,         "ram_size",               "32768"                },
        { "MBC5",         mbc5,         "ram_banks",              "4"                    },
        { "MBC5",         mbc5,         "licensee",               "Nintendo R&D1"        },
        { "unknown",      unknown,      "cartridge_type",         "Unknown"              },
        { "unknown",      unknown,      "rom_size",               "Unknown"              },
        { "unknown",      unknown,      "ram_banks",              "Unknown"              },
        { "unknown",      unknown,      "licensee",               "Unknown"              },
        { "old licensee", old_licensee, "licensee",               "Square Enix"          }
    };
    for(auto const &d : decoded)
    {
        std::cout << fmt::format("GB {} {} -> {}... ", d.image, d.field, d.expected) << std::flush;
        auto decoded_identifier = extract_image(d.data, Platform::GB);
        success &= report(attribute(decoded_identifier, d.field) == d.expected, attribute(decoded_identifier, d.field));
    }

    return success;
}


bool test_gba()
{
    bool success = true;

    auto gba = build_gba("POKEMON RUBY", "AXVE");
    success &= check_serial("GBA", gba, Platform::GBA, "AXVE");

    auto identifier = extract_image(gba, Platform::GBA);
    std::cout << "GBA title and region... " << std::flush;
    success &= report(identifier.raw_title == "POKEMON RUBY" && identifier.region_hint == "USA", fmt::format("title: {}, region: {}", identifier.raw_title.value_or(""), identifier.region_hint.value_or("")));

    auto corrupted = gba;
    corrupted[0xAC] = 'B';
    success &= check_error("bad complement", corrupted, Platform::GBA, ErrorCode::FORMAT_MISMATCH);

    success &= check_error("truncated", std::vector<uint8_t>(gba.begin(), gba.begin() + 0x80), Platform::GBA, ErrorCode::TRUNCATED_INPUT);

    return success;
}


bool test_snes()
{
    bool success = true;

    const std::string title = "SUPER MARIO WORLD";
    auto lorom = build_snes(0x7FC0, 0x8000, title, 0x01, 0x01, 0x00, 0xA0DA);

    std::string padded_title(title);
    padded_title.resize(21, ' ');
    auto expected = fmt::format("01#{}#00#A0DA", bin2hex((const uint8_t *)padded_title.data(), (uint32_t)padded_title.size()));

    success &= check_serial("LoROM", lorom, Platform::SNES, expected);

    auto hirom = build_snes(0xFFC0, 0x10000, title, 0x01, 0x01, 0x00, 0xA0DA);
    success &= check_serial("HiROM", hirom, Platform::SNES, expected);

    std::vector<uint8_t> headered(512, 0x00);
    headered.insert(headered.end(), lorom.begin(), lorom.end());
    success &= check_serial("copier header", headered, Platform::SNES, expected);

    auto identifier = extract_image(headered, Platform::SNES);
    std::cout << "SNES copier header attribute, layout and region... " << std::flush;
    success &= report(attribute(identifier, "copier_header") == "yes" && identifier.layout == "LoROM" && identifier.region_hint == "USA" && attribute(identifier, "rom_type") == "LoROM",
        fmt::format("copier_header: {}, layout: {}, region: {}", attribute(identifier, "copier_header"), identifier.layout, identifier.region_hint.value_or("")));

    ExtractOptions hirom_only;
    hirom_only.layout_order = { "HiROM" };
    success &= check_error("LoROM with HiROM only priority", lorom, Platform::SNES, ErrorCode::TRUNCATED_INPUT, hirom_only);

    ExtractOptions hirom_first;
    hirom_first.layout_order = { "HiROM", "LoROM" };
    success &= check_serial("LoROM with HiROM first priority", lorom, Platform::SNES, expected, hirom_first);

    std::cout << "SNES unknown layout name throws... " << std::flush;
    ExtractOptions unknown;
    unknown.layout_order = { "MidROM" };
    bool thrown = false;
    try
    {
        extract_image(lorom, Platform::SNES, unknown);
    }
    catch(const std::runtime_error &)
    {
        thrown = true;
    }
    success &= report(thrown, "no exception");

    auto broken = lorom;
    broken[0x7FC0 + 30] ^= 0x01;
    success &= check_error("bad checksum complement", broken, Platform::SNES, ErrorCode::FORMAT_MISMATCH);

    // header byte 22 is the cartridge type, 24 the RAM size, $FFBF the expansion chip
    auto sa1 = lorom;
    sa1[0x7FC0 + 22] = 0x35;
    sa1[0x7FC0 + 24] = 0x05;
    auto cx4 = lorom;
    cx4[0x7FC0 + 22] = 0xF5;
    cx4[0x7FBF] = 0x03;
    auto dsp = lorom;
    dsp[0x7FC0 + 22] = 0x03;
    auto reserved = lorom;
    reserved[0x7FC0 + 22] = 0x07;

    std::vector<std::tuple<std::string, std::vector<uint8_t>, std::string, std::string>> decoded =
    {
        { "ROM",      lorom,    "rom_size", "524288"                                  },
        { "ROM",      lorom,    "ram_size", "0"                                       },
        { "ROM",      lorom,    "hardware", "ROM"                                     },
        { "SA-1",     sa1,      "ram_size", "32768"                                   },
        { "SA-1",     sa1,      "hardware", "ROM + Coprocessor (SA-1) + RAM + Battery" },
        { "CX4",      cx4,      "hardware", "ROM + Coprocessor (CX4) + RAM + Battery"  },
        { "DSP",      dsp,      "hardware", "ROM + Coprocessor (DSP)"                 },
        { "reserved", reserved, "hardware", "<missing>"                               }
    };
    for(auto const &[name, image, field, expected] : decoded)
    {
        std::cout << fmt::format("SNES {} {} -> {}... ", name, field, expected) << std::flush;
        auto decoded_identifier = extract_image(image, Platform::SNES);
        success &= report(attribute(decoded_identifier, field) == expected, attribute(decoded_identifier, field));
    }

    return success;
}


bool test_n64()
{
    bool success = true;

    auto z64 = build_n64("SUPER MARIO 64", "SM", 'E');

    success &= check_serial("z64", z64, Platform::N64, "SME");
    success &= check_serial("v64", swap_words(z64, 2), Platform::N64, "SME");
    success &= check_serial("n64", swap_words(z64, 4), Platform::N64, "SME");

    auto identifier = extract_image(swap_words(z64, 2), Platform::N64);
    std::cout << "N64 byte swapped layout, title and region... " << std::flush;
    success &= report(identifier.layout == "v64" && identifier.raw_title == "SUPER MARIO 64" && identifier.region_hint == "USA",
        fmt::format("layout: {}, title: {}, region: {}", identifier.layout, identifier.raw_title.value_or(""), identifier.region_hint.value_or("")));

    auto broken = z64;
    broken[0] = 0x00;
    success &= check_error("bad first word", broken, Platform::N64, ErrorCode::FORMAT_MISMATCH);

    return success;
}


bool test_genesis()
{
    bool success = true;

    auto md = build_genesis("SEGA GENESIS", "GM MK-1079 -00", "JUE", "SONIC THE HEDGEHOG");
    success &= check_serial("Genesis", md, Platform::GENESIS, "MK1079");

    auto identifier = extract_image(md, Platform::GENESIS);
    std::cout << "Genesis alias, region, attributes... " << std::flush;
    bool ok = identifier.aliases == std::vector<std::string>{ "MK107900" } && identifier.region_hint == "Europe, Japan, USA" && identifier.version == "00" &&
        attribute(identifier, "software_type") == "Game" && attribute(identifier, "release_month") == "April" && attribute(identifier, "device_support") == "3-button Controller";
    success &= report(ok, fmt::format("region: {}, version: {}, software_type: {}", identifier.region_hint.value_or(""), identifier.version.value_or(""), attribute(identifier, "software_type")));

    auto unknown = build_genesis("SEGA SATURN", "GM MK-1079 -00", "JUE", "SONIC THE HEDGEHOG");
    success &= check_error("unknown system type", unknown, Platform::GENESIS, ErrorCode::FORMAT_MISMATCH);

    // cross platform misapplication fails closed
    std::vector<uint8_t> padded(md);
    padded.resize(0x8000);
    success &= check_error("Genesis", padded, Platform::SNES, ErrorCode::FORMAT_MISMATCH);
    success &= check_error("Genesis", padded, Platform::GBA, ErrorCode::FORMAT_MISMATCH);
    success &= check_error("Genesis", padded, Platform::GB, ErrorCode::FORMAT_MISMATCH);

    return success;
}


bool test_gc()
{
    bool success = true;

    auto gc = build_gc("GALE", "Super Smash Bros Melee");
    success &= check_serial("GC", gc, Platform::GC, "GALE");

    auto identifier = extract_image(gc, Platform::GC);
    std::cout << "GC title and region... " << std::flush;
    success &= report(identifier.raw_title == "Super Smash Bros Melee" && identifier.region_hint == "USA", fmt::format("title: {}, region: {}", identifier.raw_title.value_or(""), identifier.region_hint.value_or("")));

    std::vector<std::pair<std::string, std::string>> fields =
    {
        {"magic",                  "0xC2339F3D"},
        {"dol_offset",             "0x0001E800"},
        {"fst_offset",             "0x00456E00"},
        {"fst_size",               "31269"     },
        {"max_fst_size",           "31269"     },
        {"apploader_date",         "2001-11-19"},
        {"apploader_entry_point",  "0x81200258"},
        {"apploader_code_size",    "6728"      },
        {"apploader_trailer_size", "6048"      }
    };
    for(auto const &f : fields)
    {
        std::cout << fmt::format("GC {} -> {}... ", f.first, f.second) << std::flush;
        success &= report(attribute(identifier, f.first) == f.second, attribute(identifier, f.first));
    }

    auto broken = gc;
    broken[0x1C] = 0x00;
    success &= check_error("bad magic", broken, Platform::GC, ErrorCode::FORMAT_MISMATCH);

    // magic is stored big endian
    auto reversed = gc;
    std::reverse(reversed.begin() + 0x1C, reversed.begin() + 0x20);
    success &= check_error("byte reversed magic", reversed, Platform::GC, ErrorCode::FORMAT_MISMATCH);
    success &= check_error("empty image", std::vector<uint8_t>(0x100), Platform::GC, ErrorCode::TRUNCATED_INPUT);

    return success;
}


bool test_psx()
{
    bool success = true;

    success &= check_serial("PSX cooked", psx_image(false), Platform::PSX, "SLUS-00594");
    success &= check_serial("PSX raw", psx_image(true), Platform::PSX, "SLUS-00594");

    auto identifier = extract_image(psx_image(true), Platform::PSX);
    std::cout << "PSX region and disc attributes... " << std::flush;
    success &= report(identifier.region_hint == "USA" && attribute(identifier, "volume_id") == "SLUS_00594" && attribute(identifier, "system_id") == "PLAYSTATION" && attribute(identifier, "boot_file") == "SLUS_005.94",
        fmt::format("region: {}, volume_id: {}, boot_file: {}", identifier.region_hint.value_or(""), attribute(identifier, "volume_id"), attribute(identifier, "boot_file")));

    IsoBuilder psx_exe("MY_DISC");
    psx_exe.addFile("PSX.EXE", text_data(std::string("PS-X EXE") + std::string(8, '\0')));
    success &= check_serial("PSX.EXE fallback", psx_exe.build(), Platform::PSX, "MYDISC");

    IsoBuilder no_exe("DATA");
    no_exe.addFile("README.TXT", text_data("hello"));
    success &= check_error("no boot executable", no_exe.build(), Platform::PSX, ErrorCode::FORMAT_MISMATCH);

    IsoBuilder bad_magic("SLUS_00594");
    bad_magic.addFile("SYSTEM.CNF", text_data("BOOT = cdrom:\\SLUS_005.94;1\r\n"));
    bad_magic.addFile("SLUS_005.94", text_data("NOT AN EXE"));
    success &= check_error("bad executable magic", bad_magic.build(), Platform::PSX, ErrorCode::FORMAT_MISMATCH);

    // cross platform misapplication fails closed
    success &= check_error("PSX", psx_image(false), Platform::PS2, ErrorCode::FORMAT_MISMATCH);
    success &= check_error("PSX", psx_image(false), Platform::PSP, ErrorCode::FORMAT_MISMATCH);
    success &= check_error("PSX", psx_image(false), Platform::SATURN, ErrorCode::FORMAT_MISMATCH);

    success &= check_error("cartridge", build_gb("TETRIS", 0x00, 0x16BF, 0x00), Platform::PSX, ErrorCode::TRUNCATED_INPUT);

    return success;
}


bool test_ps2()
{
    bool success = true;

    IsoBuilder iso("SLES_12345");
    iso.addFile("SYSTEM.CNF", text_data("BOOT2 = cdrom0:\\SLES_123.45;1\r\nVER = 1.01\r\nVMODE = PAL\r\n"));
    iso.addFile("SLES_123.45", std::vector<uint8_t>{ 0x7F, 'E', 'L', 'F', 1, 1, 1, 0 });

    success &= check_serial("PS2", iso.build(), Platform::PS2, "SLES-12345");

    auto identifier = extract_image(iso.build(), Platform::PS2);
    std::cout << "PS2 version and region... " << std::flush;
    success &= report(identifier.version == "1.01" && identifier.region_hint == "Europe", fmt::format("version: {}, region: {}", identifier.version.value_or(""), identifier.region_hint.value_or("")));

    IsoBuilder five_letter("SLUSP_12345");
    five_letter.addFile("SYSTEM.CNF", text_data("BOOT2 = cdrom0:\\SLUSP_123.45;1\r\n"));
    five_letter.addFile("SLUSP_123.45", std::vector<uint8_t>{ 0x7F, 'E', 'L', 'F' });
    identifier = extract_image(five_letter.build(), Platform::PS2);
    std::cout << "PS2 five letter prefix alias... " << std::flush;
    success &= report(identifier.serial == "SLUSP-12345" && !identifier.aliases.empty() && identifier.aliases.front() == "SLUS-12345",
        fmt::format("serial: {}, aliases: {}", identifier.serial, identifier.aliases.size()));

    return success;
}


bool test_psp()
{
    bool success = true;

    IsoBuilder iso("UMD VIDEO");
    iso.addFile("UMD_DATA.BIN", text_data("ULUS-10041|0001|0001|G"));
    iso.addFile("PSP_GAME/PARAM.SFO", build_sfo({ { "TITLE", "Grand Theft Auto" }, { "DISC_VERSION", "1.02" }, { "CATEGORY", "UG" } }));

    success &= check_serial("PSP", iso.build(), Platform::PSP, "ULUS-10041");

    auto identifier = extract_image(iso.build(), Platform::PSP);
    std::cout << "PSP PARAM.SFO title, version and region... " << std::flush;
    success &= report(identifier.raw_title == "Grand Theft Auto" && identifier.version == "1.02" && identifier.region_hint == "USA",
        fmt::format("title: {}, version: {}, region: {}", identifier.raw_title.value_or(""), identifier.version.value_or(""), identifier.region_hint.value_or("")));

    IsoBuilder broken("UMD VIDEO");
    broken.addFile("UMD_DATA.BIN", text_data("ULUS-100410001|0001|G"));
    success &= check_error("missing terminator", broken.build(), Platform::PSP, ErrorCode::FORMAT_MISMATCH);

    return success;
}


bool test_saturn()
{
    bool success = true;

    auto system_area = build_saturn_system_area("T-12705H  V1.000", "19960322", "JU", "BIOHAZARD");
    success &= check_serial("Saturn system area", system_area, Platform::SATURN, "T12705H");

    IsoBuilder iso("BIOHAZARD");
    iso.setSystemArea(system_area);
    iso.addFile("0.BIN", std::vector<uint8_t>(16));
    success &= check_serial("Saturn raw", iso.build(true), Platform::SATURN, "T12705H");

    auto identifier = extract_image(iso.build(true), Platform::SATURN);
    std::cout << "Saturn version, build date, region and volume... " << std::flush;
    success &= report(identifier.version == "1.000" && attribute(identifier, "build_date") == "1996-03-22" && identifier.region_hint == "Japan, USA" && attribute(identifier, "volume_id") == "BIOHAZARD",
        fmt::format("version: {}, build_date: {}, region: {}", identifier.version.value_or(""), attribute(identifier, "build_date"), identifier.region_hint.value_or("")));

    auto segacd = build_segacd_system_area("GM MK-4407 -00", "U", "SONIC CD");
    success &= check_error("SegaCD", segacd, Platform::SATURN, ErrorCode::FORMAT_MISMATCH);

    // root directory record extent (PVD offset 156 + 2) far outside of the image
    auto damaged = iso.build();
    put_u32le(damaged, 16 * 2048 + 156 + 2, 0x00FFFFFF);
    put_u32be(damaged, 16 * 2048 + 156 + 6, 0x00FFFFFF);
    success &= check_serial("Saturn damaged root directory", damaged, Platform::SATURN, "T12705H");

    identifier = extract_image(damaged, Platform::SATURN);
    std::cout << "Saturn damaged root directory keeps volume attributes... " << std::flush;
    success &= report(attribute(identifier, "volume_id") == "BIOHAZARD" && attribute(identifier, "root_files") == "<missing>",
        fmt::format("volume_id: {}, root_files: {}", attribute(identifier, "volume_id"), attribute(identifier, "root_files")));

    return success;
}


bool test_segacd()
{
    bool success = true;

    auto system_area = build_segacd_system_area("GM MK-4407 -00", "U", "SONIC CD");
    success &= check_serial("SegaCD", system_area, Platform::SEGACD, "MK440700");

    auto identifier = extract_image(system_area, Platform::SEGACD);
    std::cout << "SegaCD title, region and build date... " << std::flush;
    success &= report(identifier.raw_title == "SONIC CD" && identifier.region_hint == "USA" && attribute(identifier, "build_date") == "1993-10",
        fmt::format("title: {}, region: {}, build_date: {}", identifier.raw_title.value_or(""), identifier.region_hint.value_or(""), attribute(identifier, "build_date")));

    auto serial_checksum = system_area;
    put_padded(serial_checksum, 0x180, "GM T-93185", 14);
    put_u16le(serial_checksum, 0x18E, 1);
    success &= check_serial("SegaCD serial checksum quirk", serial_checksum, Platform::SEGACD, "T93185");

    auto saturn = build_saturn_system_area("T-12705H  V1.000", "19960322", "JU", "BIOHAZARD");
    success &= check_error("Saturn", saturn, Platform::SEGACD, ErrorCode::FORMAT_MISMATCH);

    // the IP embeds a Mega Drive header behind the disc magic
    success &= check_error("SegaCD system area", system_area, Platform::GENESIS, ErrorCode::FORMAT_MISMATCH);
    IsoBuilder iso("SONICCD");
    iso.setSystemArea(system_area);
    iso.addFile("ABS.TXT", text_data("SONIC CD\r\n"));
    success &= check_error("SegaCD image", iso.build(), Platform::GENESIS, ErrorCode::FORMAT_MISMATCH);
    success &= check_serial("SegaCD image", iso.build(), Platform::SEGACD, "MK440700");

    return success;
}


bool test_neogeocd()
{
    bool success = true;

    IsoBuilder iso("NGCD_TEST");
    iso.setCreationDate("1996010112000000");
    iso.addFile("IPL.TXT", text_data("PROG.PRG,0,0\r\nFIX.FIX,0,0\r\n"));

    success &= check_serial("NeoGeoCD", iso.build(), Platform::NEOGEOCD, "1996010112000000#NGCDTEST");

    auto identifier = extract_image(iso.build(), Platform::NEOGEOCD);
    std::cout << "NeoGeoCD uuid attribute and volume alias... " << std::flush;
    success &= report(attribute(identifier, "uuid") == "1996-01-01-12-00-00-00" && identifier.aliases == std::vector<std::string>{ "NGCDTEST" },
        fmt::format("uuid: {}, aliases: {}", attribute(identifier, "uuid"), identifier.aliases.size()));

    ExtractOptions overrides;
    overrides.volume_id = "OTHER";
    overrides.uuid = "";
    success &= check_serial("NeoGeoCD with overrides", iso.build(), Platform::NEOGEOCD, "OTHER", overrides);

    IsoBuilder broken("NGCD_TEST");
    broken.addFile("IPL.TXT", text_data("just some text\r\n"));
    success &= check_error("bad IPL.TXT", broken.build(), Platform::NEOGEOCD, ErrorCode::FORMAT_MISMATCH);

    return success;
}


bool test_probe()
{
    bool success = true;

    std::vector<std::pair<std::vector<uint8_t>, std::vector<Platform>>> cases = {
        { build_gb("TETRIS", 0x00, 0x16BF, 0x00),                                { Platform::GB }             },
        { build_gb("ZELDA", 0xC0, 0xABCD, 0x01),                                 { Platform::GBC }            },
        { build_gba("POKEMON RUBY", "AXVE"),                                     { Platform::GBA }            },
        { psx_image(false),                                                      { Platform::PSX }            },
        { build_genesis("SEGA MEGA DRIVE", "GM MK-1079 -00", "J", "SONIC"),     { Platform::GENESIS }        },
        { build_segacd_system_area("GM MK-4407 -00", "U", "SONIC CD"),           { Platform::SEGACD }         }
    };

    for(auto const &c : cases)
    {
        std::string expected;
        for(auto p : c.second)
            expected += (expected.empty() ? "" : ", ") + platform_string(p);
        std::cout << fmt::format("probe -> {}... ", expected) << std::flush;

        MemoryReader reader(c.first);
        try
        {
            auto platforms = probe(reader);

            std::string found;
            for(auto p : platforms)
                found += (found.empty() ? "" : ", ") + platform_string(p);
            success &= report(platforms == c.second, fmt::format("result: {}", found));
        }
        catch(const std::exception &e)
        {
            success &= report(false, e.what());
        }
    }

    return success;
}


bool test_reconcile()
{
    bool success = true;

    Identifier identifier;
    identifier.platform = Platform::GENESIS;
    identifier.serial = "MK1079";
    identifier.raw_title = "SONIC THE HEDGEHOG";
    identifier.region_hint = "Europe";
    identifier.attributes["publisher"] = "SEGA";

    std::cout << "reconcile no candidates -> not found... " << std::flush;
    auto match = reconcile(identifier, {}, false);
    success &= report(match.status == Match::Status::NOT_FOUND && match.serial == "MK1079" && !match.metadata, match_status_string(match.status));

    auto record = make_record(Platform::GENESIS, "MK-1079", "Sonic the Hedgehog", "Europe");
    record.developer = "Sonic Team";
    record.publisher = "Sega";
    record.attributes["publisher"] = "Sega Enterprises";

    std::cout << "reconcile on-disk values win... " << std::flush;
    match = reconcile(identifier, { record }, false);
    success &= report(match.status == Match::Status::FOUND && match.metadata->title == "SONIC THE HEDGEHOG" && match.metadata->developer == "Sonic Team" &&
        match.metadata->publisher == "SEGA" && match.metadata->canonical_id == "MK-1079" && match.metadata->attributes.at("publisher") == "SEGA",
        fmt::format("title: {}, publisher: {}", match.metadata ? match.metadata->title.value_or("") : "", match.metadata ? match.metadata->publisher.value_or("") : ""));

    std::cout << "reconcile database values win... " << std::flush;
    match = reconcile(identifier, { record }, true);
    success &= report(match.status == Match::Status::FOUND && match.metadata->title == "Sonic the Hedgehog" && match.metadata->publisher == "Sega" &&
        match.metadata->attributes.at("publisher") == "Sega Enterprises",
        fmt::format("title: {}, publisher: {}", match.metadata ? match.metadata->title.value_or("") : "", match.metadata ? match.metadata->publisher.value_or("") : ""));

    std::cout << "reconcile absent on-disk field falls back to database... " << std::flush;
    Identifier bare;
    bare.platform = Platform::GENESIS;
    bare.serial = "MK1079";
    match = reconcile(bare, { record }, false);
    success &= report(match.status == Match::Status::FOUND && match.metadata->title == "Sonic the Hedgehog" && match.metadata->region == "Europe" && !match.metadata->rating,
        fmt::format("title: {}", match.metadata ? match.metadata->title.value_or("") : ""));

    auto usa = make_record(Platform::GENESIS, "MK-1079", "Sonic the Hedgehog", "USA");
    auto japan = make_record(Platform::GENESIS, "G-4049", "Sonic the Hedgehog", "Japan");

    std::cout << "reconcile region hint narrows to one... " << std::flush;
    match = reconcile(identifier, { usa, record, japan }, false);
    success &= report(match.status == Match::Status::FOUND && match.metadata->canonical_id == "MK-1079" && match.metadata->region == "Europe", match_status_string(match.status));

    std::cout << "reconcile without hint -> ambiguous... " << std::flush;
    match = reconcile(bare, { usa, record }, false);
    success &= report(match.status == Match::Status::AMBIGUOUS && match.candidates.size() == 2 && !match.metadata, match_status_string(match.status));

    auto rev0 = make_record(Platform::GENESIS, "MK-1079", "Sonic the Hedgehog", "USA, Europe");
    rev0.attributes["revision"] = "0";
    auto rev1 = make_record(Platform::GENESIS, "MK-1079", "Sonic the Hedgehog (Rev 1)", "USA, Europe");
    rev1.attributes["revision"] = "1";

    std::cout << "reconcile version narrows after region... " << std::flush;
    Identifier versioned(identifier);
    versioned.version = "01";
    match = reconcile(versioned, { rev0, rev1 }, true);
    success &= report(match.status == Match::Status::FOUND && match.metadata->title == "Sonic the Hedgehog (Rev 1)", match_status_string(match.status));

    std::cout << "reconcile unmatched disambiguators -> ambiguous with all candidates... " << std::flush;
    versioned.region_hint = "Brazil";
    versioned.version = "7";
    match = reconcile(versioned, { rev0, rev1 }, true);
    success &= report(match.status == Match::Status::AMBIGUOUS && match.candidates.size() == 2, match_status_string(match.status));

    std::cout << "reconcile ambiguous lists only region matched candidates... " << std::flush;
    versioned.region_hint = "USA";
    match = reconcile(versioned, { japan, rev0, rev1 }, true);
    success &= report(match.status == Match::Status::AMBIGUOUS && match.candidates.size() == 2 &&
        std::none_of(match.candidates.begin(), match.candidates.end(), [](const Record &r) { return r.id == "G-4049"; }), fmt::format("candidates: {}", match.candidates.size()));

    return success;
}


bool test_database()
{
    bool success = true;

    auto dir = std::filesystem::temp_directory_path() / "gameid_tests_database";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    {
        std::ofstream fs(dir / "Genesis.data.tsv");
        fs << "ID\ttitle\tregion\trelease_date\tdeveloper\tpublisher\trating\tnotes\r\n";
        fs << "MK-1079\tSonic the Hedgehog\tUSA\t1991-06-23\tSonic Team\tSega\tGA\tfirst\r\n";
        fs << "MK-1079\tSonic the Hedgehog\tEurope\t1991-06-23\tSonic Team\tSega\t\t\r\n";
        fs << "G-4049\tSonic the Hedgehog\tJapan\t1991-07-26\tSonic Team\tSega\t\t\r\n";
        fs << "\tNo ID\tUSA\t\t\t\t\t\r\n";
        fs << "T-1\ttoo\tmany\tcolumns\tin\tthis\trow\there\tand\there\r\n";
    }
    {
        std::ofstream fs(dir / "GB.data.tsv");
        fs << "ID\ttitle\tinternal_title\tglobal_checksum_expected\n";
        fs << "DMG-TRA-1\tTetris\tTETRIS\t0x16BF\n";
    }
    {
        std::ofstream fs(dir / "readme.txt");
        fs << "not a table\n";
    }

    std::cout << "unloaded database -> database unavailable... " << std::flush;
    Database unloaded;
    auto code = error_code_of([&]() { unloaded.lookup(Platform::GENESIS, "MK1079"); });
    success &= report(code == ErrorCode::DATABASE_UNAVAILABLE && !unloaded.available(), error_string(code));

    std::cout << "missing database path -> database unavailable... " << std::flush;
    Database missing;
    code = error_code_of([&]() { missing.load(dir / "missing"); });
    auto lookup_code = error_code_of([&]() { missing.lookup(Platform::GENESIS, "MK1079"); });
    success &= report(code == ErrorCode::DATABASE_UNAVAILABLE && lookup_code == ErrorCode::DATABASE_UNAVAILABLE, fmt::format("load: {}, lookup: {}", error_string(code), error_string(lookup_code)));

    Database database;
    std::cout << "load database directory... " << std::flush;
    code = error_code_of([&]() { database.load(dir); });
    success &= report(!code && database.available() && database.size() == 4, fmt::format("error: {}, size: {}", error_string(code), database.size()));
    if(!database.available())
    {
        std::filesystem::remove_all(dir);
        return false;
    }

    std::cout << "lookup shared serial returns every record... " << std::flush;
    auto records = database.lookup(Platform::GENESIS, "mk_1079");
    success &= report(records.size() == 2 && records.front().rating == "GA" && records.front().attributes.at("notes") == "first", fmt::format("records: {}", records.size()));

    std::cout << "lookup unknown serial -> empty... " << std::flush;
    success &= report(database.lookup(Platform::GENESIS, "MK9999").empty() && database.lookup(Platform::SATURN, "MK1079").empty(), "records found");

    std::cout << "lookup GB key from GBC index family... " << std::flush;
    records = database.lookup(Platform::GBC, "TETRIS#16BF");
    success &= report(records.size() == 1 && records.front().id == "DMG-TRA-1", fmt::format("records: {}", records.size()));

    std::cout << "lookup prefix... " << std::flush;
    records = database.lookupPrefix(Platform::GENESIS, "MK-10");
    success &= report(records.size() == 2, fmt::format("records: {}", records.size()));

    std::cout << "identify Genesis cartridge against database... " << std::flush;
    auto md = build_genesis("SEGA GENESIS", "GM MK-1079 -00", "U", "SONIC THE HEDGEHOG");
    MemoryReader reader(md);
    try
    {
        auto identification = identify(reader, Platform::GENESIS, database);
        auto const &m = identification.match;
        success &= report(m.status == Match::Status::FOUND && m.metadata->canonical_id == "MK-1079" && m.metadata->region == "USA" && m.metadata->release_date == "1991-06-23",
            match_status_string(m.status));
    }
    catch(const std::exception &e)
    {
        success &= report(false, e.what());
    }

    std::cout << "identify GB cartridge against database... " << std::flush;
    MemoryReader gb_reader(build_gb("TETRIS", 0x00, 0x16BF, 0x00));
    try
    {
        auto identification = identify(gb_reader, Platform::GB, database);
        auto const &m = identification.match;
        success &= report(m.status == Match::Status::FOUND && m.metadata->canonical_id == "DMG-TRA-1" && m.metadata->title == "TETRIS", match_status_string(m.status));
    }
    catch(const std::exception &e)
    {
        success &= report(false, e.what());
    }

    std::cout << "identify with unloaded database -> database unavailable... " << std::flush;
    code = error_code_of([&]() { identify(reader, Platform::GENESIS, unloaded); });
    success &= report(code == ErrorCode::DATABASE_UNAVAILABLE, error_string(code));

    std::cout << "reload after table removal -> database unavailable... " << std::flush;
    std::filesystem::remove(dir / "Genesis.data.tsv");
    std::filesystem::remove(dir / "GB.data.tsv");
    code = error_code_of([&]() { database.reload(); });
    lookup_code = error_code_of([&]() { database.lookup(Platform::GENESIS, "MK1079"); });
    success &= report(code == ErrorCode::DATABASE_UNAVAILABLE && lookup_code == ErrorCode::DATABASE_UNAVAILABLE, fmt::format("reload: {}, lookup: {}", error_string(code), error_string(lookup_code)));

    std::filesystem::remove_all(dir);

    return success;
}


bool test_record_keys()
{
    bool success = true;

    auto n64 = make_record(Platform::N64, "NUS-NSME-USA", "Super Mario 64", "USA");
    auto gc = make_record(Platform::GC, "DOL-GALE-USA", "Super Smash Bros. Melee", "USA");
    auto saturn = make_record(Platform::SATURN, "T-12705H V1.000", "Biohazard", "Japan");
    auto psx = make_record(Platform::PSX, "SLUS-00594", "Metal Gear Solid", "USA");
    psx.attributes["redump_name"] = "SLUS_005.94";
    auto ngcd = make_record(Platform::NEOGEOCD, "NGCD-001", "Test", "Japan");
    ngcd.attributes["uuid"] = "1996-01-01-12-00-00-00";
    ngcd.attributes["volume_ID"] = "NGCD_TEST";

    std::vector<std::pair<Record, std::vector<std::string>>> cases = {
        { n64,    { "SME" }                                   },
        { gc,     { "GALE" }                                  },
        { saturn, { "T12705H" }                               },
        { psx,    { "SLUS-00594" }                            },
        { ngcd,   { "1996010112000000#NGCDTEST", "NGCDTEST" } }
    };

    for(auto const &c : cases)
    {
        auto keys = gamedb_record_keys(c.first);

        std::string joined;
        for(auto const &k : keys)
            joined += (joined.empty() ? "" : ", ") + k;

        std::cout << fmt::format("record keys {} ({}) -> {}... ", c.first.id, platform_string(c.first.platform), c.second.front()) << std::flush;
        success &= report(keys == c.second, fmt::format("result: {}", joined));
    }

    return success;
}


bool test_cue()
{
    bool success = true;

    auto dir = std::filesystem::temp_directory_path() / "gameid_tests_cue";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    {
        std::ofstream fs(dir / "game.cue");
        fs << "FILE \"game (Track 1).bin\" BINARY\r\n";
        fs << "  TRACK 01 MODE2/2352\r\n";
        fs << "    INDEX 01 00:00:00\r\n";
        fs << "FILE \"game (Track 2).bin\" BINARY\r\n";
        fs << "  TRACK 02 AUDIO\r\n";
        fs << "    INDEX 01 00:00:00\r\n";
    }

    std::cout << "cue sheet resolves to first data track... " << std::flush;
    try
    {
        auto path = resolve_image_path(dir / "game.cue");
        success &= report(path == dir / "game (Track 1).bin", path.string());
    }
    catch(const std::exception &e)
    {
        success &= report(false, e.what());
    }

    std::cout << "non cue path is used as is... " << std::flush;
    success &= report(resolve_image_path(dir / "game.iso") == dir / "game.iso", "path changed");

    std::filesystem::remove_all(dir);

    return success;
}


bool test_directory_volume()
{
    bool success = true;

    auto dir = std::filesystem::temp_directory_path() / "gameid_tests_directory";
    std::filesystem::remove_all(dir);

    write_file(dir / "psx" / "SYSTEM.CNF", text_data("BOOT = cdrom:\\SLUS_005.94;1\r\nTCB = 4\r\n"));
    write_file(dir / "psx" / "SLUS_005.94", text_data(std::string("PS-X EXE") + std::string(8, '\0')));
    // mounted discs may report lowercase names
    write_file(dir / "ps2" / "system.cnf", text_data("BOOT2 = cdrom0:\\DATA\\SLES_123.45;1\r\nVER = 1.01\r\n"));
    write_file(dir / "ps2" / "data" / "sles_123.45", std::vector<uint8_t>{ 0x7F, 'E', 'L', 'F' });
    write_file(dir / "psx_exe" / "PSX.EXE", text_data(std::string("PS-X EXE") + std::string(8, '\0')));

    ExtractOptions overrides;
    overrides.volume_id = "SLUS_00594";
    overrides.uuid = "1999-09-09-00-00-00-00";

    std::cout << "mounted PSX disc with caller attributes... " << std::flush;
    try
    {
        DirectoryVolume volume(dir / "psx", overrides);
        auto identifier = extract(volume, Platform::PSX, overrides);
        success &= report(identifier.serial == "SLUS-00594" && attribute(identifier, "volume_id") == "SLUS_00594" && attribute(identifier, "uuid") == "1999-09-09-00-00-00-00" &&
            attribute(identifier, "root_files") == "SLUS_005.94 / SYSTEM.CNF", fmt::format("serial: {}, root_files: {}", identifier.serial, attribute(identifier, "root_files")));
    }
    catch(const std::exception &e)
    {
        success &= report(false, e.what());
    }

    std::cout << "mounted PS2 disc, case insensitive lookup... " << std::flush;
    try
    {
        DirectoryVolume volume(dir / "ps2", ExtractOptions());
        auto identifier = extract(volume, Platform::PS2);
        success &= report(identifier.serial == "SLES-12345" && identifier.version == "1.01" && attribute(identifier, "volume_id") == "<missing>",
            fmt::format("serial: {}, version: {}", identifier.serial, identifier.version.value_or("")));
    }
    catch(const std::exception &e)
    {
        success &= report(false, e.what());
    }

    std::cout << "mounted PSX.EXE disc needs a disc label... " << std::flush;
    {
        DirectoryVolume unlabeled(dir / "psx_exe", ExtractOptions());
        auto code = error_code_of([&]() { extract(unlabeled, Platform::PSX); });
        success &= report(code == ErrorCode::FORMAT_MISMATCH, fmt::format("error: {}", error_string(code)));
    }

    std::cout << "mounted PSX.EXE disc serial from disc label... " << std::flush;
    try
    {
        ExtractOptions label;
        label.volume_id = "MY_DISC";
        DirectoryVolume labeled(dir / "psx_exe", label);
        auto identifier = extract(labeled, Platform::PSX, label);
        success &= report(identifier.serial == "MYDISC", fmt::format("serial: {}", identifier.serial));
    }
    catch(const std::exception &e)
    {
        success &= report(false, e.what());
    }

    std::cout << "mounted disc as cartridge platform... " << std::flush;
    {
        DirectoryVolume volume(dir / "psx", ExtractOptions());
        auto code = error_code_of([&]() { extract(volume, Platform::GB); });
        success &= report(code == ErrorCode::UNSUPPORTED_PLATFORM, fmt::format("error: {}", error_string(code)));
    }

    std::cout << "mounted disc platforms... " << std::flush;
    {
        DirectoryVolume volume(dir / "ps2", ExtractOptions());
        auto platforms = probe(volume);
        success &= report(platforms == std::vector<Platform>{ Platform::PS2 }, fmt::format("platforms: {}", platforms.size()));
    }

    std::filesystem::remove_all(dir);

    return success;
}


bool test_gzip()
{
    bool success = true;

    auto dir = std::filesystem::temp_directory_path() / "gameid_tests_gzip";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    auto gb = build_gb("TETRIS", 0x00, 0x16BF, 0x00);
    write_gzip(dir / "tetris.gb.gz", gb);

    std::cout << "gzip compressed cartridge... " << std::flush;
    try
    {
        GzipReader reader(dir / "tetris.gb.gz");
        auto identifier = extract(reader, Platform::GB);
        success &= report(reader.size() == gb.size() && identifier.serial == "TETRIS#16BF", fmt::format("size: {}, serial: {}", reader.size(), identifier.serial));
    }
    catch(const std::exception &e)
    {
        success &= report(false, e.what());
    }

    // cut in the middle of the deflate stream
    auto compressed = read_file(dir / "tetris.gb.gz");
    compressed.resize(compressed.size() / 2);
    write_file(dir / "broken.gb.gz", compressed);

    std::cout << "truncated gzip stream... " << std::flush;
    try
    {
        GzipReader reader(dir / "broken.gb.gz");
        success &= report(false, "no exception");
    }
    catch(const std::runtime_error &)
    {
        success &= report(true, "");
    }

    std::cout << "gzip path detection... " << std::flush;
    success &= report(is_gzip_path("game.iso.GZ") && !is_gzip_path("game.iso") && !is_gzip_path("gz"), "unexpected result");

    std::filesystem::remove_all(dir);

    return success;
}


bool test_batch()
{
    bool success = true;

    auto dir = std::filesystem::temp_directory_path() / "gameid_tests_batch";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    write_gzip(dir / "tetris.gb.gz", build_gb("TETRIS", 0x00, 0x16BF, 0x00));
    auto compressed = read_file(dir / "tetris.gb.gz");
    compressed.resize(compressed.size() / 2);
    write_file(dir / "broken.gb.gz", compressed);
    write_file(dir / "zelda.gbc", build_gb("ZELDA", 0xC0, 0xABCD, 0x01));

    auto output = (dir / "out.txt").string();
    auto broken = (dir / "broken.gb.gz").string();
    auto tetris = (dir / "tetris.gb.gz").string();
    auto zelda = (dir / "zelda.gbc").string();

    std::cout << "batch continues past unreadable files... " << std::flush;
    try
    {
        const char *argv[] = { "gameid", "extract", "--console=GB", "--output", output.c_str(), broken.c_str(), zelda.c_str(), tetris.c_str() };
        Options options(sizeof(argv) / sizeof(argv[0]), argv);
        int exit_code = gameid::gameid(options);

        auto data = read_file(output);
        std::string text(data.begin(), data.end());
        success &= report(exit_code == 1 && text.find("TETRIS#16BF") != std::string::npos && text.find("ZELDA") == std::string::npos,
            fmt::format("exit code: {}, output: {}", exit_code, text));
    }
    catch(const std::exception &e)
    {
        success &= report(false, e.what());
    }

    std::cout << "single unreadable file is an error... " << std::flush;
    try
    {
        const char *argv[] = { "gameid", "extract", "--console=GB", broken.c_str() };
        Options options(sizeof(argv) / sizeof(argv[0]), argv);
        gameid::gameid(options);
        success &= report(false, "no exception");
    }
    catch(const std::runtime_error &)
    {
        success &= report(true, "");
    }

    std::filesystem::remove_all(dir);

    return success;
}


int main(int argc, char *argv[])
{
    int success = 0;

    success |= (int)!test_normalize_serial();
    std::cout << std::endl;

    success |= (int)!test_platform();
    std::cout << std::endl;

    success |= (int)!test_sector_reader();
    std::cout << std::endl;

    success |= (int)!test_gb();
    std::cout << std::endl;

    success |= (int)!test_gba();
    std::cout << std::endl;

    success |= (int)!test_snes();
    std::cout << std::endl;

    success |= (int)!test_n64();
    std::cout << std::endl;

    success |= (int)!test_genesis();
    std::cout << std::endl;

    success |= (int)!test_gc();
    std::cout << std::endl;

    success |= (int)!test_psx();
    std::cout << std::endl;

    success |= (int)!test_ps2();
    std::cout << std::endl;

    success |= (int)!test_psp();
    std::cout << std::endl;

    success |= (int)!test_saturn();
    std::cout << std::endl;

    success |= (int)!test_segacd();
    std::cout << std::endl;

    success |= (int)!test_neogeocd();
    std::cout << std::endl;

    success |= (int)!test_probe();
    std::cout << std::endl;

    success |= (int)!test_reconcile();
    std::cout << std::endl;

    success |= (int)!test_record_keys();
    std::cout << std::endl;

    success |= (int)!test_database();
    std::cout << std::endl;

    success |= (int)!test_cue();
    std::cout << std::endl;

    success |= (int)!test_directory_volume();
    std::cout << std::endl;

    success |= (int)!test_gzip();
    std::cout << std::endl;

    success |= (int)!test_batch();

    return success;
}
