#include "disc_volume.hh"
#include "utils/strings.hh"
#include "regions.hh"
#include "systems.hh"



namespace gameid
{

namespace
{

constexpr uint32_t GC_MAGIC = 0xC2339F3D;

}


Descriptor descriptor_gc()
{
    Layout dvd;
    dvd.name = "DVD";
    dvd.offset = 0;
    // disc header plus the apploader header at 0x2440
    dvd.size = 0x2460;
    dvd.byte_order = ByteOrder::NATIVE;
    dvd.fields =
    {
        {"game_code",              0x00,   4,  Encoding::PRINTABLE, Transform::NONE      },
        {"maker_code",             0x04,   2,  Encoding::PRINTABLE, Transform::NONE      },
        {"disc_number",            0x06,   1,  Encoding::UINT_LE,   Transform::NONE      },
        {"disc_version",           0x07,   1,  Encoding::UINT_LE,   Transform::NONE      },
        {"audio_streaming",        0x08,   1,  Encoding::UINT_LE,   Transform::NONE      },
        {"streaming_buffer_size",  0x09,   1,  Encoding::UINT_LE,   Transform::NONE      },
        {"magic",                  0x1C,   4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"internal_title",         0x20,   64, Encoding::STRING,    Transform::NONE      },
        {"dol_offset",             0x420,  4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"fst_offset",             0x424,  4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"fst_size",               0x428,  4,  Encoding::UINT_BE,   Transform::NONE      },
        {"max_fst_size",           0x42C,  4,  Encoding::UINT_BE,   Transform::NONE      },
        {"apploader_date",         0x2440, 10, Encoding::PRINTABLE, Transform::NONE      },
        {"apploader_entry_point",  0x2450, 4,  Encoding::UINT_BE,   Transform::HEX_NUMBER},
        {"apploader_code_size",    0x2454, 4,  Encoding::UINT_BE,   Transform::NONE      },
        {"apploader_trailer_size", 0x2458, 4,  Encoding::UINT_BE,   Transform::NONE      }
    };

    dvd.validator = [](const std::vector<uint8_t> &, const FieldValues &values)
    {
        return values.number("magic") == GC_MAGIC;
    };

    dvd.composer = [](const FieldValues &values, Identifier &identifier)
    {
        auto game_code = values.text("game_code");

        identifier.serial = game_code;
        identifier.raw_title = values.text("internal_title");
        identifier.version = values.text("disc_version");
        // "2001/11/19" -> "2001-11-19"
        identifier.attributes["apploader_date"] = replace_all(values.text("apploader_date"), "/", "-");
        if(game_code.length() == 4)
        {
            auto region = nintendo_region(game_code[3]);
            if(!region.empty())
                identifier.region_hint = region;
        }
    };

    return Descriptor{ Platform::GC, Source::SYSTEM_AREA, locate_system_area, { dvd }, SerialStyle::COMPACT };
}

}
