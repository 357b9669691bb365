#include <algorithm>
#include <cstring>
#include <set>
#include "cd/cdrom.hh"
#include "image_builder.hh"



namespace gameid::test
{

namespace
{

constexpr uint32_t SECTOR_SIZE = 2048;
constexpr uint32_t SYSTEM_AREA_SECTORS = 16;


std::vector<uint8_t> directory_record(const std::string &identifier, uint32_t lba, uint32_t size, bool directory)
{
    uint32_t length = 33 + (uint32_t)identifier.length();
    if(length % 2)
        ++length;

    std::vector<uint8_t> record(length);
    record[0] = (uint8_t)length;
    put_u32le(record, 2, lba);
    put_u32be(record, 6, lba);
    put_u32le(record, 10, size);
    put_u32be(record, 14, size);

    // 1999-12-31 00:00:00
    record[18] = 99;
    record[19] = 12;
    record[20] = 31;

    record[25] = directory ? 0x02 : 0x00;
    put_u16le(record, 28, 1);
    put_u16be(record, 30, 1);
    record[32] = (uint8_t)identifier.length();
    put_string(record, 33, identifier);

    return record;
}


uint32_t sectors_for(uint64_t size)
{
    return std::max<uint32_t>(1, (uint32_t)((size + SECTOR_SIZE - 1) / SECTOR_SIZE));
}


uint8_t bcd(uint32_t value)
{
    return (uint8_t)(value / 10 * 16 + value % 10);
}

}


void put_string(std::vector<uint8_t> &data, uint32_t offset, const std::string &s)
{
    std::copy(s.begin(), s.end(), data.begin() + offset);
}


void put_padded(std::vector<uint8_t> &data, uint32_t offset, const std::string &s, uint32_t length, char pad)
{
    std::string padded(s, 0, std::min<size_t>(s.length(), length));
    padded.resize(length, pad);
    put_string(data, offset, padded);
}


void put_u16le(std::vector<uint8_t> &data, uint32_t offset, uint16_t value)
{
    data[offset + 0] = (uint8_t)value;
    data[offset + 1] = (uint8_t)(value >> 8);
}


void put_u16be(std::vector<uint8_t> &data, uint32_t offset, uint16_t value)
{
    data[offset + 0] = (uint8_t)(value >> 8);
    data[offset + 1] = (uint8_t)value;
}


void put_u32le(std::vector<uint8_t> &data, uint32_t offset, uint32_t value)
{
    for(uint32_t i = 0; i < 4; ++i)
        data[offset + i] = (uint8_t)(value >> i * 8);
}


void put_u32be(std::vector<uint8_t> &data, uint32_t offset, uint32_t value)
{
    for(uint32_t i = 0; i < 4; ++i)
        data[offset + i] = (uint8_t)(value >> (3 - i) * 8);
}


std::vector<uint8_t> text_data(const std::string &text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}


std::vector<uint8_t> build_gb(const std::string &title, uint8_t cgb_flag, uint16_t global_checksum, uint8_t destination)
{
    std::vector<uint8_t> rom(0x8000);

    put_padded(rom, 0x134, title, 15, '\0');
    rom[0x143] = cgb_flag;
    rom[0x146] = 0x00;
    rom[0x147] = 0x01;
    rom[0x14A] = destination;
    rom[0x14B] = 0x01;
    update_gb_header_checksum(rom);
    put_u16be(rom, 0x14E, global_checksum);

    return rom;
}


void update_gb_header_checksum(std::vector<uint8_t> &rom)
{
    uint8_t checksum = 0;
    for(uint32_t i = 0x134; i < 0x14D; ++i)
        checksum = checksum - rom[i] - 1;
    rom[0x14D] = checksum;
}


std::vector<uint8_t> build_gba(const std::string &title, const std::string &game_code)
{
    std::vector<uint8_t> rom(0x200);

    put_padded(rom, 0xA0, title, 12, '\0');
    put_padded(rom, 0xAC, game_code, 4);
    put_string(rom, 0xB0, "01");
    rom[0xB2] = 0x96;

    uint8_t complement = 0;
    for(uint32_t i = 0xA0; i < 0xBD; ++i)
        complement -= rom[i];
    rom[0xBD] = complement - 0x19;

    return rom;
}


std::vector<uint8_t> build_snes(uint32_t header_offset, uint32_t rom_size, const std::string &title, uint8_t country, uint8_t developer, uint8_t version, uint16_t checksum)
{
    std::vector<uint8_t> rom(rom_size);

    put_padded(rom, header_offset, title, 21);
    rom[header_offset + 21] = header_offset == 0x7FC0 ? 0x20 : 0x21;
    rom[header_offset + 23] = 0x09;
    rom[header_offset + 25] = country;
    rom[header_offset + 26] = developer;
    rom[header_offset + 27] = version;
    put_u16le(rom, header_offset + 28, checksum ^ 0xFFFF);
    put_u16le(rom, header_offset + 30, checksum);

    return rom;
}


std::vector<uint8_t> build_n64(const std::string &title, const std::string &cartridge_id, char country)
{
    std::vector<uint8_t> rom(0x1000);

    put_u32be(rom, 0x00, 0x80371240);
    put_u32be(rom, 0x08, 0x80000400);
    put_padded(rom, 0x20, title, 20);
    rom[0x3B] = 'N';
    put_padded(rom, 0x3C, cartridge_id, 2);
    rom[0x3E] = (uint8_t)country;

    return rom;
}


std::vector<uint8_t> build_genesis(const std::string &system_type, const std::string &serial_field, const std::string &regions, const std::string &title)
{
    std::vector<uint8_t> rom(0x400);

    std::fill(rom.begin() + 0x100, rom.begin() + 0x200, ' ');
    put_padded(rom, 0x100, system_type, 16);
    put_string(rom, 0x110, "(C)SEGA 1991.APR");
    put_padded(rom, 0x120, title, 48);
    put_padded(rom, 0x150, title, 48);
    put_padded(rom, 0x180, serial_field, 14);
    put_u16be(rom, 0x18E, 0x1234);
    put_padded(rom, 0x190, "J", 16);
    put_padded(rom, 0x1F0, regions, 16);

    return rom;
}


std::vector<uint8_t> build_gc(const std::string &game_code, const std::string &title)
{
    std::vector<uint8_t> image(SYSTEM_AREA_SECTORS * SECTOR_SIZE);

    put_padded(image, 0x00, game_code, 4);
    put_string(image, 0x04, "01");
    put_u32be(image, 0x1C, 0xC2339F3D);
    put_padded(image, 0x20, title, 64, '\0');
    put_u32be(image, 0x420, 0x0001E800);
    put_u32be(image, 0x424, 0x00456E00);
    put_u32be(image, 0x428, 0x7A25);
    put_u32be(image, 0x42C, 0x7A25);

    // apploader header
    put_string(image, 0x2440, "2001/11/19");
    put_u32be(image, 0x2450, 0x81200258);
    put_u32be(image, 0x2454, 0x1A48);
    put_u32be(image, 0x2458, 0x17A0);

    return image;
}


std::vector<uint8_t> build_saturn_system_area(const std::string &serial_version, const std::string &date, const std::string &regions, const std::string &title)
{
    std::vector<uint8_t> system_area(SYSTEM_AREA_SECTORS * SECTOR_SIZE);

    std::fill(system_area.begin(), system_area.begin() + 0x100, ' ');
    put_string(system_area, 0x00, "SEGA SEGASATURN ");
    put_padded(system_area, 0x10, "SEGA ENTERPRISES", 16);
    put_padded(system_area, 0x20, serial_version, 16);
    put_padded(system_area, 0x30, date, 8);
    put_padded(system_area, 0x38, "CD-1/1", 8);
    put_padded(system_area, 0x40, regions, 10);
    put_padded(system_area, 0x50, "J", 16);
    put_padded(system_area, 0x60, title, 112);

    return system_area;
}


std::vector<uint8_t> build_segacd_system_area(const std::string &serial_field, const std::string &regions, const std::string &title)
{
    std::vector<uint8_t> system_area(SYSTEM_AREA_SECTORS * SECTOR_SIZE);

    std::fill(system_area.begin(), system_area.begin() + 0x200, ' ');
    put_string(system_area, 0x000, "SEGADISCSYSTEM  ");
    put_string(system_area, 0x100, "SEGA MEGA DRIVE ");
    put_string(system_area, 0x110, "(C)SEGA 1993.OCT");
    put_padded(system_area, 0x120, title, 48);
    put_padded(system_area, 0x150, title, 48);
    put_padded(system_area, 0x180, serial_field, 16);
    put_padded(system_area, 0x190, "J", 16);
    put_padded(system_area, 0x1F0, regions, 16);

    return system_area;
}


std::vector<uint8_t> build_sfo(const std::map<std::string, std::string> &values)
{
    constexpr uint32_t HEADER_SIZE = 20;
    constexpr uint32_t ENTRY_SIZE = 16;

    uint32_t key_table = HEADER_SIZE + ENTRY_SIZE * (uint32_t)values.size();

    std::vector<uint8_t> keys;
    std::vector<uint8_t> data;
    std::vector<uint8_t> entries(ENTRY_SIZE * values.size());

    uint32_t i = 0;
    for(auto const &[key, value] : values)
    {
        uint32_t entry = ENTRY_SIZE * i++;
        uint32_t length = (uint32_t)value.length() + 1;
        uint32_t max_length = (length + 3) / 4 * 4;

        put_u16le(entries, entry + 0, (uint16_t)keys.size());
        put_u16le(entries, entry + 2, 0x0204);
        put_u32le(entries, entry + 4, length);
        put_u32le(entries, entry + 8, max_length);
        put_u32le(entries, entry + 12, (uint32_t)data.size());

        keys.insert(keys.end(), key.begin(), key.end());
        keys.push_back('\0');

        auto value_start = data.size();
        data.resize(value_start + max_length);
        std::copy(value.begin(), value.end(), data.begin() + value_start);
    }
    keys.resize((keys.size() + 3) / 4 * 4);

    uint32_t data_table = key_table + (uint32_t)keys.size();

    std::vector<uint8_t> sfo(HEADER_SIZE);
    put_string(sfo, 0, std::string("\0PSF", 4));
    put_u32le(sfo, 4, 0x00000101);
    put_u32le(sfo, 8, key_table);
    put_u32le(sfo, 12, data_table);
    put_u32le(sfo, 16, (uint32_t)values.size());
    sfo.insert(sfo.end(), entries.begin(), entries.end());
    sfo.insert(sfo.end(), keys.begin(), keys.end());
    sfo.insert(sfo.end(), data.begin(), data.end());

    return sfo;
}


std::vector<uint8_t> swap_words(std::vector<uint8_t> data, uint32_t word)
{
    for(size_t i = 0; i + word <= data.size(); i += word)
        std::reverse(data.begin() + i, data.begin() + i + word);

    return data;
}


IsoBuilder::IsoBuilder(const std::string &volume_id, const std::string &system_id)
    : _volumeID(volume_id)
    , _systemID(system_id)
{
    ;
}


void IsoBuilder::setCreationDate(const std::string &date)
{
    _creationDate = date;
}


void IsoBuilder::setSystemArea(const std::vector<uint8_t> &data)
{
    _systemArea = data;
}


void IsoBuilder::addFile(const std::string &path, const std::vector<uint8_t> &data)
{
    File file;

    auto s = path.find('/');
    if(s == std::string::npos)
        file.name = path;
    else
    {
        file.directory = path.substr(0, s);
        file.name = path.substr(s + 1);
    }
    file.data = data;

    _files.push_back(file);
}


std::vector<uint8_t> IsoBuilder::build(bool raw) const
{
    constexpr uint32_t PVD_LBA = SYSTEM_AREA_SECTORS;
    constexpr uint32_t ROOT_LBA = PVD_LBA + 2;

    std::set<std::string> directory_names;
    for(auto const &f : _files)
        if(!f.directory.empty())
            directory_names.insert(f.directory);
    std::vector<std::string> directories(directory_names.begin(), directory_names.end());

    uint32_t lba = ROOT_LBA + 1 + (uint32_t)directories.size();
    std::vector<uint32_t> file_lba;
    for(auto const &f : _files)
    {
        file_lba.push_back(lba);
        lba += sectors_for(f.data.size());
    }
    uint32_t sectors_count = lba;

    std::vector<uint8_t> image((uint64_t)sectors_count * SECTOR_SIZE);

    if(!_systemArea.empty())
        std::copy(_systemArea.begin(), _systemArea.begin() + std::min<size_t>(_systemArea.size(), SYSTEM_AREA_SECTORS * SECTOR_SIZE), image.begin());

    // primary volume descriptor
    std::vector<uint8_t> pvd(SECTOR_SIZE);
    pvd[0] = 1;
    put_string(pvd, 1, "CD001");
    pvd[6] = 1;
    put_padded(pvd, 8, _systemID, 32);
    put_padded(pvd, 40, _volumeID, 32);
    put_u32le(pvd, 80, sectors_count);
    put_u32be(pvd, 84, sectors_count);
    put_u16le(pvd, 120, 1);
    put_u16be(pvd, 122, 1);
    put_u16le(pvd, 124, 1);
    put_u16be(pvd, 126, 1);
    put_u16le(pvd, 128, SECTOR_SIZE);
    put_u16be(pvd, 130, SECTOR_SIZE);
    auto root_record = directory_record(std::string(1, '\0'), ROOT_LBA, SECTOR_SIZE, true);
    std::copy(root_record.begin(), root_record.end(), pvd.begin() + 156);
    std::fill(pvd.begin() + 190, pvd.begin() + 813, ' ');
    if(!_creationDate.empty())
        put_padded(pvd, 813, _creationDate, 16, '0');
    pvd[881] = 1;
    std::copy(pvd.begin(), pvd.end(), image.begin() + PVD_LBA * SECTOR_SIZE);

    // set terminator
    auto terminator = image.begin() + (PVD_LBA + 1) * SECTOR_SIZE;
    terminator[0] = 0xFF;
    std::copy_n("CD001", 5, terminator + 1);
    terminator[6] = 1;

    auto write_directory = [&image](uint32_t directory_lba, uint32_t parent_lba, const std::vector<std::vector<uint8_t>> &records)
    {
        std::vector<uint8_t> extent;
        for(auto const &r : { directory_record(std::string(1, '\0'), directory_lba, SECTOR_SIZE, true), directory_record(std::string(1, '\1'), parent_lba, SECTOR_SIZE, true) })
            extent.insert(extent.end(), r.begin(), r.end());
        for(auto const &r : records)
            extent.insert(extent.end(), r.begin(), r.end());
        extent.resize(SECTOR_SIZE);

        std::copy(extent.begin(), extent.end(), image.begin() + (uint64_t)directory_lba * SECTOR_SIZE);
    };

    std::vector<std::vector<uint8_t>> root_records;
    for(uint32_t d = 0; d < directories.size(); ++d)
        root_records.push_back(directory_record(directories[d], ROOT_LBA + 1 + d, SECTOR_SIZE, true));

    for(uint32_t i = 0; i < _files.size(); ++i)
    {
        auto const &f = _files[i];
        std::copy(f.data.begin(), f.data.end(), image.begin() + (uint64_t)file_lba[i] * SECTOR_SIZE);

        if(f.directory.empty())
            root_records.push_back(directory_record(f.name + ";1", file_lba[i], (uint32_t)f.data.size(), false));
    }
    write_directory(ROOT_LBA, ROOT_LBA, root_records);

    for(uint32_t d = 0; d < directories.size(); ++d)
    {
        std::vector<std::vector<uint8_t>> records;
        for(uint32_t i = 0; i < _files.size(); ++i)
            if(_files[i].directory == directories[d])
                records.push_back(directory_record(_files[i].name + ";1", file_lba[i], (uint32_t)_files[i].data.size(), false));

        write_directory(ROOT_LBA + 1 + d, ROOT_LBA, records);
    }

    if(!raw)
        return image;

    std::vector<uint8_t> raw_image((uint64_t)sectors_count * CD_DATA_SIZE);
    for(uint32_t s = 0; s < sectors_count; ++s)
    {
        auto sector = raw_image.begin() + (uint64_t)s * CD_DATA_SIZE;
        std::copy(std::begin(CD_DATA_SYNC), std::end(CD_DATA_SYNC), sector);

        uint32_t address = s + 150;
        sector[12] = bcd(address / 75 / 60);
        sector[13] = bcd(address / 75 % 60);
        sector[14] = bcd(address % 75);
        sector[15] = 1;

        std::copy_n(image.begin() + (uint64_t)s * SECTOR_SIZE, SECTOR_SIZE, sector + 16);
    }

    return raw_image;
}

}
