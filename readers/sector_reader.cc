#include <cstdint>
#include <cstring>
#include <vector>
#include "cd/cdrom.hh"
#include "error.hh"
#include "sector_reader.hh"



namespace gameid
{

SectorReader::SectorReader(const DataReader &reader)
    : _reader(reader)
    , _raw(false)
{
    if(_reader.contains(0, sizeof(CD_DATA_SYNC)))
    {
        auto sync = _reader.readVector(0, sizeof(CD_DATA_SYNC));
        _raw = !memcmp(sync.data(), CD_DATA_SYNC, sizeof(CD_DATA_SYNC));
    }
}


bool SectorReader::raw() const
{
    return _raw;
}


uint32_t SectorReader::sectorsCount() const
{
    return _reader.size() / (_raw ? CD_DATA_SIZE : FORM1_DATA_SIZE);
}


void SectorReader::read(uint8_t *sectors, uint32_t index, uint32_t count) const
{
    checkRange(index, count);

    if(!_raw)
    {
        _reader.read(sectors, (uint64_t)index * FORM1_DATA_SIZE, (uint64_t)count * FORM1_DATA_SIZE);
        return;
    }

    Sector sector;
    for(uint32_t s = 0; s < count; ++s)
    {
        _reader.read((uint8_t *)&sector, (uint64_t)(index + s) * CD_DATA_SIZE, CD_DATA_SIZE);
        if(memcmp(sector.sync, CD_DATA_SYNC, sizeof(CD_DATA_SYNC)))
            throw_error(ErrorCode::FORMAT_MISMATCH, "sector sync mismatch (index: {})", index + s);

        uint8_t *user_data = nullptr;
        if(sector.header.mode == 1)
            user_data = sector.mode1.user_data;
        // form2 sectors are read with the form1 geometry
        else if(sector.header.mode == 2)
            user_data = sector.mode2.xa.form1.user_data;
        else
            throw_error(ErrorCode::FORMAT_MISMATCH, "unsupported sector mode (index: {}, mode: {})", index + s, sector.header.mode);

        memcpy(sectors + (uint64_t)s * FORM1_DATA_SIZE, user_data, FORM1_DATA_SIZE);
    }
}


std::vector<uint8_t> SectorReader::readVector(uint32_t index, uint32_t count) const
{
    checkRange(index, count);

    std::vector<uint8_t> sectors((uint64_t)count * FORM1_DATA_SIZE);
    read(sectors.data(), index, count);

    return sectors;
}


void SectorReader::checkRange(uint32_t index, uint32_t count) const
{
    if((uint64_t)index + count > sectorsCount())
        throw_error(ErrorCode::TRUNCATED_INPUT, "sector range is outside of the image (index: {}, count: {}, sectors: {})", index, count, sectorsCount());
}

}
