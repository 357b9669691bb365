#pragma once



#include <cstdint>
#include <vector>
#include "data_reader.hh"



namespace gameid
{

// 2048 byte user data view over a disc image, either cooked (ISO) or raw 2352 byte sectors (BIN)
class SectorReader
{
public:
    SectorReader(const DataReader &reader);

    bool raw() const;
    uint32_t sectorsCount() const;

    void read(uint8_t *sectors, uint32_t index, uint32_t count) const;
    std::vector<uint8_t> readVector(uint32_t index, uint32_t count) const;

private:
    const DataReader &_reader;
    bool _raw;


    void checkRange(uint32_t index, uint32_t count) const;
};

}
