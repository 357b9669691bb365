#pragma once



#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>
#include "data_reader.hh"



namespace gameid
{

class MemoryReader : public DataReader
{
public:
    MemoryReader(std::vector<uint8_t> data)
        : _data(std::move(data))
    {
        ;
    }


    uint64_t size() const override
    {
        return _data.size();
    }


    const std::vector<uint8_t> &data() const
    {
        return _data;
    }

protected:
    void readData(uint8_t *data, uint64_t offset, uint64_t size) const override
    {
        memcpy(data, _data.data() + offset, size);
    }

private:
    std::vector<uint8_t> _data;
};

}
