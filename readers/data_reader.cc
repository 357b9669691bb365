#include <cstdint>
#include <string>
#include <vector>
#include "data_reader.hh"
#include "error.hh"
#include "utils/endian.hh"



namespace gameid
{

void DataReader::read(uint8_t *data, uint64_t offset, uint64_t size) const
{
    if(!contains(offset, size))
        throw_error(ErrorCode::TRUNCATED_INPUT, "source is too short (offset: 0x{:X}, size: 0x{:X}, source size: 0x{:X})", offset, size, this->size());

    if(size)
        readData(data, offset, size);
}


std::vector<uint8_t> DataReader::readVector(uint64_t offset, uint64_t size) const
{
    std::vector<uint8_t> data(size);
    read(data.data(), offset, size);

    return data;
}


template<typename T>
T DataReader::readUint(uint64_t offset, bool big_endian) const
{
    uint8_t data[sizeof(T)];
    read(data, offset, sizeof(T));

    return decode_uint<T>(data, big_endian);
}


template uint8_t DataReader::readUint<uint8_t>(uint64_t, bool) const;
template uint16_t DataReader::readUint<uint16_t>(uint64_t, bool) const;
template uint32_t DataReader::readUint<uint32_t>(uint64_t, bool) const;
template uint64_t DataReader::readUint<uint64_t>(uint64_t, bool) const;


std::string DataReader::readString(uint64_t offset, uint64_t length) const
{
    auto data = readVector(offset, length);

    std::string s(data.begin(), data.end());
    s.erase(s.find_last_not_of(std::string(" \0", 2)) + 1);

    return s;
}


bool DataReader::contains(uint64_t offset, uint64_t size) const
{
    uint64_t source_size = this->size();
    return offset <= source_size && size <= source_size - offset;
}

}
