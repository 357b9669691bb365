#pragma once



#include <algorithm>
#include <cstdint>
#include <vector>
#include "data_reader.hh"



namespace gameid
{

enum class ByteOrder
{
    NATIVE,
    SWAP16,
    SWAP32
};


// presents a word swapped image in its native byte order
class SwapReader : public DataReader
{
public:
    SwapReader(const DataReader &reader, ByteOrder byte_order)
        : _reader(reader)
        , _byteOrder(byte_order)
    {
        ;
    }


    uint64_t size() const override
    {
        return _reader.size();
    }

protected:
    void readData(uint8_t *data, uint64_t offset, uint64_t size) const override
    {
        uint64_t word = wordSize();

        // widen to word boundaries, trailing partial word stays unswapped
        uint64_t start = offset / word * word;
        uint64_t end = std::min((offset + size + word - 1) / word * word, _reader.size());

        std::vector<uint8_t> buffer(end - start);
        _reader.read(buffer.data(), start, buffer.size());

        for(uint64_t i = 0; i + word <= buffer.size(); i += word)
            std::reverse(buffer.begin() + i, buffer.begin() + i + word);

        std::copy(buffer.begin() + (offset - start), buffer.begin() + (offset - start) + size, data);
    }

private:
    const DataReader &_reader;
    ByteOrder _byteOrder;


    uint64_t wordSize() const
    {
        return _byteOrder == ByteOrder::SWAP32 ? 4 : (_byteOrder == ByteOrder::SWAP16 ? 2 : 1);
    }
};

}
