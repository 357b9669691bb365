#pragma once



#include <cstdint>
#include "data_reader.hh"
#include "error.hh"



namespace gameid
{

// offset / length view into another reader, which must outlive the window
class WindowReader : public DataReader
{
public:
    WindowReader(const DataReader &reader, uint64_t offset, uint64_t size)
        : _reader(reader)
        , _offset(offset)
        , _size(size)
    {
        if(!_reader.contains(offset, size))
            throw_error(ErrorCode::TRUNCATED_INPUT, "window exceeds source (offset: 0x{:X}, size: 0x{:X})", offset, size);
    }


    uint64_t size() const override
    {
        return _size;
    }

protected:
    void readData(uint8_t *data, uint64_t offset, uint64_t size) const override
    {
        _reader.read(data, _offset + offset, size);
    }

private:
    const DataReader &_reader;
    uint64_t _offset;
    uint64_t _size;
};

}
