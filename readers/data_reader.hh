#pragma once



#include <cstdint>
#include <string>
#include <vector>



namespace gameid
{

// bounded random access byte source
class DataReader
{
public:
    virtual ~DataReader() {}

    virtual uint64_t size() const = 0;

    // exactly size bytes or TRUNCATED_INPUT
    void read(uint8_t *data, uint64_t offset, uint64_t size) const;

    std::vector<uint8_t> readVector(uint64_t offset, uint64_t size) const;

    template<typename T>
    T readUint(uint64_t offset, bool big_endian) const;

    // fixed length string, trailing space and NUL padding trimmed
    std::string readString(uint64_t offset, uint64_t length) const;

    bool contains(uint64_t offset, uint64_t size) const;

protected:
    virtual void readData(uint8_t *data, uint64_t offset, uint64_t size) const = 0;
};

}
