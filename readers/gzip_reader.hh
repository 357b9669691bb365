#pragma once



#include <cstdint>
#include <filesystem>
#include <vector>
#include "data_reader.hh"



namespace gameid
{

// gzip compressed image, inflated to memory on construction
class GzipReader : public DataReader
{
public:
    GzipReader(const std::filesystem::path &file_path);

    uint64_t size() const override;

protected:
    void readData(uint8_t *data, uint64_t offset, uint64_t size) const override;

private:
    std::vector<uint8_t> _data;
};


bool is_gzip_path(const std::filesystem::path &path);

}
