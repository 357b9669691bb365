#pragma once



#include <cstdint>
#include <filesystem>
#include <fstream>
#include "data_reader.hh"



namespace gameid
{

class FileReader : public DataReader
{
public:
    FileReader(const std::filesystem::path &file_path);
    FileReader(std::fstream &fs);

    uint64_t size() const override;

protected:
    void readData(uint8_t *data, uint64_t offset, uint64_t size) const override;

private:
    std::fstream &_fs;
    std::fstream _fsProxy;

    uint64_t _size;


    void establishSize();
};

}
