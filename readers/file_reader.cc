#include <cstdint>
#include <filesystem>
#include <fstream>
#include "file_reader.hh"
#include "utils/throw_line.hh"



namespace gameid
{

FileReader::FileReader(const std::filesystem::path &file_path)
    : _fs(_fsProxy)
    , _size(0)
{
    _fs.open(file_path, std::fstream::in | std::fstream::binary);
    if(!_fs.is_open())
        throw_line("unable to open file ({})", file_path.filename().string());

    establishSize();
}


FileReader::FileReader(std::fstream &fs)
    : _fs(fs)
    , _size(0)
{
    establishSize();
}


uint64_t FileReader::size() const
{
    return _size;
}


void FileReader::readData(uint8_t *data, uint64_t offset, uint64_t size) const
{
    _fs.seekg(offset);
    if(_fs.fail())
    {
        _fs.clear();
        throw_line("seek failed (offset: 0x{:X})", offset);
    }

    _fs.read((char *)data, size);
    if(_fs.fail())
    {
        _fs.clear();
        throw_line("read failed (offset: 0x{:X}, size: 0x{:X})", offset, size);
    }
}


void FileReader::establishSize()
{
    _fs.seekg(0, std::fstream::end);
    if(_fs.fail())
        throw_line("seek failed");

    _size = (uint64_t)_fs.tellg();
}

}
