#include <cstring>
#include <fstream>
#include <string>
#include <vector>
#include <zlib.h>
#include "gzip_reader.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"



namespace gameid
{

namespace
{

constexpr uint32_t CHUNK_SIZE = 1024 * 1024;
// gzip header only, zlib streams are not images
constexpr int GZIP_WINDOW_BITS = MAX_WBITS + 16;

}


GzipReader::GzipReader(const std::filesystem::path &file_path)
{
    std::fstream fs(file_path, std::fstream::in | std::fstream::binary);
    if(!fs.is_open())
        throw_line("unable to open file ({})", file_path.filename().string());

    z_stream stream;
    memset(&stream, 0, sizeof(stream));
    if(inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK)
        throw_line("zlib initialization failed");

    std::vector<uint8_t> in(CHUNK_SIZE);
    std::vector<uint8_t> out(CHUNK_SIZE);

    int status = Z_OK;
    bool empty = true;
    while(fs)
    {
        fs.read((char *)in.data(), in.size());
        stream.next_in = in.data();
        stream.avail_in = (uInt)fs.gcount();
        if(!stream.avail_in)
            break;
        empty = false;

        // full output buffer means zlib may hold more
        do
        {
            // concatenated members
            if(status == Z_STREAM_END)
            {
                if(!stream.avail_in)
                    break;
                inflateReset(&stream);
            }

            stream.next_out = out.data();
            stream.avail_out = (uInt)out.size();
            status = inflate(&stream, Z_NO_FLUSH);
            // no progress possible until more input arrives
            if(status == Z_BUF_ERROR)
            {
                status = Z_OK;
                break;
            }
            if(status != Z_OK && status != Z_STREAM_END)
            {
                std::string message(stream.msg ? stream.msg : "unknown error");
                inflateEnd(&stream);
                throw_line("gzip decompression failed ({}: {})", file_path.filename().string(), message);
            }

            _data.insert(_data.end(), out.data(), out.data() + (out.size() - stream.avail_out));
        }
        while(stream.avail_in || !stream.avail_out);
    }
    inflateEnd(&stream);

    if(empty || status != Z_STREAM_END)
        throw_line("gzip stream is incomplete ({})", file_path.filename().string());
}


uint64_t GzipReader::size() const
{
    return _data.size();
}


void GzipReader::readData(uint8_t *data, uint64_t offset, uint64_t size) const
{
    memcpy(data, _data.data() + offset, size);
}


bool is_gzip_path(const std::filesystem::path &path)
{
    return str_uppercase(path.extension().string()) == ".GZ";
}

}
