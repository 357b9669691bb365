#pragma once



#include <algorithm>
#include <array>
#include <climits>
#include <cstdint>
#include <cstdlib>



namespace gameid
{

template<typename T>
T endian_swap(const T &v)
{
    union U
    {
        T v;
        std::array<uint8_t, sizeof(T)> raw;
    } src, dst;

    src.v = v;
    std::reverse_copy(src.raw.begin(), src.raw.end(), dst.raw.begin());
    return dst.v;
}


template<>
inline uint16_t endian_swap<uint16_t>(const uint16_t &v)
{
#ifdef _MSC_VER
    return _byteswap_ushort(v);
#else
    return __builtin_bswap16(v);
#endif
}


template<>
inline uint32_t endian_swap<uint32_t>(const uint32_t &v)
{
#ifdef _MSC_VER
    return _byteswap_ulong(v);
#else
    return __builtin_bswap32(v);
#endif
}


template<>
inline uint64_t endian_swap<uint64_t>(const uint64_t &v)
{
#ifdef _MSC_VER
    return _byteswap_uint64(v);
#else
    return __builtin_bswap64(v);
#endif
}


// decode unsigned integer from a byte buffer, independent of host byte order
template<typename T>
T decode_uint(const uint8_t *data, bool big_endian)
{
    T v = 0;

    for(size_t i = 0; i < sizeof(T); ++i)
        v |= (T)data[i] << CHAR_BIT * (big_endian ? sizeof(T) - 1 - i : i);

    return v;
}

}
