// ============================================================================
//  File: include/pxld/crc32.hpp
//  CRC32 (zlib/gzip) : polynôme réfléchi 0xEDB88320, init/xorout 0xFFFFFFFF.
//  Version incrémentale pour calculer la plage [27, EOF) par blocs.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>

namespace pxld
{
namespace crc_detail
{
struct Table
{
    uint32_t v[256];
    Table()
    {
        const uint32_t poly=0xEDB88320u;
        for(uint32_t i=0; i<256; ++i)
        {
            uint32_t c=i;
            for(int j=0; j<8; ++j)
            {
                c = (c&1)? (poly ^ (c>>1)) : (c>>1);
            }
            v[i]=c;
        }
    }
};
inline const Table& table()
{
    static const Table t;
    return t;
}
}

// État incrémental : crc32_begin → crc32_update* → crc32_end.
inline uint32_t crc32_begin()
{
    return 0xFFFFFFFFu;
}
inline uint32_t crc32_update(uint32_t state, const void* data, size_t len)
{
    const uint32_t* t=crc_detail::table().v;
    const uint8_t* p=(const uint8_t*)data;
    for(size_t i=0; i<len; ++i) state = t[(state ^ p[i]) & 0xFFu] ^ (state>>8);
    return state;
}
inline uint32_t crc32_end(uint32_t state)
{
    return state ^ 0xFFFFFFFFu;
}
inline uint32_t crc32(const void* data, size_t len)
{
    return crc32_end(crc32_update(crc32_begin(), data, len));
}

} // namespace pxld
