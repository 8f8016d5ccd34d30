// ============================================================================
//  File: src/slave_slice.cpp — Tranches par esclave
// ============================================================================

#include "pxld/slave_slice.hpp"

namespace pxld
{

const SlaveEntry* find_slave(const Frame& f, uint8_t slave_id)
{
    for(const SlaveEntry& e : f.slaves)
    {
        if(e.slave_id == slave_id) return &e;
    }
    return nullptr;
}

bool slice(const Frame& f, uint8_t slave_id, SlaveSlice& out, PxldError* err)
{
    const SlaveEntry* e = find_slave(f, slave_id);
    if(!e)
        return fail(err, FormatError::UnknownSlave,
                    "slave " + std::to_string(slave_id) + " not in frame " + std::to_string(f.header.frame_id));
    if(e->data_length % kBytesPerLed)
        return fail(err, FormatError::MisalignedSlaveData,
                    "slave " + std::to_string(slave_id) + " data_length " + std::to_string(e->data_length));
    if(e->data_end() > f.pixels.size())
        return fail(err, FormatError::SlaveRangeOverflow,
                    "slave " + std::to_string(slave_id) + " exceeds pixel buffer");
    out.data = f.pixels.data() + e->data_offset;
    out.size = e->data_length;
    return true;
}

bool slave_pixels(const Frame& f, uint8_t slave_id, std::vector<PixelRecord>& out, PxldError* err)
{
    SlaveSlice s;
    if(!slice(f, slave_id, s, err)) return false;
    out.resize(s.led_count());
    for(size_t i=0; i<out.size(); ++i) out[i] = s.led(i);
    return true;
}

} // namespace pxld
