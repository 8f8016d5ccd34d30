// ============================================================================
//  File: src/frame_codec.cpp — FrameHeader / SlaveEntry / Frame
// ============================================================================

#include "pxld/frame_codec.hpp"

#include <algorithm>
#include <cstring>
#include <set>
#include <utility>

namespace pxld
{

// ========================== Enregistrements fixes ===========================

void decode_frame_header(const uint8_t p[kFrameHeaderSize], FrameHeader& out)
{
    out.frame_id         = get_le32(p);
    out.flags            = get_le16(p+4);
    out.slave_table_size = get_le32(p+8);
    out.pixel_data_size  = get_le32(p+12);
}

void encode_frame_header(const FrameHeader& h, uint8_t out[kFrameHeaderSize])
{
    std::memset(out, 0, kFrameHeaderSize);
    put_le32(out,    h.frame_id);
    put_le16(out+4,  h.flags);
    put_le32(out+8,  h.slave_table_size);
    put_le32(out+12, h.pixel_data_size);
}

void decode_slave_entry(const uint8_t p[kSlaveEntrySize], SlaveEntry& out)
{
    out.slave_id      = p[0];
    out.flags         = p[1];
    out.channel_start = get_le16(p+2);
    out.channel_count = get_le16(p+4);
    out.pixel_count   = get_le16(p+6);
    out.data_offset   = get_le32(p+8);
    out.data_length   = get_le32(p+12);
}

void encode_slave_entry(const SlaveEntry& e, uint8_t out[kSlaveEntrySize])
{
    std::memset(out, 0, kSlaveEntrySize);
    out[0] = e.slave_id;
    out[1] = e.flags;
    put_le16(out+2,  e.channel_start);
    put_le16(out+4,  e.channel_count);
    put_le16(out+6,  e.pixel_count);
    put_le32(out+8,  e.data_offset);
    put_le32(out+12, e.data_length);
}

// ============================== Validation ==================================

bool validate_slave_table(const std::vector<SlaveEntry>& slaves, uint32_t pixel_data_size, PxldError* err)
{
    std::set<uint8_t> seen;
    for(const SlaveEntry& e : slaves)
    {
        if(!seen.insert(e.slave_id).second)
            return fail(err, FormatError::DuplicateSlaveId,
                        "slave_id " + std::to_string(e.slave_id) + " appears twice");
        if(e.data_end() > pixel_data_size)
            return fail(err, FormatError::SlaveRangeOverflow,
                        "slave " + std::to_string(e.slave_id) + " range [" + std::to_string(e.data_offset) +
                        "," + std::to_string(e.data_end()) + ") exceeds pixel_data_size " +
                        std::to_string(pixel_data_size));
    }

    // Un seul propriétaire par octet : tri par offset puis voisins.
    std::vector<const SlaveEntry*> order;
    for(const SlaveEntry& e : slaves) if(e.data_length) order.push_back(&e);
    std::sort(order.begin(), order.end(), [](const SlaveEntry* a, const SlaveEntry* b)
    {
        return a->data_offset < b->data_offset;
    });
    for(size_t i=1; i<order.size(); ++i)
    {
        if(order[i-1]->data_end() > order[i]->data_offset)
            return fail(err, FormatError::SlaveRangeOverlap,
                        "slaves " + std::to_string(order[i-1]->slave_id) + " and " +
                        std::to_string(order[i]->slave_id) + " share pixel bytes");
    }
    return true;
}

// ============================= Frame (mémoire) ==============================

static bool decode_body(const uint8_t* table, const uint8_t* pixels, uint16_t total_slaves,
                        const FrameHeader& fh, Frame& out, PxldError* err)
{
    Frame f{};
    f.header = fh;
    f.slaves.resize(total_slaves);
    for(uint16_t i=0; i<total_slaves; ++i) decode_slave_entry(table + (size_t)i*kSlaveEntrySize, f.slaves[i]);
    f.pixels.assign(pixels, pixels + fh.pixel_data_size);
    if(!validate_slave_table(f.slaves, fh.pixel_data_size, err)) return false;
    out = std::move(f);
    return true;
}

bool decode_frame_bytes(const uint8_t* p, size_t n, uint16_t total_slaves, uint32_t expected_id,
                        Frame& out, PxldError* err)
{
    if(n < kFrameHeaderSize) return fail(err, FormatError::TruncatedFile, "frame header truncated");
    FrameHeader fh{};
    decode_frame_header(p, fh);
    if(fh.frame_id != expected_id)
        return fail(err, FormatError::IndexCorruption,
                    "frame_id " + std::to_string(fh.frame_id) + " found, expected " + std::to_string(expected_id));
    if(fh.slave_table_size != (uint32_t)total_slaves*kSlaveEntrySize)
        return fail(err, FormatError::SizeMismatch,
                    "slave_table_size=" + std::to_string(fh.slave_table_size));
    const uint64_t need = (uint64_t)kFrameHeaderSize + fh.slave_table_size + fh.pixel_data_size;
    if(n < need) return fail(err, FormatError::TruncatedFile, "frame body truncated");
    const uint8_t* table = p + kFrameHeaderSize;
    return decode_body(table, table + fh.slave_table_size, total_slaves, fh, out, err);
}

void encode_frame(const Frame& f, std::vector<uint8_t>& out)
{
    FrameHeader fh = f.header;
    fh.slave_table_size = (uint32_t)(f.slaves.size()*kSlaveEntrySize);
    fh.pixel_data_size  = (uint32_t)f.pixels.size();

    const size_t base = out.size();
    out.resize(base + kFrameHeaderSize + fh.slave_table_size + fh.pixel_data_size);
    uint8_t* p = out.data() + base;
    encode_frame_header(fh, p);
    p += kFrameHeaderSize;
    for(const SlaveEntry& e : f.slaves)
    {
        encode_slave_entry(e, p);
        p += kSlaveEntrySize;
    }
    if(!f.pixels.empty()) std::memcpy(p, f.pixels.data(), f.pixels.size());
}

std::vector<uint8_t> encode_frame(const Frame& f)
{
    std::vector<uint8_t> out;
    encode_frame(f, out);
    return out;
}

// ============================ Frame (fichier) ===============================

bool decode_frame(const ByteSource& src, const FileHeader& h, const FrameIndex& index,
                  uint32_t frame_id, Frame& out, PxldError* err)
{
    if(frame_id >= h.total_frames || frame_id >= index.size())
        return fail(err, FormatError::OutOfRange,
                    "frame " + std::to_string(frame_id) + " not in [0," + std::to_string(h.total_frames) + ")");

    const uint64_t pos = index[frame_id];
    uint8_t hb[kFrameHeaderSize];
    if(!src.read_at(pos, hb, sizeof(hb), err)) return false;
    FrameHeader fh{};
    decode_frame_header(hb, fh);
    if(fh.frame_id != frame_id)
        return fail(err, FormatError::IndexCorruption,
                    "offset " + std::to_string(pos) + " holds frame_id " + std::to_string(fh.frame_id) +
                    ", expected " + std::to_string(frame_id));
    if(fh.slave_table_size != (uint32_t)h.total_slaves*kSlaveEntrySize)
        return fail(err, FormatError::SizeMismatch,
                    "frame " + std::to_string(frame_id) + " slave_table_size=" + std::to_string(fh.slave_table_size));

    // l’étendue déclarée doit tenir dans la source avant toute allocation
    // (l’index peut venir d’un sidecar périmé)
    const uint64_t body_len = (uint64_t)fh.slave_table_size + fh.pixel_data_size;
    if(pos + kFrameHeaderSize + body_len > src.size())
        return fail(err, FormatError::TruncatedFile,
                    "frame " + std::to_string(frame_id) + " extends past EOF (" +
                    std::to_string(pos + kFrameHeaderSize + body_len) + " > " +
                    std::to_string(src.size()) + ")");

    std::vector<uint8_t> body((size_t)body_len);
    if(!body.empty() && !src.read_at(pos + kFrameHeaderSize, body.data(), body.size(), err)) return false;
    return decode_body(body.data(), body.data() + fh.slave_table_size, h.total_slaves, fh, out, err);
}

} // namespace pxld
