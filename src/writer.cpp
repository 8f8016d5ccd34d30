// ============================================================================
//  File: src/writer.cpp — PxldWriter / encode_file
// ============================================================================

#include "pxld/writer.hpp"
#include "pxld/crc32.hpp"
#include "pxld/frame_codec.hpp"
#include "pxld/header_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace pxld
{

// ============================ Table d’esclaves ==============================

bool make_slave_table(const std::vector<SlaveLayout>& layout, std::vector<SlaveEntry>& out, PxldError* err)
{
    std::vector<SlaveEntry> table;
    uint64_t channel = 1;
    uint64_t offset = 0;
    for(const SlaveLayout& s : layout)
    {
        const uint64_t channels = (uint64_t)s.pixel_count * kBytesPerLed;
        if(s.pixel_count > 0xFFFFu || channels > 0xFFFFu || channel > 0xFFFFu)
            return fail(err, FormatError::SizeMismatch,
                        "slave " + std::to_string(s.slave_id) + ": " + std::to_string(s.pixel_count) +
                        " LEDs do not fit the 16-bit channel fields");
        SlaveEntry e{};
        e.slave_id      = s.slave_id;
        e.channel_start = (uint16_t)channel;
        e.channel_count = (uint16_t)channels;
        e.pixel_count   = (uint16_t)s.pixel_count;
        e.data_offset   = (uint32_t)offset;
        e.data_length   = (uint32_t)channels;
        table.push_back(e);
        channel += channels;
        offset  += channels;
    }
    if(offset > 0xFFFFFFFFu) return fail(err, FormatError::SizeMismatch, "pixel buffer exceeds 4 GiB");
    if(!validate_slave_table(table, (uint32_t)offset, err)) return false;
    out.swap(table);
    return true;
}

bool make_slave_table(const SlaveConfigSet& cfg, std::vector<SlaveEntry>& out, PxldError* err)
{
    std::vector<SlaveLayout> layout;
    for(const SlaveConfig& s : cfg.slaves) layout.push_back({s.slave_id, s.pixel_count()});
    return make_slave_table(layout, out, err);
}

uint32_t table_pixel_bytes(const std::vector<SlaveEntry>& table)
{
    uint64_t end = 0;
    for(const SlaveEntry& e : table) end = std::max<uint64_t>(end, e.data_end());
    return (uint32_t)end;
}

// ================================ Writer ====================================

PxldWriter::~PxldWriter()
{
    if(f_) std::fclose(f_);
}

bool PxldWriter::write_raw(const void* p, size_t n, PxldError* err)
{
    if(n && std::fwrite(p, 1, n, f_) != n)
        return fail(err, FormatError::IoError, path_ + ": write failed");
    return true;
}

bool PxldWriter::open(const std::string& path, const WriterOptions& opt, const std::vector<SlaveEntry>& table,
                      PxldError* err)
{
    if(f_) return fail(err, FormatError::IoError, "writer already open");
    if(table.size() > 0xFFFFu) return fail(err, FormatError::SizeMismatch, "too many slaves");
    const uint32_t pixel_bytes = table_pixel_bytes(table);
    if(!validate_slave_table(table, pixel_bytes, err)) return false;

    f_ = std::fopen(path.c_str(), "wb");
    if(!f_) return fail(err, FormatError::IoError, path + ": " + std::strerror(errno));
    path_ = path;
    table_ = table;
    pixel_bytes_ = pixel_bytes;

    header_ = FileHeader{};
    header_.minor_version = opt.minor_version;
    header_.fps           = opt.fps;
    header_.total_slaves  = (uint16_t)table.size();
    header_.total_frames  = 0;
    header_.udp_port      = opt.udp_port;
    header_.checksum_type = (uint8_t)opt.checksum;
    header_.file_crc32    = 0;
    uint32_t pixels = 0;
    for(const SlaveEntry& e : table) pixels += e.pixel_count;
    header_.total_pixels = pixels;

    uint8_t hb[kHeaderSize];
    encode_header(header_, hb);
    crc_state_ = crc32_update(crc32_begin(), hb + kChecksumTypeOffset, kHeaderSize - kChecksumTypeOffset);
    return write_raw(hb, sizeof(hb), err);
}

bool PxldWriter::write_frame(const std::vector<uint8_t>& pixels, PxldError* err)
{
    if(!f_) return fail(err, FormatError::IoError, "writer not open");
    if(pixels.size() != pixel_bytes_)
        return fail(err, FormatError::SizeMismatch,
                    "frame " + std::to_string(header_.total_frames) + " has " + std::to_string(pixels.size()) +
                    " pixel bytes, layout needs " + std::to_string(pixel_bytes_));
    if(header_.total_frames == 0xFFFFFFFFu) return fail(err, FormatError::SizeMismatch, "frame count overflow");

    Frame f;
    f.header.frame_id = header_.total_frames;
    f.slaves = table_;
    f.pixels = pixels;
    scratch_.clear();
    encode_frame(f, scratch_);
    if(!write_raw(scratch_.data(), scratch_.size(), err)) return false;
    crc_state_ = crc32_update(crc_state_, scratch_.data(), scratch_.size());
    ++header_.total_frames;
    return true;
}

bool PxldWriter::finalize(PxldError* err)
{
    if(!f_) return fail(err, FormatError::IoError, "writer not open");
    header_.file_crc32 = header_.checksum_type==(uint8_t)ChecksumType::Crc32? crc32_end(crc_state_) : 0;

    // total_frames (9) et file_crc32 (23) sont hors plage CRC : simple patch.
    uint8_t hb[kHeaderSize];
    encode_header(header_, hb);
    bool ok = std::fseek(f_, 0, SEEK_SET)==0 && std::fwrite(hb, 1, kChecksumTypeOffset, f_)==kChecksumTypeOffset;
    ok = (std::fclose(f_)==0) && ok;
    f_ = nullptr;
    if(!ok) return fail(err, FormatError::IoError, path_ + ": header patch failed");
    return true;
}

// ============================ Fichier en mémoire ============================

bool encode_file(const FileHeader& h, const std::vector<Frame>& frames, std::vector<uint8_t>& out, PxldError* err)
{
    FileHeader hh = h;
    hh.frame_header_size = (uint16_t)kFrameHeaderSize;
    hh.slave_entry_size  = (uint16_t)kSlaveEntrySize;
    hh.total_frames      = (uint32_t)frames.size();
    if(!frames.empty()) hh.total_slaves = (uint16_t)frames.front().slaves.size();

    std::vector<uint8_t> buf(kHeaderSize);
    for(size_t i=0; i<frames.size(); ++i)
    {
        const Frame& f = frames[i];
        if(f.slaves.size() != hh.total_slaves)
            return fail(err, FormatError::SizeMismatch,
                        "frame " + std::to_string(i) + " has " + std::to_string(f.slaves.size()) + " slaves");
        if(!validate_slave_table(f.slaves, (uint32_t)f.pixels.size(), err)) return false;
        Frame g = f;
        g.header.frame_id = (uint32_t)i;
        encode_frame(g, buf);
    }
    hh.file_crc32 = 0;
    encode_header(hh, buf.data());
    if(hh.checksum_type == (uint8_t)ChecksumType::Crc32)
    {
        hh.file_crc32 = compute_file_checksum(buf.data(), buf.size());
        put_le32(buf.data() + kChecksumOffset, hh.file_crc32);
    }
    out.swap(buf);
    return true;
}

} // namespace pxld
