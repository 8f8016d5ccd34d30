// ============================================================================
//  File: src/frame_index.cpp — Index des frames + sidecar .pxldi
// ============================================================================

#include "pxld/frame_index.hpp"
#include "pxld/crc32.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace pxld
{

namespace {

struct File {
    FILE* f=nullptr;
    ~File(){ if(f) std::fclose(f); }
    bool open(const std::string& p, const char* mode){ f=std::fopen(p.c_str(), mode); return f!=nullptr; }
};

} // namespace

bool build_frame_index(const ByteSource& src, const FileHeader& h, FrameIndex& out, PxldError* err)
{
    const uint64_t file_size = src.size();
    const uint64_t expected_table = (uint64_t)h.total_slaves * kSlaveEntrySize;
    std::vector<uint64_t> offs;
    offs.reserve(h.total_frames);

    uint64_t pos = kHeaderSize;
    uint8_t fh[kFrameHeaderSize];
    for(uint32_t i=0; i<h.total_frames; ++i)
    {
        if(pos + kFrameHeaderSize > file_size)
            return fail(err, FormatError::TruncatedFile,
                        "frame " + std::to_string(i) + " header at offset " + std::to_string(pos) + " past EOF");
        if(!src.read_at(pos, fh, sizeof(fh), err)) return false;
        uint32_t sts = get_le32(fh+8);
        uint32_t pds = get_le32(fh+12);
        if(sts != expected_table)
            return fail(err, FormatError::SizeMismatch,
                        "frame " + std::to_string(i) + " slave_table_size=" + std::to_string(sts) +
                        " (expected " + std::to_string(expected_table) + ")");
        uint64_t next = pos + kFrameHeaderSize + sts + pds;
        if(next > file_size)
            return fail(err, FormatError::TruncatedFile,
                        "frame " + std::to_string(i) + " extends past EOF");
        offs.push_back(pos);
        pos = next;
    }
    out.offsets.swap(offs);
    return true;
}

// ============================== Sidecar =====================================

std::string index_sidecar_path(const std::string& pxld_path)
{
    return pxld_path + "i";
}

// Champs d’identité [0,24) ; CRC de la table d’offsets en 24 ; CRC de
// l’en-tête en 28.
static void fill_index_header(uint8_t* p, const FileHeader& h, uint64_t file_size, uint32_t offsets_crc)
{
    std::memset(p, 0, kIndexHeaderSize);
    std::memcpy(p, "PXLI", 4);
    p[4] = kIndexVersion;
    put_le32(p+8,  h.total_frames);
    put_le64(p+12, file_size);
    put_le32(p+20, h.file_crc32);
    put_le32(p+24, offsets_crc);
    put_le32(p+28, crc32(p, kIndexHeaderSize-4));
}

bool write_index_sidecar(const std::string& idx_path, const FileHeader& h, uint64_t file_size,
                         const FrameIndex& index, PxldError* err)
{
    if(index.size() != h.total_frames)
        return fail(err, FormatError::SizeMismatch, "index size differs from total_frames");
    File fp;
    if(!fp.open(idx_path, "wb")) return fail(err, FormatError::IoError, idx_path + ": " + std::strerror(errno));

    std::vector<uint8_t> buf(kIndexHeaderSize + index.size()*8);
    uint8_t* table = buf.data() + kIndexHeaderSize;
    for(size_t i=0; i<index.size(); ++i) put_le64(table + i*8, index[i]);
    fill_index_header(buf.data(), h, file_size, crc32(table, index.size()*8));
    if(std::fwrite(buf.data(), 1, buf.size(), fp.f) != buf.size())
        return fail(err, FormatError::IoError, idx_path + ": write failed");
    return true;
}

bool read_index_sidecar(const std::string& idx_path, const FileHeader& h, uint64_t file_size,
                        FrameIndex& out, PxldError* err)
{
    File fp;
    if(!fp.open(idx_path, "rb")) return fail(err, FormatError::IoError, idx_path + ": " + std::strerror(errno));

    uint8_t hb[kIndexHeaderSize];
    if(std::fread(hb, 1, sizeof(hb), fp.f) != sizeof(hb))
        return fail(err, FormatError::TruncatedFile, idx_path + ": short header");
    if(std::memcmp(hb, "PXLI", 4) != 0 || hb[4] != kIndexVersion)
        return fail(err, FormatError::BadMagic, idx_path + ": not a PXLI v2 sidecar");
    if(crc32(hb, kIndexHeaderSize-4) != get_le32(hb+28))
        return fail(err, FormatError::ChecksumMismatch, idx_path + ": header CRC");

    uint8_t expect[kIndexHeaderSize];
    fill_index_header(expect, h, file_size, 0);
    if(std::memcmp(hb, expect, 24) != 0)
        return fail(err, FormatError::IndexCorruption, idx_path + ": sidecar does not match file");

    std::vector<uint8_t> raw((size_t)h.total_frames*8);
    if(!raw.empty() && std::fread(raw.data(), 1, raw.size(), fp.f) != raw.size())
        return fail(err, FormatError::TruncatedFile, idx_path + ": short offset table");
    if(crc32(raw.data(), raw.size()) != get_le32(hb+24))
        return fail(err, FormatError::ChecksumMismatch, idx_path + ": offset table CRC");

    // chaque frame occupe au moins en-tête + table d’esclaves
    const uint64_t min_stride = kFrameHeaderSize + (uint64_t)h.total_slaves * kSlaveEntrySize;
    std::vector<uint64_t> offs(h.total_frames);
    uint64_t prev = 0;
    for(uint32_t i=0; i<h.total_frames; ++i)
    {
        offs[i] = get_le64(raw.data() + (size_t)i*8);
        bool bad = offs[i] + min_stride > file_size ||
                   (i==0? offs[i]!=kHeaderSize : offs[i] < prev + min_stride);
        if(bad)
            return fail(err, FormatError::IndexCorruption,
                        idx_path + ": offset " + std::to_string(i) + " out of bounds");
        prev = offs[i];
    }
    out.offsets.swap(offs);
    return true;
}

bool check_index_tail(const ByteSource& src, const FileHeader& h, const FrameIndex& index, PxldError* err)
{
    if(index.empty()) return true;
    const size_t last = index.size()-1;
    const uint64_t pos = index[last];
    if(pos + kFrameHeaderSize > src.size())
        return fail(err, FormatError::TruncatedFile, "last frame header past EOF");

    uint8_t fh[kFrameHeaderSize];
    if(!src.read_at(pos, fh, sizeof(fh), err)) return false;
    if(get_le32(fh) != (uint32_t)last)
        return fail(err, FormatError::IndexCorruption,
                    "last index entry holds frame_id " + std::to_string(get_le32(fh)));
    const uint64_t sts = get_le32(fh+8);
    const uint64_t pds = get_le32(fh+12);
    if(sts != (uint64_t)h.total_slaves * kSlaveEntrySize)
        return fail(err, FormatError::SizeMismatch, "last frame slave_table_size=" + std::to_string(sts));
    if(pos + kFrameHeaderSize + sts + pds > src.size())
        return fail(err, FormatError::TruncatedFile, "last frame extends past EOF");
    return true;
}

} // namespace pxld
