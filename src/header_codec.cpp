// ============================================================================
//  File: src/header_codec.cpp — En-tête 64 o + vérification CRC32 fichier
// ============================================================================

#include "pxld/header_codec.hpp"
#include "pxld/crc32.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace pxld
{

const char* format_error_name(FormatError e)
{
    switch(e)
    {
    case FormatError::None:
        return "None";
    case FormatError::BadMagic:
        return "BadMagic";
    case FormatError::UnsupportedVersion:
        return "UnsupportedVersion";
    case FormatError::StructuralMismatch:
        return "StructuralMismatch";
    case FormatError::ChecksumMismatch:
        return "ChecksumMismatch";
    case FormatError::TruncatedFile:
        return "TruncatedFile";
    case FormatError::SizeMismatch:
        return "SizeMismatch";
    case FormatError::OutOfRange:
        return "OutOfRange";
    case FormatError::IndexCorruption:
        return "IndexCorruption";
    case FormatError::SlaveRangeOverflow:
        return "SlaveRangeOverflow";
    case FormatError::SlaveRangeOverlap:
        return "SlaveRangeOverlap";
    case FormatError::UnknownSlave:
        return "UnknownSlave";
    case FormatError::DuplicateSlaveId:
        return "DuplicateSlaveId";
    case FormatError::MisalignedSlaveData:
        return "MisalignedSlaveData";
    case FormatError::IoError:
        return "IoError";
    case FormatError::ConfigInvalid:
        return "ConfigInvalid";
    }
    return "Unknown";
}

std::string PxldError::message() const
{
    std::string s = format_error_name(code);
    if(!detail.empty()) s += ": " + detail;
    return s;
}

bool FileHeader::operator==(const FileHeader& o) const
{
    return major_version==o.major_version && minor_version==o.minor_version &&
           fps==o.fps && total_slaves==o.total_slaves && total_frames==o.total_frames &&
           total_pixels==o.total_pixels && frame_header_size==o.frame_header_size &&
           slave_entry_size==o.slave_entry_size && udp_port==o.udp_port &&
           file_crc32==o.file_crc32 && checksum_type==o.checksum_type && reserved==o.reserved;
}

// =============================== Header =====================================

bool decode_header(const uint8_t* p, size_t n, FileHeader& out, PxldError* err)
{
    if(n < kHeaderSize)
        return fail(err, FormatError::TruncatedFile,
                    "header needs 64 bytes, got " + std::to_string(n));
    if(std::memcmp(p, kMagic, 4) != 0)
        return fail(err, FormatError::BadMagic, "magic is not PXLD");

    FileHeader h{};
    h.major_version = p[4];
    h.minor_version = p[5];
    if(h.major_version != kMajorVersion)
        return fail(err, FormatError::UnsupportedVersion,
                    "major version " + std::to_string(h.major_version) + " (expected 3)");
    h.fps               = p[6];
    h.total_slaves      = get_le16(p+7);
    h.total_frames      = get_le32(p+9);
    h.total_pixels      = get_le32(p+13);
    h.frame_header_size = get_le16(p+17);
    h.slave_entry_size  = get_le16(p+19);
    h.udp_port          = get_le16(p+21);
    h.file_crc32        = get_le32(p+kChecksumOffset);
    h.checksum_type     = p[kChecksumTypeOffset];
    std::memcpy(h.reserved.data(), p+28, kHeaderReserved);

    if(h.frame_header_size != kFrameHeaderSize || h.slave_entry_size != kSlaveEntrySize)
        return fail(err, FormatError::StructuralMismatch,
                    "frame_header_size=" + std::to_string(h.frame_header_size) +
                    " slave_entry_size=" + std::to_string(h.slave_entry_size) + " (expected 32/24)");
    if(h.checksum_type > (uint8_t)ChecksumType::Crc32)
        return fail(err, FormatError::StructuralMismatch,
                    "checksum_type " + std::to_string(h.checksum_type));
    out = h;
    return true;
}

void encode_header(const FileHeader& h, uint8_t out[kHeaderSize])
{
    std::memset(out, 0, kHeaderSize);
    std::memcpy(out, kMagic, 4);
    out[4] = h.major_version;
    out[5] = h.minor_version;
    out[6] = h.fps;
    put_le16(out+7,  h.total_slaves);
    put_le32(out+9,  h.total_frames);
    put_le32(out+13, h.total_pixels);
    put_le16(out+17, h.frame_header_size);
    put_le16(out+19, h.slave_entry_size);
    put_le16(out+21, h.udp_port);
    put_le32(out+kChecksumOffset, h.file_crc32);
    out[kChecksumTypeOffset] = h.checksum_type;
    // reserved[28..64) : zéro
}

std::vector<uint8_t> encode_header(const FileHeader& h)
{
    std::vector<uint8_t> v(kHeaderSize);
    encode_header(h, v.data());
    return v;
}

// =============================== Checksum ===================================

uint32_t compute_file_checksum(const uint8_t* file, size_t n)
{
    if(n <= kChecksumTypeOffset) return crc32(nullptr, 0);
    return crc32(file + kChecksumTypeOffset, n - kChecksumTypeOffset);
}

bool compute_file_checksum(const ByteSource& src, uint32_t& out, PxldError* err)
{
    const uint64_t total = src.size();
    if(total <= kChecksumTypeOffset)
        return fail(err, FormatError::TruncatedFile, "file shorter than checksum range");
    std::vector<uint8_t> buf(64*1024);
    uint32_t st = crc32_begin();
    uint64_t pos = kChecksumTypeOffset;
    while(pos < total)
    {
        size_t n = (size_t)std::min<uint64_t>(buf.size(), total - pos);
        if(!src.read_at(pos, buf.data(), n, err)) return false;
        st = crc32_update(st, buf.data(), n);
        pos += n;
    }
    out = crc32_end(st);
    return true;
}

static bool compare_crc(uint32_t stored, uint32_t computed, PxldError* err)
{
    if(stored == computed) return true;
    char msg[96];
    std::snprintf(msg, sizeof(msg), "stored 0x%08X, computed 0x%08X", stored, computed);
    return fail(err, FormatError::ChecksumMismatch, msg);
}

bool verify_checksum(const uint8_t* file, size_t n, PxldError* err)
{
    if(n < kHeaderSize)
        return fail(err, FormatError::TruncatedFile, "file shorter than header");
    if(file[kChecksumTypeOffset] == (uint8_t)ChecksumType::None) return true;
    return compare_crc(get_le32(file+kChecksumOffset), compute_file_checksum(file, n), err);
}

bool verify_checksum(const ByteSource& src, const FileHeader& h, PxldError* err)
{
    if(h.checksum_type == (uint8_t)ChecksumType::None) return true;
    uint32_t c = 0;
    if(!compute_file_checksum(src, c, err)) return false;
    return compare_crc(h.file_crc32, c, err);
}

} // namespace pxld
