// ============================================================================
//  File: include/pxld/format.hpp — Types de base du conteneur PXLD v3 (DOC+)
//  Project: PXLD v3 LED frame container
//
//  RÔLE
//  -----
//  • Constantes normatives du format (.pxld v3) : tailles fixes, magic, version.
//  • Types métier : FileHeader, FrameHeader, SlaveEntry, Frame, PixelRecord.
//  • Taxonomie d’erreurs FormatError + PxldError (code + détail lisible).
//  • Helpers little-endian (lecture/écriture brute, sans dépendre de l’ABI).
//
//  FORMAT (little-endian, non signé)
//  ---------------------------------
//  • FileHeader 64 o :
//      magic[4]="PXLD", u8 major=3, u8 minor, u8 fps, u16 total_slaves,
//      u32 total_frames, u32 total_pixels, u16 frame_header_size=32,
//      u16 slave_entry_size=24, u16 udp_port, u32 file_crc32,
//      u8 checksum_type (0=none, 1=crc32), reserved[36]
//  • Frame : FrameHeader 32 o | SlaveEntry[total_slaves] (24 o) | pixels RGBW
//  • FrameHeader 32 o :
//      u32 frame_id, u16 flags, u16 reserved, u32 slave_table_size,
//      u32 pixel_data_size, reserved[16]
//  • SlaveEntry 24 o :
//      u8 slave_id, u8 flags, u16 channel_start (1-based), u16 channel_count,
//      u16 pixel_count, u32 data_offset, u32 data_length, reserved[8]
//
//  NOTES
//  -----
//  • Le timestamp n’est jamais stocké : frame_id*1000/fps (ms).
//  • Le CRC32 couvre [27, EOF) : il exclut le champ CRC lui-même [23,27).
// ============================================================================

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace pxld
{

// =============================== Constantes =================================

constexpr size_t   kHeaderSize        = 64;
constexpr size_t   kFrameHeaderSize   = 32;
constexpr size_t   kSlaveEntrySize    = 24;
constexpr size_t   kBytesPerLed       = 4;   // RGBW fixe
constexpr uint8_t  kMajorVersion      = 3;
constexpr uint8_t  kMinorVersion      = 0;
constexpr uint16_t kDefaultUdpPort    = 4050;
constexpr size_t   kChecksumOffset    = 23;  // u32 file_crc32
constexpr size_t   kChecksumTypeOffset= 27;  // début de la plage CRC
constexpr size_t   kHeaderReserved    = 36;
constexpr size_t   kFrameReserved     = 16;
constexpr size_t   kSlaveReserved     = 8;
constexpr char     kMagic[4]          = {'P','X','L','D'};

enum class ChecksumType : uint8_t { None=0, Crc32=1 };

// ================================ Erreurs ===================================

enum class FormatError : uint8_t
{
    None = 0,
    BadMagic,
    UnsupportedVersion,
    StructuralMismatch,
    ChecksumMismatch,
    TruncatedFile,
    SizeMismatch,
    OutOfRange,
    IndexCorruption,
    SlaveRangeOverflow,
    SlaveRangeOverlap,
    UnknownSlave,
    DuplicateSlaveId,
    MisalignedSlaveData,
    IoError,
    ConfigInvalid
};

const char* format_error_name(FormatError e);

struct PxldError
{
    FormatError code = FormatError::None;
    std::string detail;

    bool ok() const { return code==FormatError::None; }
    std::string message() const;
};

// Renseigne *err (si non nul) et retourne false : usage `return fail(err, ...)`.
inline bool fail(PxldError* err, FormatError code, const std::string& detail)
{
    if(err)
    {
        err->code = code;
        err->detail = detail;
    }
    return false;
}

// ============================== Types métier ================================

struct FileHeader
{
    uint8_t  major_version = kMajorVersion;
    uint8_t  minor_version = kMinorVersion;
    uint8_t  fps = 0;
    uint16_t total_slaves = 0;
    uint32_t total_frames = 0;
    uint32_t total_pixels = 0;
    uint16_t frame_header_size = (uint16_t)kFrameHeaderSize;
    uint16_t slave_entry_size = (uint16_t)kSlaveEntrySize;
    uint16_t udp_port = kDefaultUdpPort;
    uint32_t file_crc32 = 0;
    uint8_t  checksum_type = (uint8_t)ChecksumType::Crc32;
    std::array<uint8_t, kHeaderReserved> reserved{}; // conservé en lecture, 0 en écriture

    bool operator==(const FileHeader& o) const;
    bool operator!=(const FileHeader& o) const { return !(*this==o); }
};

struct FrameHeader
{
    uint32_t frame_id = 0;
    uint16_t flags = 0;
    uint32_t slave_table_size = 0;
    uint32_t pixel_data_size = 0;

    bool operator==(const FrameHeader& o) const
    {
        return frame_id==o.frame_id && flags==o.flags &&
               slave_table_size==o.slave_table_size && pixel_data_size==o.pixel_data_size;
    }
};

struct SlaveEntry
{
    uint8_t  slave_id = 0;
    uint8_t  flags = 0;
    uint16_t channel_start = 1;  // 1-based
    uint16_t channel_count = 0;
    uint16_t pixel_count = 0;
    uint32_t data_offset = 0;    // dans le buffer pixels de la frame
    uint32_t data_length = 0;

    uint64_t data_end() const { return (uint64_t)data_offset + data_length; }

    bool operator==(const SlaveEntry& o) const
    {
        return slave_id==o.slave_id && flags==o.flags && channel_start==o.channel_start &&
               channel_count==o.channel_count && pixel_count==o.pixel_count &&
               data_offset==o.data_offset && data_length==o.data_length;
    }
};

struct PixelRecord
{
    uint8_t r=0, g=0, b=0, w=0;

    bool operator==(const PixelRecord& o) const { return r==o.r && g==o.g && b==o.b && w==o.w; }
    bool operator!=(const PixelRecord& o) const { return !(*this==o); }
};

// Une frame décodée : la table d’esclaves ne possède pas d’octets, ce sont
// des vues (offset, longueur) dans `pixels`.
struct Frame
{
    FrameHeader header;
    std::vector<SlaveEntry> slaves;
    std::vector<uint8_t> pixels;

    bool operator==(const Frame& o) const
    {
        return header==o.header && slaves==o.slaves && pixels==o.pixels;
    }
};

// Timestamp dérivé (jamais persisté). fps==0 → 0.
inline double frame_timestamp_ms(uint32_t frame_id, uint8_t fps)
{
    return fps? (double)frame_id * 1000.0 / (double)fps : 0.0;
}

// ========================== Helpers little-endian ===========================

inline uint16_t get_le16(const uint8_t* p)
{
    return (uint16_t)(p[0] | (p[1]<<8));
}
inline uint32_t get_le32(const uint8_t* p)
{
    return (uint32_t)p[0] | ((uint32_t)p[1]<<8) | ((uint32_t)p[2]<<16) | ((uint32_t)p[3]<<24);
}
inline uint64_t get_le64(const uint8_t* p)
{
    return (uint64_t)get_le32(p) | ((uint64_t)get_le32(p+4)<<32);
}
inline void put_le16(uint8_t* p, uint16_t v)
{
    p[0]=(uint8_t)(v & 0xFFu);
    p[1]=(uint8_t)(v>>8);
}
inline void put_le32(uint8_t* p, uint32_t v)
{
    p[0]=(uint8_t)(v & 0xFFu);
    p[1]=(uint8_t)((v>>8) & 0xFFu);
    p[2]=(uint8_t)((v>>16) & 0xFFu);
    p[3]=(uint8_t)(v>>24);
}
inline void put_le64(uint8_t* p, uint64_t v)
{
    put_le32(p, (uint32_t)(v & 0xFFFFFFFFu));
    put_le32(p+4, (uint32_t)(v>>32));
}

} // namespace pxld
