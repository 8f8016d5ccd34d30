// ============================================================================
//  File: include/pxld/writer.hpp — Authoring .pxld v3 (DOC+)
//  Project: PXLD v3 LED frame container
//
//  OBJET
//  -----
//  • Table d’esclaves fixe (identique pour toutes les frames) : channel_start
//    1-based cumulatif, offsets contigus dans le buffer pixels.
//  • PxldWriter : écrivain unique, ajout des frames dans l’ordre (frame_id
//    séquentiel), CRC32 [27, EOF) calculé au fil de l’eau puis patché à
//    l’offset 23 par finalize(), avec total_frames (offset 9).
//  • encode_file : même chose en mémoire (tests, petits fichiers).
//
//  GARDE-FOUS
//  ----------
//  • Buffer pixels de taille != somme des data_length → SizeMismatch.
//  • channel_start / channel_count / pixel_count au-delà de u16 → SizeMismatch.
// ============================================================================

#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "pxld/format.hpp"
#include "pxld/slave_config.hpp"

namespace pxld
{

struct SlaveLayout
{
    uint8_t  slave_id = 0;
    uint32_t pixel_count = 0;
};

bool make_slave_table(const std::vector<SlaveLayout>& layout, std::vector<SlaveEntry>& out,
                      PxldError* err = nullptr);
bool make_slave_table(const SlaveConfigSet& cfg, std::vector<SlaveEntry>& out,
                      PxldError* err = nullptr);

// Taille du buffer pixels impliquée par une table contiguë.
uint32_t table_pixel_bytes(const std::vector<SlaveEntry>& table);

struct WriterOptions
{
    uint8_t      fps = 40;
    uint16_t     udp_port = kDefaultUdpPort;
    uint8_t      minor_version = kMinorVersion;
    ChecksumType checksum = ChecksumType::Crc32;
};

class PxldWriter
{
public:
    PxldWriter() = default;
    ~PxldWriter();
    PxldWriter(const PxldWriter&) = delete;
    PxldWriter& operator=(const PxldWriter&) = delete;

    bool open(const std::string& path, const WriterOptions& opt, const std::vector<SlaveEntry>& table,
              PxldError* err = nullptr);
    bool write_frame(const std::vector<uint8_t>& pixels, PxldError* err = nullptr);
    bool finalize(PxldError* err = nullptr);

    uint32_t frames_written() const { return header_.total_frames; }
    uint32_t pixel_bytes_per_frame() const { return pixel_bytes_; }
    const FileHeader& header() const { return header_; }

private:
    bool write_raw(const void* p, size_t n, PxldError* err);

    FILE* f_ = nullptr;
    std::string path_;
    FileHeader header_;
    std::vector<SlaveEntry> table_;
    uint32_t pixel_bytes_ = 0;
    uint32_t crc_state_ = 0;
    std::vector<uint8_t> scratch_;
};

// Fichier complet en mémoire. Les frame_id sont réécrits (0..n-1), les champs
// total_frames / total_slaves / file_crc32 sont recalculés.
bool encode_file(const FileHeader& h, const std::vector<Frame>& frames, std::vector<uint8_t>& out,
                 PxldError* err = nullptr);

} // namespace pxld
