// ============================================================================
//  File: include/pxld/frame_index.hpp
//  Index des frames : offset absolu de chaque frame pour accès aléatoire O(1).
//  Construction en une passe, en ne lisant que les FrameHeader (32 o).
//  Sidecar optionnel `.pxldi` pour éviter la passe au prochain open.
// ============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "pxld/byte_source.hpp"
#include "pxld/format.hpp"

namespace pxld
{

struct FrameIndex
{
    std::vector<uint64_t> offsets; // offsets[i] = début de la frame i

    size_t size() const { return offsets.size(); }
    bool empty() const { return offsets.empty(); }
    uint64_t operator[](size_t i) const { return offsets[i]; }
};

// Passe unique depuis l’offset 64. TruncatedFile si un en-tête ou l’étendue
// déclarée d’une frame dépasse EOF ; SizeMismatch si slave_table_size !=
// total_slaves*24.
bool build_frame_index(const ByteSource& src, const FileHeader& h, FrameIndex& out,
                       PxldError* err = nullptr);

// ------------------------------ Sidecar .pxldi ------------------------------
//  magic[4]="PXLI", u8 version=2, u8 reserved[3], u32 frame_count,
//  u64 file_size, u32 file_crc32, u32 offsets_crc32 (CRC de la table),
//  u32 header_crc32 (CRC des champs précédents), u64 offsets[frame_count]
constexpr size_t  kIndexHeaderSize = 32;
constexpr uint8_t kIndexVersion    = 2;

std::string index_sidecar_path(const std::string& pxld_path);

bool write_index_sidecar(const std::string& idx_path, const FileHeader& h, uint64_t file_size,
                         const FrameIndex& index, PxldError* err = nullptr);

// Charge le sidecar s’il correspond au fichier (frame_count, taille, CRC
// stocké, CRC d’en-tête et de table, offsets croissants d’au moins
// 32 + total_slaves*24 et dans le fichier).
bool read_index_sidecar(const std::string& idx_path, const FileHeader& h, uint64_t file_size,
                        FrameIndex& out, PxldError* err = nullptr);

// Relit l’en-tête de la dernière frame indexée : frame_id attendu, table
// d’esclaves cohérente, étendue dans le fichier. Un fichier réécrit à taille
// égale sans checksum garde un sidecar qui « correspond » ; ce contrôle le
// rattrape pour le cas courant, decode_frame borne les autres frames.
bool check_index_tail(const ByteSource& src, const FileHeader& h, const FrameIndex& index,
                      PxldError* err = nullptr);

} // namespace pxld
