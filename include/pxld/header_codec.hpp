// ============================================================================
//  File: include/pxld/header_codec.hpp — FileHeader {encode,decode} + CRC fichier
//  Project: PXLD v3 LED frame container
//
//  API
//  ---
//   bool decode_header(const uint8_t* p, size_t n, FileHeader& out, PxldError* err);
//   void encode_header(const FileHeader& h, uint8_t out[kHeaderSize]);
//   uint32_t compute_file_checksum(const uint8_t* file, size_t n);
//   bool verify_checksum(const uint8_t* file, size_t n, PxldError* err);
//   bool verify_checksum(const ByteSource& src, const FileHeader& h, PxldError* err);
//
//  GARDE-FOUS
//  ----------
//  • decode_header : magic, major==3 (minor toléré), tailles 32/24,
//    checksum_type ∈ {0,1}. Pas d’effet de bord.
//  • Plage CRC : [27, EOF). Le champ [23,27) est exclu (non auto-référent).
//  • checksum_type==0 → vérification toujours réussie.
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "pxld/byte_source.hpp"
#include "pxld/format.hpp"

namespace pxld
{

bool decode_header(const uint8_t* p, size_t n, FileHeader& out, PxldError* err = nullptr);

void encode_header(const FileHeader& h, uint8_t out[kHeaderSize]);
std::vector<uint8_t> encode_header(const FileHeader& h);

// CRC32 sur [27, n). n doit être >= 28.
uint32_t compute_file_checksum(const uint8_t* file, size_t n);

// Idem en flux sur une source (blocs de 64 Kio), sans charger le fichier.
bool compute_file_checksum(const ByteSource& src, uint32_t& out, PxldError* err = nullptr);

// Compare le CRC stocké (offset 23) avec le CRC calculé. ChecksumMismatch si différent.
bool verify_checksum(const uint8_t* file, size_t n, PxldError* err = nullptr);
bool verify_checksum(const ByteSource& src, const FileHeader& h, PxldError* err = nullptr);

} // namespace pxld
