// ============================================================================
//  File: include/pxld/frame_codec.hpp — Frame {encode,decode} (DOC+)
//  Project: PXLD v3 LED frame container
//
//  OBJET
//  -----
//  • FrameHeader 32 o, SlaveEntry 24 o : codec octet-exact (little-endian).
//  • decode_frame : frame `id` par offset d’index, lecture positionnée
//    indépendante (sûr en parallèle sur la même source).
//  • encode_frame : inverse exact ; slave_table_size / pixel_data_size
//    recalculés depuis la table et le buffer réels.
//
//  VALIDATIONS (decode)
//  --------------------
//  • id >= total_frames            → OutOfRange (aucune lecture)
//  • frame_id stocké != id         → IndexCorruption
//  • slave_table_size != n*24      → SizeMismatch
//  • offset+length > pixel_size    → SlaveRangeOverflow
//  • slave_id en double            → DuplicateSlaveId
//  • plages [offset,offset+len) qui se chevauchent → SlaveRangeOverlap
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "pxld/byte_source.hpp"
#include "pxld/format.hpp"
#include "pxld/frame_index.hpp"

namespace pxld
{

// --- Enregistrements fixes
void decode_frame_header(const uint8_t p[kFrameHeaderSize], FrameHeader& out);
void encode_frame_header(const FrameHeader& h, uint8_t out[kFrameHeaderSize]);
void decode_slave_entry(const uint8_t p[kSlaveEntrySize], SlaveEntry& out);
void encode_slave_entry(const SlaveEntry& e, uint8_t out[kSlaveEntrySize]);

// Invariants de la table d’esclaves vis-à-vis du buffer pixels.
bool validate_slave_table(const std::vector<SlaveEntry>& slaves, uint32_t pixel_data_size,
                          PxldError* err = nullptr);

// --- Frame complète en mémoire (n >= 32 + table + pixels)
bool decode_frame_bytes(const uint8_t* p, size_t n, uint16_t total_slaves, uint32_t expected_id,
                        Frame& out, PxldError* err = nullptr);

// Ajoute la frame encodée à `out`. Les tailles déclarées sont recalculées.
void encode_frame(const Frame& f, std::vector<uint8_t>& out);
std::vector<uint8_t> encode_frame(const Frame& f);

// --- Frame depuis un fichier indexé
bool decode_frame(const ByteSource& src, const FileHeader& h, const FrameIndex& index,
                  uint32_t frame_id, Frame& out, PxldError* err = nullptr);

} // namespace pxld
