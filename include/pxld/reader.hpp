// ============================================================================
//  File: include/pxld/reader.hpp — Ouverture vérifiée + accès aléatoire (DOC+)
//  Project: PXLD v3 LED frame container
//
//  TROIS PHASES
//  ------------
//  1. Vérifier : en-tête 64 o puis CRC32 [27, EOF) (une seule passe).
//  2. Indexer  : offsets de frames (ou sidecar .pxldi s’il correspond).
//  3. Servir   : decode_frame(id) sans état partagé, autant de fois que voulu.
//
//  Les phases 1 et 2 produisent une valeur immuable VerifiedFile{header,index}.
//  ChecksumMismatch est fatal : aucun index n’est construit, aucune frame lue.
//
//  CONCURRENCE
//  -----------
//  • Après open(), PxldReader est en lecture seule : read_frame() peut être
//    appelé depuis plusieurs threads (lectures positionnées pread).
// ============================================================================

#pragma once
#include <cstdint>
#include <string>

#include "pxld/byte_source.hpp"
#include "pxld/format.hpp"
#include "pxld/frame_codec.hpp"
#include "pxld/frame_index.hpp"

namespace pxld
{

struct VerifiedFile
{
    FileHeader header;
    FrameIndex index;

    uint32_t frame_count() const { return header.total_frames; }
    double timestamp_ms(uint32_t frame_id) const { return frame_timestamp_ms(frame_id, header.fps); }
};

// Où prendre l’index : passe sur les en-têtes, ou sidecar avec repli.
struct OpenOptions
{
    bool use_index_sidecar = false;
    std::string index_path;        // vide → <fichier>.pxldi
    bool write_index_sidecar = false;
};

// Phases 1+2 sur une source quelconque (index toujours reconstruit).
bool open_verified(const ByteSource& src, VerifiedFile& out, PxldError* err = nullptr);

class PxldReader
{
public:
    bool open(const std::string& path, PxldError* err = nullptr);
    bool open(const std::string& path, const OpenOptions& opt, PxldError* err = nullptr);
    void close();

    bool is_open() const { return src_.is_open(); }
    const std::string& path() const { return src_.path(); }
    const FileHeader& header() const { return vf_.header; }
    const FrameIndex& index() const { return vf_.index; }
    const VerifiedFile& verified() const { return vf_; }
    const ByteSource& source() const { return src_; }
    uint32_t frame_count() const { return vf_.frame_count(); }
    double timestamp_ms(uint32_t frame_id) const { return vf_.timestamp_ms(frame_id); }
    // true si l’index vient du sidecar (diagnostic outils).
    bool index_from_sidecar() const { return index_from_sidecar_; }

    bool read_frame(uint32_t frame_id, Frame& out, PxldError* err = nullptr) const;

private:
    FileSource src_;
    VerifiedFile vf_;
    bool index_from_sidecar_ = false;
};

} // namespace pxld
