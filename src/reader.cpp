// ============================================================================
//  File: src/reader.cpp — VerifiedFile / PxldReader
// ============================================================================

#include "pxld/reader.hpp"
#include "pxld/header_codec.hpp"

#include <utility>

namespace pxld
{

static bool verify_source(const ByteSource& src, FileHeader& h, PxldError* err)
{
    uint8_t hb[kHeaderSize];
    if(src.size() < kHeaderSize)
        return fail(err, FormatError::TruncatedFile,
                    "file has " + std::to_string(src.size()) + " bytes, header needs 64");
    if(!src.read_at(0, hb, sizeof(hb), err)) return false;
    if(!decode_header(hb, sizeof(hb), h, err)) return false;
    return verify_checksum(src, h, err);
}

bool open_verified(const ByteSource& src, VerifiedFile& out, PxldError* err)
{
    VerifiedFile vf;
    if(!verify_source(src, vf.header, err)) return false;
    if(!build_frame_index(src, vf.header, vf.index, err)) return false;
    out = std::move(vf);
    return true;
}

bool PxldReader::open(const std::string& path, PxldError* err)
{
    return open(path, OpenOptions{}, err);
}

bool PxldReader::open(const std::string& path, const OpenOptions& opt, PxldError* err)
{
    close();
    if(!src_.open(path, err)) return false;

    VerifiedFile vf;
    if(!verify_source(src_, vf.header, err))
    {
        close();
        return false;
    }

    const std::string idx_path = opt.index_path.empty()? index_sidecar_path(path) : opt.index_path;
    bool from_sidecar = false;
    if(opt.use_index_sidecar)
    {
        // Sidecar absent ou périmé : on reconstruit, sans erreur.
        from_sidecar = read_index_sidecar(idx_path, vf.header, src_.size(), vf.index, nullptr) &&
                       check_index_tail(src_, vf.header, vf.index, nullptr);
        if(!from_sidecar) vf.index = FrameIndex{};
    }
    if(!from_sidecar && !build_frame_index(src_, vf.header, vf.index, err))
    {
        close();
        return false;
    }
    if(opt.write_index_sidecar && !from_sidecar &&
       !write_index_sidecar(idx_path, vf.header, src_.size(), vf.index, err))
    {
        close();
        return false;
    }
    vf_ = std::move(vf);
    index_from_sidecar_ = from_sidecar;
    return true;
}

void PxldReader::close()
{
    src_.close();
    vf_ = VerifiedFile{};
    index_from_sidecar_ = false;
}

bool PxldReader::read_frame(uint32_t frame_id, Frame& out, PxldError* err) const
{
    if(!is_open()) return fail(err, FormatError::IoError, "reader not open");
    return decode_frame(src_, vf_.header, vf_.index, frame_id, out, err);
}

} // namespace pxld
