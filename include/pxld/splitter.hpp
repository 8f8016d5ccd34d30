// ============================================================================
//  File: include/pxld/splitter.hpp
//  Séparation par esclave : slave_<id>.bin = concat des tranches RGBW de
//  l’esclave, frame par frame, sur la plage [first, last).
//
//  • split_slaves     : une plage, fichiers dans outdir.
//  • split_segments   : liste de plages, un sous-dossier segment_AAAA_BBBB
//                       par plage (bornes incluses dans le nom).
//  • split_frame_range: une plage découpée en segments de N frames.
//  • verify_bin_file  : contrôle a posteriori d’un .bin (taille multiple de 4,
//                       nombre de LEDs, premières LEDs).
// ============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "pxld/format.hpp"
#include "pxld/reader.hpp"

namespace pxld
{

constexpr uint32_t kSplitToEnd = 0xFFFFFFFFu;
constexpr uint32_t kDefaultSegmentFrames = 100;
constexpr size_t   kBinSampleLeds = 5;

struct SplitOptions
{
    std::string outdir = ".";
    uint32_t first_frame = 0;
    uint32_t last_frame = kSplitToEnd; // exclu ; kSplitToEnd → total_frames
    std::vector<uint8_t> slave_ids;    // vide → tous (ordre de table de la frame first)
};

struct SplitStats
{
    uint8_t slave_id = 0;
    std::string path;
    uint32_t frames = 0;
    uint64_t bytes = 0;
};

struct FrameSegment
{
    uint32_t first = 0;
    uint32_t last = 0;  // exclu
};

struct SegmentResult
{
    FrameSegment segment;
    std::string dir;
    std::vector<SplitStats> stats;
};

std::string split_file_name(const std::string& outdir, uint8_t slave_id);
std::string segment_dir_name(const std::string& outdir, const FrameSegment& seg);

// OutOfRange si last > total_frames (hors kSplitToEnd) ou first >= last ;
// UnknownSlave si un id demandé manque.
bool split_slaves(const PxldReader& reader, const SplitOptions& opt, std::vector<SplitStats>& out,
                  PxldError* err = nullptr);

// "a-b,c-d" → [a,b), [c,d). Entrée sans '-' ignorée ; nombre illisible ou
// liste vide → ConfigInvalid. Les bornes sont vérifiées au découpage.
bool parse_segments(const std::string& text, std::vector<FrameSegment>& out, PxldError* err = nullptr);

// Toutes les plages sont validées avant d’écrire quoi que ce soit.
// opt.first_frame / opt.last_frame sont ignorés.
bool split_segments(const PxldReader& reader, const SplitOptions& opt, const std::vector<FrameSegment>& segments,
                    std::vector<SegmentResult>& out, PxldError* err = nullptr);

// [opt.first_frame, opt.last_frame) par tranches de segment_frames.
bool split_frame_range(const PxldReader& reader, const SplitOptions& opt, uint32_t segment_frames,
                       std::vector<SegmentResult>& out, PxldError* err = nullptr);

struct BinFileStats
{
    std::string path;
    uint64_t size_bytes = 0;
    uint64_t total_leds = 0;
    bool valid = false;               // size_bytes % 4 == 0
    std::vector<PixelRecord> samples; // au plus kBinSampleLeds premières LEDs
};

// IoError si le fichier est absent ou illisible. Un .bin mal formé n’est pas
// une erreur : valid=false.
bool verify_bin_file(const std::string& path, BinFileStats& out, PxldError* err = nullptr);

} // namespace pxld
