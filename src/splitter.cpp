// ============================================================================
//  File: src/splitter.cpp — Extraction des données par esclave (.bin RGBW)
// ============================================================================

#include "pxld/splitter.hpp"
#include "pxld/slave_slice.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

namespace pxld
{

namespace {

struct FileCloser {
    void operator()(FILE* f) const { if(f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

// Fin effective de [first, last) ; kSplitToEnd → total_frames.
bool resolve_range(const PxldReader& reader, uint32_t first, uint32_t last, uint32_t& end, PxldError* err)
{
    const uint32_t total = reader.frame_count();
    end = (last == kSplitToEnd)? total : last;
    if(end > total)
        return fail(err, FormatError::OutOfRange,
                    "end frame " + std::to_string(end) + " past total_frames " + std::to_string(total));
    if(first >= end)
        return fail(err, FormatError::OutOfRange,
                    "frame range [" + std::to_string(first) + "," + std::to_string(end) + ") is empty");
    return true;
}

bool parse_frame_number(const std::string& s, uint32_t& v)
{
    if(s.empty() || s.size() > 10) return false;
    for(char c : s)
    {
        if(c < '0' || c > '9') return false;
    }
    unsigned long long n = std::strtoull(s.c_str(), nullptr, 10);
    if(n > 0xFFFFFFFFull) return false;
    v = (uint32_t)n;
    return true;
}

std::string trim(const std::string& s)
{
    size_t a = s.find_first_not_of(" \t");
    if(a == std::string::npos) return std::string();
    size_t b = s.find_last_not_of(" \t");
    return s.substr(a, b-a+1);
}

} // namespace

std::string split_file_name(const std::string& outdir, uint8_t slave_id)
{
    std::string dir = outdir.empty()? "." : outdir;
    if(dir.back() != '/') dir += '/';
    return dir + "slave_" + std::to_string(slave_id) + ".bin";
}

std::string segment_dir_name(const std::string& outdir, const FrameSegment& seg)
{
    std::string dir = outdir.empty()? "." : outdir;
    if(dir.back() != '/') dir += '/';
    char name[40];
    std::snprintf(name, sizeof(name), "segment_%04u_%04u", seg.first, seg.last? seg.last-1 : 0u);
    return dir + name;
}

bool split_slaves(const PxldReader& reader, const SplitOptions& opt, std::vector<SplitStats>& out, PxldError* err)
{
    uint32_t last = 0;
    if(!resolve_range(reader, opt.first_frame, opt.last_frame, last, err)) return false;

    Frame f;
    if(!reader.read_frame(opt.first_frame, f, err)) return false;

    std::vector<uint8_t> ids = opt.slave_ids;
    if(ids.empty())
    {
        for(const SlaveEntry& e : f.slaves) ids.push_back(e.slave_id);
    }
    for(uint8_t id : ids)
    {
        if(!find_slave(f, id))
            return fail(err, FormatError::UnknownSlave, "slave " + std::to_string(id) + " not in file");
    }

    std::vector<SplitStats> stats(ids.size());
    std::vector<FilePtr> files;
    for(size_t k=0; k<ids.size(); ++k)
    {
        stats[k].slave_id = ids[k];
        stats[k].path = split_file_name(opt.outdir, ids[k]);
        files.emplace_back(std::fopen(stats[k].path.c_str(), "wb"));
        if(!files.back())
            return fail(err, FormatError::IoError, stats[k].path + ": " + std::strerror(errno));
    }

    for(uint32_t id=opt.first_frame; id<last; ++id)
    {
        if(id != opt.first_frame && !reader.read_frame(id, f, err)) return false;
        for(size_t k=0; k<ids.size(); ++k)
        {
            SlaveSlice s;
            if(!slice(f, ids[k], s, err)) return false;
            if(s.size && std::fwrite(s.data, 1, s.size, files[k].get()) != s.size)
                return fail(err, FormatError::IoError, stats[k].path + ": write failed");
            ++stats[k].frames;
            stats[k].bytes += s.size;
        }
    }
    for(size_t k=0; k<files.size(); ++k)
    {
        if(std::fclose(files[k].release()) != 0)
            return fail(err, FormatError::IoError, stats[k].path + ": close failed");
    }
    out.swap(stats);
    return true;
}

bool parse_segments(const std::string& text, std::vector<FrameSegment>& out, PxldError* err)
{
    std::vector<FrameSegment> segs;
    size_t pos = 0;
    while(pos <= text.size())
    {
        size_t comma = text.find(',', pos);
        if(comma == std::string::npos) comma = text.size();
        const std::string item = trim(text.substr(pos, comma-pos));
        pos = comma + 1;

        const size_t dash = item.find('-');
        if(dash == std::string::npos) continue;
        FrameSegment seg;
        if(!parse_frame_number(trim(item.substr(0, dash)), seg.first) ||
           !parse_frame_number(trim(item.substr(dash+1)), seg.last))
            return fail(err, FormatError::ConfigInvalid, "segment '" + item + "' is not A-B");
        segs.push_back(seg);
    }
    if(segs.empty())
        return fail(err, FormatError::ConfigInvalid, "no segment in '" + text + "'");
    out.swap(segs);
    return true;
}

bool split_segments(const PxldReader& reader, const SplitOptions& opt, const std::vector<FrameSegment>& segments,
                    std::vector<SegmentResult>& out, PxldError* err)
{
    if(segments.empty())
        return fail(err, FormatError::OutOfRange, "no segment to split");
    for(const FrameSegment& seg : segments)
    {
        uint32_t end = 0;
        if(!resolve_range(reader, seg.first, seg.last, end, err)) return false;
    }

    std::vector<SegmentResult> results;
    for(const FrameSegment& seg : segments)
    {
        SegmentResult r;
        r.segment = seg;
        r.dir = segment_dir_name(opt.outdir, seg);
        std::error_code ec;
        std::filesystem::create_directories(r.dir, ec);
        if(ec) return fail(err, FormatError::IoError, r.dir + ": " + ec.message());

        SplitOptions so = opt;
        so.outdir = r.dir;
        so.first_frame = seg.first;
        so.last_frame = seg.last;
        if(!split_slaves(reader, so, r.stats, err)) return false;
        results.push_back(std::move(r));
    }
    out.swap(results);
    return true;
}

bool split_frame_range(const PxldReader& reader, const SplitOptions& opt, uint32_t segment_frames,
                       std::vector<SegmentResult>& out, PxldError* err)
{
    if(segment_frames == 0)
        return fail(err, FormatError::OutOfRange, "segment size is 0");
    uint32_t end = 0;
    if(!resolve_range(reader, opt.first_frame, opt.last_frame, end, err)) return false;

    std::vector<FrameSegment> segs;
    for(uint32_t a = opt.first_frame; a < end; )
    {
        const uint32_t b = (end - a > segment_frames)? a + segment_frames : end;
        segs.push_back(FrameSegment{a, b});
        a = b;
    }
    return split_segments(reader, opt, segs, out, err);
}

bool verify_bin_file(const std::string& path, BinFileStats& out, PxldError* err)
{
    FilePtr f(std::fopen(path.c_str(), "rb"));
    if(!f) return fail(err, FormatError::IoError, path + ": " + std::strerror(errno));
    if(std::fseek(f.get(), 0, SEEK_END) != 0)
        return fail(err, FormatError::IoError, path + ": seek failed");
    const long size = std::ftell(f.get());
    if(size < 0 || std::fseek(f.get(), 0, SEEK_SET) != 0)
        return fail(err, FormatError::IoError, path + ": tell failed");

    BinFileStats st;
    st.path = path;
    st.size_bytes = (uint64_t)size;
    st.total_leds = st.size_bytes / kBytesPerLed;
    st.valid = (st.size_bytes % kBytesPerLed) == 0;

    const size_t n = (size_t)std::min<uint64_t>(st.total_leds, kBinSampleLeds);
    uint8_t buf[kBinSampleLeds * kBytesPerLed];
    if(n && std::fread(buf, 1, n*kBytesPerLed, f.get()) != n*kBytesPerLed)
        return fail(err, FormatError::IoError, path + ": short read");
    for(size_t i=0; i<n; ++i)
    {
        const uint8_t* p = buf + i*kBytesPerLed;
        st.samples.push_back(PixelRecord{p[0], p[1], p[2], p[3]});
    }
    out = std::move(st);
    return true;
}

} // namespace pxld
