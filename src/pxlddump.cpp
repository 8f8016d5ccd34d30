// ============================================================================
//  File: src/pxlddump.cpp — CLI .pxld dumper / extract PNG / split
//  Project: PXLD v3 LED frame container
//
//  USAGE EXAMPLES
//  --------------
//   # Info en texte (en-tête + frame 0)
//   ./pxlddump show.pxld
//
//   # Rapport JSON
//   ./pxlddump show.pxld --json
//
//   # Table d’esclaves de la frame 120 + LEDs de l’esclave 3 (types via config)
//   ./pxlddump show.pxld --frame 120 --slave 3 --config slaves.json
//
//   # Aperçu PNG de la frame 0 / de toutes les frames
//   ./pxlddump show.pxld --extract-png 0 --out f0.png --scale 4
//   ./pxlddump show.pxld --extract-png all --outdir ./frames
//
//   # Séparer les esclaves en slave_<id>.bin (RGBW), frames [100,200)
//   ./pxlddump show.pxld --split ./out --start 100 --end 200
//
//   # Segments : ./out/segment_0000_0099/, ./out/segment_0200_0299/ ...
//   ./pxlddump show.pxld --split ./out --segment "0-100,200-300" --verify
//   ./pxlddump show.pxld --split ./out --chunk 100
//
//   # Écrire / utiliser le sidecar d’index (.pxldi)
//   ./pxlddump show.pxld --write-index
//   ./pxlddump show.pxld --use-index --frame 5000
//
//  CODES DE SORTIE
//  ---------------
//   0 = OK, 1 = erreur de format / E/S, 2 = usage.
// ============================================================================

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "pxld/canonical.hpp"
#include "pxld/preview.hpp"
#include "pxld/reader.hpp"
#include "pxld/slave_config.hpp"
#include "pxld/slave_slice.hpp"
#include "pxld/splitter.hpp"

using namespace pxld;

struct Args
{
    std::string path;
    bool json=false;
    long frame=0;
    long slave=-1;
    std::string config;
    bool extract=false;
    bool extract_all=false;
    long extract_idx=0;
    std::string out_png="frame.png";
    std::string outdir=".";
    int scale=1;
    bool split=false;
    std::string split_dir=".";
    long start=0;
    long end=-1;
    std::string segments;
    long chunk=0;
    bool verify=false;
    bool write_index=false;
    bool use_index=false;
};

static void print_usage(const char* exe)
{
    std::cerr
            << "Usage:\n"
            << "  " << exe << " <file.pxld> [--json] [--frame N] [--slave ID] [--config slaves.json]\n"
            << "  " << exe << " <file.pxld> --extract-png N|all [--out f.png | --outdir DIR] [--scale S]\n"
            << "  " << exe << " <file.pxld> --split DIR [--start A] [--end B] [--slave ID]\n"
            << "        [--segment \"A-B,C-D\" | --chunk N] [--verify]\n"
            << "  " << exe << " <file.pxld> --write-index | --use-index\n";
}

static bool parse_args(int argc,char**argv, Args& a)
{
    if(argc<2)
    {
        print_usage(argv[0]);
        return false;
    }
    a.path=argv[1];
    for(int i=2; i<argc; ++i)
    {
        std::string s=argv[i];
        bool has_val = i+1<argc;
        if(s=="--json")
        {
            a.json=true;
        }
        else if(s=="--frame" && has_val)
        {
            a.frame=std::atol(argv[++i]);
        }
        else if(s=="--slave" && has_val)
        {
            a.slave=std::atol(argv[++i]);
        }
        else if(s=="--config" && has_val)
        {
            a.config=argv[++i];
        }
        else if(s=="--extract-png" && has_val)
        {
            std::string v=argv[++i];
            a.extract=true;
            a.extract_all=(v=="all");
            if(!a.extract_all) a.extract_idx=std::atol(v.c_str());
        }
        else if(s=="--out" && has_val)
        {
            a.out_png=argv[++i];
        }
        else if(s=="--outdir" && has_val)
        {
            a.outdir=argv[++i];
        }
        else if(s=="--scale" && has_val)
        {
            a.scale=std::max(1, std::atoi(argv[++i]));
        }
        else if(s=="--split" && has_val)
        {
            a.split=true;
            a.split_dir=argv[++i];
        }
        else if(s=="--start" && has_val)
        {
            a.start=std::atol(argv[++i]);
        }
        else if(s=="--end" && has_val)
        {
            a.end=std::atol(argv[++i]);
        }
        else if(s=="--segment" && has_val)
        {
            a.segments=argv[++i];
        }
        else if(s=="--chunk" && has_val)
        {
            a.chunk=std::atol(argv[++i]);
        }
        else if(s=="--verify")
        {
            a.verify=true;
        }
        else if(s=="--write-index")
        {
            a.write_index=true;
        }
        else if(s=="--use-index")
        {
            a.use_index=true;
        }
        else
        {
            std::cerr<<"[pxlddump] unknown or incomplete option: "<<s<<"\n";
            print_usage(argv[0]);
            return false;
        }
    }
    if(a.frame<0 || a.start<0 || a.extract_idx<0 || a.chunk<0 || a.slave>255)
    {
        std::cerr<<"[pxlddump] negative frame number or slave id > 255\n";
        return false;
    }
    if((!a.segments.empty() || a.chunk>0 || a.verify) && !a.split)
    {
        std::cerr<<"[pxlddump] --segment, --chunk and --verify need --split DIR\n";
        return false;
    }
    return !a.path.empty();
}

static std::string hex32(uint32_t v)
{
    std::ostringstream os;
    os<<"0x"<<std::hex<<std::uppercase<<std::setw(8)<<std::setfill('0')<<v;
    return os.str();
}

static void report_error(const char* what, const PxldError& e)
{
    std::cerr<<"[pxlddump] "<<what<<": "<<e.message()<<"\n";
}

static void print_header(const Args& A, const PxldReader& R)
{
    const FileHeader& h = R.header();
    if(A.json)
    {
        std::cout << "  \"file\": \""<<A.path<<"\",\n"
                  << "  \"header\": {\n"
                  << "    \"version\": \""<<(int)h.major_version<<"."<<(int)h.minor_version<<"\",\n"
                  << "    \"fps\": "<<(int)h.fps<<", \"udp_port\": "<<h.udp_port<<",\n"
                  << "    \"total_frames\": "<<h.total_frames<<", \"total_slaves\": "<<h.total_slaves
                  << ", \"total_pixels\": "<<h.total_pixels<<",\n"
                  << "    \"checksum_type\": "<<(int)h.checksum_type<<", \"file_crc32\": \""<<hex32(h.file_crc32)<<"\",\n"
                  << "    \"duration_ms\": "<<R.timestamp_ms(h.total_frames)<<",\n"
                  << "    \"index_from_sidecar\": "<<(R.index_from_sidecar()? "true":"false")<<"\n"
                  << "  }";
    }
    else
    {
        std::cout<<"== .pxld ==\n"
                 <<"file: "<<A.path<<"\n"
                 <<"version: "<<(int)h.major_version<<"."<<(int)h.minor_version<<"  fps: "<<(int)h.fps
                 <<"  udp_port: "<<h.udp_port<<"\n"
                 <<"frames: "<<h.total_frames<<"  slaves: "<<h.total_slaves<<"  pixels: "<<h.total_pixels
                 <<" (channels="<<(uint64_t)h.total_pixels*kBytesPerLed<<")\n"
                 <<"checksum: "<<(h.checksum_type? "crc32 ":"none ")<<hex32(h.file_crc32)<<" (verified)\n"
                 <<"duration: "<<R.timestamp_ms(h.total_frames)<<" ms\n"
                 <<"index: "<<(R.index_from_sidecar()? "sidecar":"scanned")<<"\n";
    }
}

static void print_frame(const Args& A, const PxldReader& R, const Frame& f)
{
    if(A.json)
    {
        std::cout << ",\n  \"frame\": {\n"
                  << "    \"frame_id\": "<<f.header.frame_id<<", \"timestamp_ms\": "<<R.timestamp_ms(f.header.frame_id)
                  << ", \"offset\": "<<R.index()[f.header.frame_id]<<",\n"
                  << "    \"pixel_data_size\": "<<f.header.pixel_data_size<<",\n"
                  << "    \"slaves\": [\n";
        for(size_t i=0; i<f.slaves.size(); ++i)
        {
            const SlaveEntry& e = f.slaves[i];
            std::cout << "      {\"id\":"<<(int)e.slave_id<<",\"channel_start\":"<<e.channel_start
                      << ",\"channel_count\":"<<e.channel_count<<",\"pixels\":"<<e.pixel_count
                      << ",\"offset\":"<<e.data_offset<<",\"length\":"<<e.data_length<<"}"
                      << (i+1<f.slaves.size()? ",":"") << "\n";
        }
        std::cout << "    ]\n  }";
    }
    else
    {
        std::cout<<"-- frame "<<f.header.frame_id<<" @ "<<R.timestamp_ms(f.header.frame_id)<<" ms"
                 <<"  offset "<<R.index()[f.header.frame_id]<<"  pixel bytes "<<f.header.pixel_data_size<<"\n";
        for(const SlaveEntry& e : f.slaves)
        {
            std::cout<<"  slave "<<std::setw(3)<<(int)e.slave_id
                     <<": channels "<<e.channel_start<<"-"<<(e.channel_start + e.channel_count - 1)
                     <<", "<<e.pixel_count<<" LEDs, "<<e.data_length<<" bytes @ "<<e.data_offset<<"\n";
        }
    }
}

static bool print_slave(const Args& A, const Frame& f, const SlaveConfigSet& cfg)
{
    const uint8_t id = (uint8_t)A.slave;
    std::vector<PixelRecord> leds;
    PxldError e;
    if(!slave_pixels(f, id, leds, &e))
    {
        report_error("slave", e);
        return false;
    }
    const SlaveConfig* sc = cfg.find(id);
    const size_t shown = std::min<size_t>(leds.size(), sc? leds.size() : 5);
    if(A.json)
    {
        std::cout << ",\n  \"slave\": {\"id\": "<<(int)id<<", \"leds\": "<<leds.size()
                  << ", \"name\": \""<<(sc? sc->name : std::string())<<"\"}";
        return true;
    }
    std::cout<<"-- slave "<<(int)id;
    if(sc && !sc->name.empty()) std::cout<<" ("<<sc->name<<")";
    std::cout<<": "<<leds.size()<<" LEDs\n";
    for(size_t i=0; i<shown; ++i)
    {
        LedType t;
        bool typed = sc && sc->led_type_at((uint32_t)i, t);
        const PixelRecord& p = leds[i];
        std::cout<<"  LED "<<std::setw(4)<<i<<": ";
        if(typed && t==LedType::STANDARD_LED) std::cout<<"mono("<<(int)p.w<<")";
        else std::cout<<"RGB("<<(int)p.r<<","<<(int)p.g<<","<<(int)p.b<<") W="<<(int)p.w;
        if(typed) std::cout<<"  ["<<led_type_name(t)<<"]";
        std::cout<<"\n";
    }
    return true;
}

static bool extract_png(const Args& A, const PxldReader& R, const SlaveConfigSet& cfg)
{
    const SlaveConfigSet* pc = cfg.empty()? nullptr : &cfg;
    uint32_t first = A.extract_all? 0 : (uint32_t)A.extract_idx;
    uint32_t last  = A.extract_all? R.frame_count() : first+1;
    for(uint32_t i=first; i<last; ++i)
    {
        Frame f;
        ImageRGB8 img;
        PxldError e;
        std::string out = A.out_png;
        if(A.extract_all)
        {
            char name[32];
            std::snprintf(name, sizeof(name), "/frame_%06u.png", i);
            out = A.outdir + name;
        }
        if(!R.read_frame(i, f, &e) || !render_frame_rgb(f, pc, A.scale, img, &e) || !write_png(out, img, &e))
        {
            report_error(("extract frame " + std::to_string(i)).c_str(), e);
            return false;
        }
        if(!A.json && !A.extract_all) std::cout<<"extracted frame "<<i<<" -> "<<out<<"\n";
    }
    if(!A.json && A.extract_all) std::cout<<"extracted "<<R.frame_count()<<" frames -> "<<A.outdir<<"/frame_######.png\n";
    return true;
}

static bool print_bin_stats(const std::string& path)
{
    BinFileStats st;
    PxldError e;
    if(!verify_bin_file(path, st, &e))
    {
        report_error("verify", e);
        return false;
    }
    std::cout<<"  verify "<<st.path<<": "<<st.size_bytes<<" bytes, "<<st.total_leds<<" LEDs, "
             <<(st.valid? "OK":"BAD (size not a multiple of 4)")<<"\n";
    for(size_t i=0; i<st.samples.size(); ++i)
    {
        const PixelRecord& p = st.samples[i];
        char hex[12];
        std::snprintf(hex, sizeof(hex), "%02x%02x%02x%02x", p.r, p.g, p.b, p.w);
        std::cout<<"    LED "<<i<<": R="<<std::setw(3)<<(int)p.r<<" G="<<std::setw(3)<<(int)p.g
                 <<" B="<<std::setw(3)<<(int)p.b<<" W="<<std::setw(3)<<(int)p.w<<"  ("<<hex<<")\n";
    }
    return st.valid;
}

static bool print_split_stats(const Args& A, const std::vector<SplitStats>& stats)
{
    bool ok = true;
    for(const SplitStats& s : stats)
    {
        if(!A.json)
            std::cout<<"slave "<<(int)s.slave_id<<" -> "<<s.path<<"  ("<<s.frames<<" frames, "<<s.bytes<<" bytes)\n";
        if(A.verify && !A.json) ok = print_bin_stats(s.path) && ok;
    }
    return ok;
}

static bool run_split(const Args& A, const PxldReader& R)
{
    SplitOptions opt;
    opt.outdir = A.split_dir;
    opt.first_frame = (uint32_t)A.start;
    if(A.end >= 0) opt.last_frame = (uint32_t)A.end;
    if(A.slave >= 0) opt.slave_ids.push_back((uint8_t)A.slave);
    PxldError e;

    if(!A.segments.empty() || A.chunk > 0)
    {
        std::vector<FrameSegment> segs;
        std::vector<SegmentResult> results;
        bool done = !A.segments.empty()
                    ? parse_segments(A.segments, segs, &e) && split_segments(R, opt, segs, results, &e)
                    : split_frame_range(R, opt, (uint32_t)A.chunk, results, &e);
        if(!done)
        {
            report_error("split", e);
            return false;
        }
        bool ok = true;
        for(const SegmentResult& r : results)
        {
            if(!A.json)
                std::cout<<"segment "<<r.segment.first<<"-"<<(r.segment.last-1)<<" -> "<<r.dir<<"\n";
            ok = print_split_stats(A, r.stats) && ok;
        }
        return ok;
    }

    std::vector<SplitStats> stats;
    if(!split_slaves(R, opt, stats, &e))
    {
        report_error("split", e);
        return false;
    }
    return print_split_stats(A, stats);
}

int main(int argc,char**argv)
{
    Args A{};
    if(!parse_args(argc,argv,A)) return 2;

    SlaveConfigSet cfg;
    PxldError e;
    if(!A.config.empty() && !load_slave_config(A.config, cfg, &e))
    {
        report_error("config", e);
        return 1;
    }

    OpenOptions opt;
    opt.use_index_sidecar = A.use_index;
    opt.write_index_sidecar = A.write_index;
    PxldReader R;
    if(!R.open(A.path, opt, &e))
    {
        report_error("open", e);
        return 1;
    }

    bool ok = true;
    if(A.json) std::cout<<"{\n";
    print_header(A, R);

    Frame f;
    if(R.frame_count() > 0 || A.frame > 0)
    {
        if(!R.read_frame((uint32_t)A.frame, f, &e))
        {
            report_error("frame", e);
            ok = false;
        }
        else
        {
            print_frame(A, R, f);
            if(A.slave >= 0 && !A.split) ok = print_slave(A, f, cfg) && ok;
        }
    }
    if(A.json) std::cout<<"\n}\n";

    if(ok && A.extract) ok = extract_png(A, R, cfg);
    if(ok && A.split) ok = run_split(A, R);
    if(ok && A.write_index && !A.json) std::cout<<"index sidecar -> "<<index_sidecar_path(A.path)<<"\n";
    return ok? 0 : 1;
}
