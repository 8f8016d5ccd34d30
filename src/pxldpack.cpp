// ============================================================================
//  File: src/pxldpack.cpp — CLI: capture brute + config esclaves → .pxld v3
//  Project: PXLD v3 LED frame container
//
//  USAGE
//  -----
//   ./pxldpack capture.bin slaves.json show.pxld [--fps 40] [--udp-port 4050]
//              [--frames N] [--no-checksum]
//
//  ENTRÉE
//  ------
//   capture.bin : suite de frames brutes de taille fixe. Une frame brute =
//   concat des captures de chaque esclave, dans l’ordre du document de
//   configuration, chacune de raw_length() octets (ordre natif des LEDs).
//
//  SORTIE
//  ------
//   .pxld v3 : LEDs canonicalisées en RGBW (APA102C/WS2812B/STANDARD_LED),
//   table d’esclaves contiguë, CRC32 [27, EOF).
// ============================================================================

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "pxld/byte_source.hpp"
#include "pxld/canonical.hpp"
#include "pxld/slave_config.hpp"
#include "pxld/writer.hpp"

using namespace pxld;

struct Args
{
    std::string raw_path;
    std::string config_path;
    std::string out_path;
    int fps=40;
    int udp_port=kDefaultUdpPort;
    long frames=-1;
    bool checksum=true;
};

static void print_usage(const char* exe)
{
    std::cerr
            << "Usage:\n"
            << "  " << exe << " <capture.bin> <slaves.json> <out.pxld> [--fps N] [--udp-port P]"
            << " [--frames N] [--no-checksum]\n";
}

static bool parse_args(int argc,char**argv, Args& a)
{
    if(argc<4)
    {
        print_usage(argv[0]);
        return false;
    }
    a.raw_path=argv[1];
    a.config_path=argv[2];
    a.out_path=argv[3];
    for(int i=4; i<argc; ++i)
    {
        std::string s=argv[i];
        bool has_val = i+1<argc;
        if(s=="--fps" && has_val) a.fps=std::atoi(argv[++i]);
        else if(s=="--udp-port" && has_val) a.udp_port=std::atoi(argv[++i]);
        else if(s=="--frames" && has_val) a.frames=std::atol(argv[++i]);
        else if(s=="--no-checksum") a.checksum=false;
        else
        {
            std::cerr<<"[pxldpack] unknown or incomplete option: "<<s<<"\n";
            print_usage(argv[0]);
            return false;
        }
    }
    if(a.fps<1 || a.fps>255 || a.udp_port<0 || a.udp_port>65535)
    {
        std::cerr<<"[pxldpack] --fps must be 1..255 and --udp-port 0..65535\n";
        return false;
    }
    return true;
}

int main(int argc,char**argv)
{
    Args A{};
    if(!parse_args(argc,argv,A)) return 2;

    PxldError e;
    SlaveConfigSet cfg;
    if(!load_slave_config(A.config_path, cfg, &e))
    {
        std::cerr<<"[pxldpack] config: "<<e.message()<<"\n";
        return 1;
    }

    uint64_t raw_frame = 0;
    for(const SlaveConfig& s : cfg.slaves) raw_frame += s.raw_length();
    if(raw_frame == 0)
    {
        std::cerr<<"[pxldpack] config describes no LED\n";
        return 1;
    }

    FileSource raw;
    if(!raw.open(A.raw_path, &e))
    {
        std::cerr<<"[pxldpack] capture: "<<e.message()<<"\n";
        return 1;
    }
    uint64_t available = raw.size() / raw_frame;
    if(raw.size() % raw_frame)
        std::cerr<<"[pxldpack] warning: capture size is not a multiple of "<<raw_frame<<" bytes, tail ignored\n";
    uint64_t frames = A.frames>=0? (uint64_t)A.frames : available;
    if(frames > available)
    {
        std::cerr<<"[pxldpack] capture holds "<<available<<" frames, "<<frames<<" requested\n";
        return 1;
    }

    std::vector<SlaveEntry> table;
    if(!make_slave_table(cfg, table, &e))
    {
        std::cerr<<"[pxldpack] layout: "<<e.message()<<"\n";
        return 1;
    }

    WriterOptions opt;
    opt.fps = (uint8_t)A.fps;
    opt.udp_port = (uint16_t)A.udp_port;
    opt.checksum = A.checksum? ChecksumType::Crc32 : ChecksumType::None;
    PxldWriter W;
    if(!W.open(A.out_path, opt, table, &e))
    {
        std::cerr<<"[pxldpack] open: "<<e.message()<<"\n";
        return 1;
    }

    std::vector<uint8_t> rawbuf((size_t)raw_frame);
    std::vector<uint8_t> pixels;
    for(uint64_t i=0; i<frames; ++i)
    {
        if(!raw.read_at(i*raw_frame, rawbuf.data(), rawbuf.size(), &e))
        {
            std::cerr<<"[pxldpack] capture frame "<<i<<": "<<e.message()<<"\n";
            return 1;
        }
        pixels.clear();
        size_t base = 0;
        for(const SlaveConfig& s : cfg.slaves)
        {
            const size_t len = (size_t)s.raw_length();
            if(!canonicalize_slave(s.outputs, rawbuf.data()+base, len, pixels, &e))
            {
                std::cerr<<"[pxldpack] frame "<<i<<" slave "<<(int)s.slave_id<<": "<<e.message()<<"\n";
                return 1;
            }
            base += len;
        }
        if(!W.write_frame(pixels, &e))
        {
            std::cerr<<"[pxldpack] write: "<<e.message()<<"\n";
            return 1;
        }
        if((i+1)%1000==0) std::cerr<<"[pxldpack] "<<(i+1)<<"/"<<frames<<" frames\n";
    }
    if(!W.finalize(&e))
    {
        std::cerr<<"[pxldpack] finalize: "<<e.message()<<"\n";
        return 1;
    }
    const FileHeader& h = W.header();
    std::cout<<"wrote "<<A.out_path<<": "<<h.total_frames<<" frames, "<<h.total_slaves<<" slaves, "
             <<h.total_pixels<<" LEDs, fps "<<(int)h.fps<<", crc32 0x"<<std::hex<<h.file_crc32<<std::dec<<"\n";
    return 0;
}
