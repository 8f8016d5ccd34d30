// ============================================================================
//  File: src/minitest_io.cpp — Tests fichiers : writer, reader, sidecar,
//                              découpe par esclave, lecture parallèle, PNG
//  Project: PXLD v3 LED frame container
//
//  Objectifs testés :
//   [I1] PxldWriter → PxldReader : en-tête, frames, CRC identique à encode_file
//   [I2] Sidecar .pxldi : écrit, relu, périmé → repli silencieux sur la passe
//   [I2b] Sidecar d’un fichier sans checksum réécrit à taille égale
//   [I3] split_slaves : un .bin RGBW par esclave, plage de frames, fin
//        au-delà de total_frames → OutOfRange
//   [I3b] Segments : liste "A-B,C-D", dossiers segment_AAAA_BBBB, tranches
//   [I3c] verify_bin_file : taille, nombre de LEDs, échantillon
//   [I4] read_frame depuis plusieurs threads sur un même PxldReader
//   [I5] Aperçu : rendu RGB (gris pour STANDARD_LED) + PNG via stb
//
//  Les fichiers sont créés sous <tmp>/pxld_minitest_io/ et supprimés à la fin.
//
//  Exécution :
//    ./minitest_io  -> rapport JSON sur stdout, code 0 si PASS
// ============================================================================

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "pxld/byte_source.hpp"
#include "pxld/frame_codec.hpp"
#include "pxld/frame_index.hpp"
#include "pxld/preview.hpp"
#include "pxld/reader.hpp"
#include "pxld/slave_config.hpp"
#include "pxld/slave_slice.hpp"
#include "pxld/splitter.hpp"
#include "pxld/writer.hpp"

using namespace pxld;
namespace fs = std::filesystem;

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static const char* kConfigDoc = R"({"slaves": [
  {"slave_id": 1, "name": "rgb", "outputs": [ {"type": "APA102C", "count": 3} ]},
  {"slave_id": 7, "name": "dim", "outputs": [ {"type": "STANDARD_LED", "count": 2} ]}
]})";

static fs::path g_dir;

static std::string tmp_path(const std::string& name)
{
    return (g_dir / name).string();
}

static SlaveConfigSet sample_config()
{
    SlaveConfigSet cfg;
    parse_slave_config(kConfigDoc, cfg);
    return cfg;
}

// 5 LEDs → 20 octets par frame.
static std::vector<uint8_t> frame_pixels(uint32_t i)
{
    std::vector<uint8_t> p(20);
    for(size_t k=0; k<p.size(); ++k) p[k] = (uint8_t)(k*3 + i*11);
    return p;
}

static bool write_sample(const std::string& path, uint32_t frames, FileHeader* out_header = nullptr,
                         ChecksumType checksum = ChecksumType::Crc32)
{
    std::vector<SlaveEntry> table;
    PxldError e;
    T_ASSERT( make_slave_table(sample_config(), table, &e) );
    WriterOptions opt;
    opt.fps = 25;
    opt.udp_port = 5000;
    opt.checksum = checksum;
    PxldWriter w;
    T_ASSERT( w.open(path, opt, table, &e) );
    T_ASSERT( w.pixel_bytes_per_frame() == 20 );
    for(uint32_t i=0; i<frames; ++i) T_ASSERT( w.write_frame(frame_pixels(i), &e) );
    T_ASSERT( w.frames_written() == frames );
    T_ASSERT( w.finalize(&e) );
    if(out_header) *out_header = w.header();
    return true;
}

static bool overwrite_file(const std::string& path, const std::vector<uint8_t>& bytes)
{
    FILE* fp = std::fopen(path.c_str(), "wb");
    T_ASSERT( fp != nullptr );
    bool wrote = std::fwrite(bytes.data(), 1, bytes.size(), fp) == bytes.size();
    std::fclose(fp);
    T_ASSERT( wrote );
    return true;
}

// [I1]
static bool test_writer_reader()
{
    const std::string path = tmp_path("show.pxld");
    FileHeader wh;
    T_ASSERT( write_sample(path, 6, &wh) );

    PxldReader r;
    PxldError e;
    T_ASSERT( r.open(path, &e) );
    T_ASSERT( r.is_open() );
    T_ASSERT( !r.index_from_sidecar() );
    const FileHeader& h = r.header();
    T_ASSERT( h == wh );
    T_ASSERT( h.fps == 25 && h.udp_port == 5000 );
    T_ASSERT( h.total_frames == 6 && h.total_slaves == 2 && h.total_pixels == 5 );
    T_ASSERT( r.frame_count() == 6 );
    T_ASSERT( r.timestamp_ms(5) == 200.0 );

    std::vector<Frame> frames;
    for(uint32_t i=0; i<6; ++i)
    {
        Frame f;
        T_ASSERT( r.read_frame(i, f, &e) );
        T_ASSERT( f.header.frame_id == i );
        T_ASSERT( f.pixels == frame_pixels(i) );
        T_ASSERT( f.slaves.size() == 2 && f.slaves[1].channel_start == 13 );
        frames.push_back(f);
    }
    Frame f;
    T_ASSERT( !r.read_frame(6, f, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );

    // même contenu en mémoire → mêmes octets, même CRC
    std::vector<uint8_t> mem, disk;
    T_ASSERT( encode_file(h, frames, mem, &e) );
    T_ASSERT( read_whole_file(path, disk, &e) );
    T_ASSERT( mem == disk );

    // buffer de mauvaise taille
    std::vector<SlaveEntry> table;
    T_ASSERT( make_slave_table(sample_config(), table, &e) );
    PxldWriter w;
    T_ASSERT( w.open(tmp_path("bad.pxld"), WriterOptions{}, table, &e) );
    T_ASSERT( !w.write_frame(std::vector<uint8_t>(19), &e) );
    T_ASSERT( e.code == FormatError::SizeMismatch );
    T_ASSERT( w.finalize(&e) );
    T_ASSERT( !w.finalize(&e) );
    T_ASSERT( e.code == FormatError::IoError );

    // fichier altéré : refusé à l’ouverture
    disk[disk.size()-3] ^= 0x01;
    T_ASSERT( overwrite_file(tmp_path("bad.pxld"), disk) );
    PxldReader bad;
    T_ASSERT( !bad.open(tmp_path("bad.pxld"), &e) );
    T_ASSERT( e.code == FormatError::ChecksumMismatch );
    T_ASSERT( !bad.is_open() );

    T_ASSERT( !bad.open(tmp_path("absent.pxld"), &e) );
    T_ASSERT( e.code == FormatError::IoError );
    return true;
}

// [I2]
static bool test_index_sidecar()
{
    const std::string path = tmp_path("sidecar.pxld");
    T_ASSERT( write_sample(path, 4) );
    PxldError e;

    OpenOptions opt;
    opt.use_index_sidecar = true;
    opt.write_index_sidecar = true;
    PxldReader r1;
    T_ASSERT( r1.open(path, opt, &e) );
    T_ASSERT( !r1.index_from_sidecar() );
    T_ASSERT( fs::exists(index_sidecar_path(path)) );
    T_ASSERT( fs::file_size(index_sidecar_path(path)) == kIndexHeaderSize + 4*8 );

    std::vector<uint8_t> idx_bytes;
    T_ASSERT( read_whole_file(index_sidecar_path(path), idx_bytes, &e) );
    T_ASSERT( std::memcmp(idx_bytes.data(), "PXLI", 4) == 0 && idx_bytes[4] == kIndexVersion );

    PxldReader r2;
    T_ASSERT( r2.open(path, opt, &e) );
    T_ASSERT( r2.index_from_sidecar() );
    T_ASSERT( r2.index().offsets == r1.index().offsets );
    Frame f;
    T_ASSERT( r2.read_frame(3, f, &e) );
    T_ASSERT( f.pixels == frame_pixels(3) );

    // fichier réécrit : sidecar périmé, rejeté par read_index_sidecar
    T_ASSERT( write_sample(path, 3) );
    FileSource src;
    T_ASSERT( src.open(path, &e) );
    PxldReader r3;
    T_ASSERT( r3.open(path, &e) );
    FrameIndex idx;
    T_ASSERT( !read_index_sidecar(index_sidecar_path(path), r3.header(), src.size(), idx, &e) );
    T_ASSERT( e.code == FormatError::IndexCorruption );

    // ... et ignoré à l’ouverture
    opt.write_index_sidecar = false;
    PxldReader r4;
    T_ASSERT( r4.open(path, opt, &e) );
    T_ASSERT( !r4.index_from_sidecar() );
    T_ASSERT( r4.frame_count() == 3 );

    // sidecar illisible
    {
        FILE* fp = std::fopen(index_sidecar_path(path).c_str(), "wb");
        T_ASSERT( fp != nullptr );
        std::fputs("garbage", fp);
        std::fclose(fp);
    }
    T_ASSERT( !read_index_sidecar(index_sidecar_path(path), r3.header(), src.size(), idx, &e) );
    T_ASSERT( e.code == FormatError::TruncatedFile );
    PxldReader r5;
    T_ASSERT( r5.open(path, opt, &e) );
    T_ASSERT( !r5.index_from_sidecar() );

    // table d’offsets altérée : CRC de table
    opt.write_index_sidecar = true;
    PxldReader r6;
    T_ASSERT( r6.open(path, opt, &e) );
    T_ASSERT( read_whole_file(index_sidecar_path(path), idx_bytes, &e) );
    idx_bytes[kIndexHeaderSize + 8] ^= 0x04;
    T_ASSERT( overwrite_file(index_sidecar_path(path), idx_bytes) );
    T_ASSERT( !read_index_sidecar(index_sidecar_path(path), r6.header(), src.size(), idx, &e) );
    T_ASSERT( e.code == FormatError::ChecksumMismatch );
    return true;
}

// [I2b] Fichier sans checksum réécrit à taille égale : le sidecar garde le
// même en-tête ; pixel_data_size gonflé ne doit ni allouer ni passer.
static bool test_stale_sidecar_without_checksum()
{
    const std::string path = tmp_path("nocrc.pxld");
    FileHeader h;
    T_ASSERT( write_sample(path, 1, &h, ChecksumType::None) );
    T_ASSERT( h.file_crc32 == 0 );
    PxldError e;

    OpenOptions opt;
    opt.use_index_sidecar = true;
    opt.write_index_sidecar = true;
    PxldReader r1;
    T_ASSERT( r1.open(path, opt, &e) );
    r1.close();

    std::vector<uint8_t> bytes;
    T_ASSERT( read_whole_file(path, bytes, &e) );
    put_le32(&bytes[kHeaderSize + 12], 0x7FFFFFF0u);
    T_ASSERT( overwrite_file(path, bytes) );

    // le sidecar seul correspond encore...
    FrameIndex idx;
    T_ASSERT( read_index_sidecar(index_sidecar_path(path), h, bytes.size(), idx, &e) );
    T_ASSERT( idx.size() == 1 && idx[0] == kHeaderSize );

    // ... mais la dernière frame est relue : repli sur la passe, qui refuse
    MemorySource mem(bytes);
    T_ASSERT( !check_index_tail(mem, h, idx, &e) );
    T_ASSERT( e.code == FormatError::TruncatedFile );

    opt.write_index_sidecar = false;
    PxldReader r2;
    T_ASSERT( !r2.open(path, opt, &e) );
    T_ASSERT( e.code == FormatError::TruncatedFile );
    T_ASSERT( !r2.is_open() );

    // index forcé : decode_frame borne l’étendue avant d’allouer
    Frame f;
    T_ASSERT( !decode_frame(mem, h, idx, 0, f, &e) );
    T_ASSERT( e.code == FormatError::TruncatedFile );

    // 2 frames, la première gonflée : la dernière est saine, le sidecar est
    // accepté, la lecture de la frame 0 échoue proprement
    T_ASSERT( write_sample(path, 2, &h, ChecksumType::None) );
    opt.write_index_sidecar = true;
    PxldReader r3;
    T_ASSERT( r3.open(path, opt, &e) );
    r3.close();
    T_ASSERT( read_whole_file(path, bytes, &e) );
    put_le32(&bytes[kHeaderSize + 12], 0x7FFFFFF0u);
    T_ASSERT( overwrite_file(path, bytes) );
    opt.write_index_sidecar = false;
    PxldReader r4;
    T_ASSERT( r4.open(path, opt, &e) );
    T_ASSERT( r4.index_from_sidecar() );
    T_ASSERT( !r4.read_frame(0, f, &e) );
    T_ASSERT( e.code == FormatError::TruncatedFile );
    T_ASSERT( r4.read_frame(1, f, &e) );
    T_ASSERT( f.pixels == frame_pixels(1) );
    return true;
}

// [I3]
static bool test_split()
{
    const std::string path = tmp_path("split.pxld");
    T_ASSERT( write_sample(path, 5) );
    PxldReader r;
    PxldError e;
    T_ASSERT( r.open(path, &e) );

    const fs::path outdir = g_dir / "split";
    fs::create_directories(outdir);
    SplitOptions opt;
    opt.outdir = outdir.string();
    std::vector<SplitStats> st;
    T_ASSERT( split_slaves(r, opt, st, &e) );
    T_ASSERT( st.size() == 2 );
    T_ASSERT( st[0].slave_id == 1 && st[0].frames == 5 && st[0].bytes == 5*12 );
    T_ASSERT( st[1].slave_id == 7 && st[1].bytes == 5*8 );
    T_ASSERT( st[0].path == split_file_name(opt.outdir, 1) );

    std::vector<uint8_t> bin;
    T_ASSERT( read_whole_file(st[1].path, bin, &e) );
    T_ASSERT( bin.size() == 40 );
    for(uint32_t i=0; i<5; ++i)
    {
        const std::vector<uint8_t> p = frame_pixels(i);
        T_ASSERT( std::memcmp(&bin[i*8], &p[12], 8) == 0 );
    }

    opt.first_frame = 1;
    opt.last_frame = 3;
    opt.slave_ids = {7};
    T_ASSERT( split_slaves(r, opt, st, &e) );
    T_ASSERT( st.size() == 1 && st[0].frames == 2 && st[0].bytes == 16 );

    opt.slave_ids = {2};
    T_ASSERT( !split_slaves(r, opt, st, &e) );
    T_ASSERT( e.code == FormatError::UnknownSlave );

    opt.slave_ids.clear();
    opt.first_frame = 5;
    opt.last_frame = 9;
    T_ASSERT( !split_slaves(r, opt, st, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );

    // fin explicite au-delà de total_frames : refusée, pas bornée
    opt.first_frame = 0;
    opt.last_frame = 6;
    T_ASSERT( !split_slaves(r, opt, st, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );
    opt.last_frame = 5;
    T_ASSERT( split_slaves(r, opt, st, &e) );
    T_ASSERT( st[0].frames == 5 );

    // plage vide
    opt.first_frame = 3;
    opt.last_frame = 3;
    T_ASSERT( !split_slaves(r, opt, st, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );

    // fin omise : jusqu’à total_frames
    opt.last_frame = kSplitToEnd;
    T_ASSERT( split_slaves(r, opt, st, &e) );
    T_ASSERT( st[0].frames == 2 );
    return true;
}

// [I3b]
static bool test_split_segments()
{
    const std::string path = tmp_path("segments.pxld");
    T_ASSERT( write_sample(path, 5) );
    PxldReader r;
    PxldError e;
    T_ASSERT( r.open(path, &e) );

    std::vector<FrameSegment> segs;
    T_ASSERT( parse_segments("0-2, 3-5,bogus", segs, &e) );
    T_ASSERT( segs.size() == 2 );
    T_ASSERT( segs[0].first == 0 && segs[0].last == 2 && segs[1].first == 3 && segs[1].last == 5 );
    T_ASSERT( !parse_segments("x-2", segs, &e) );
    T_ASSERT( e.code == FormatError::ConfigInvalid );
    T_ASSERT( !parse_segments("nothing", segs, &e) );
    T_ASSERT( e.code == FormatError::ConfigInvalid );

    const fs::path outdir = g_dir / "segments";
    SplitOptions opt;
    opt.outdir = outdir.string();
    T_ASSERT( parse_segments("0-2,3-5", segs, &e) );
    std::vector<SegmentResult> res;
    T_ASSERT( split_segments(r, opt, segs, res, &e) );
    T_ASSERT( res.size() == 2 );
    T_ASSERT( res[0].dir == (outdir / "segment_0000_0001").string() );
    T_ASSERT( res[1].dir == (outdir / "segment_0003_0004").string() );
    T_ASSERT( fs::is_directory(res[1].dir) );
    T_ASSERT( res[1].stats.size() == 2 && res[1].stats[0].frames == 2 );

    // esclave 7, frames 3 et 4
    std::vector<uint8_t> bin;
    T_ASSERT( read_whole_file(res[1].stats[1].path, bin, &e) );
    T_ASSERT( bin.size() == 16 );
    T_ASSERT( std::memcmp(&bin[0], &frame_pixels(3)[12], 8) == 0 );
    T_ASSERT( std::memcmp(&bin[8], &frame_pixels(4)[12], 8) == 0 );

    // un segment hors bornes : rien n’est écrit
    const std::vector<FrameSegment> bad = { {0, 2}, {4, 8} };
    T_ASSERT( !split_segments(r, SplitOptions{(g_dir / "bad_segments").string()}, bad, res, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );
    T_ASSERT( !fs::exists(g_dir / "bad_segments") );

    // plage découpée en tranches de 2 : [1,3) [3,5)
    opt.outdir = (g_dir / "chunks").string();
    opt.first_frame = 1;
    T_ASSERT( split_frame_range(r, opt, 2, res, &e) );
    T_ASSERT( res.size() == 2 );
    T_ASSERT( res[0].segment.first == 1 && res[0].segment.last == 3 );
    T_ASSERT( res[1].segment.first == 3 && res[1].segment.last == 5 );
    T_ASSERT( fs::exists(g_dir / "chunks" / "segment_0001_0002" / "slave_1.bin") );
    T_ASSERT( !split_frame_range(r, opt, 0, res, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );
    return true;
}

// [I3c]
static bool test_verify_bin()
{
    const std::string path = tmp_path("verify.pxld");
    T_ASSERT( write_sample(path, 2) );
    PxldReader r;
    PxldError e;
    T_ASSERT( r.open(path, &e) );

    const fs::path outdir = g_dir / "verify";
    fs::create_directories(outdir);
    SplitOptions opt;
    opt.outdir = outdir.string();
    std::vector<SplitStats> st;
    T_ASSERT( split_slaves(r, opt, st, &e) );

    // esclave 1 : 3 LEDs x 2 frames
    BinFileStats bs;
    T_ASSERT( verify_bin_file(st[0].path, bs, &e) );
    T_ASSERT( bs.valid && bs.size_bytes == 24 && bs.total_leds == 6 );
    T_ASSERT( bs.samples.size() == kBinSampleLeds );
    const std::vector<uint8_t> p0 = frame_pixels(0);
    T_ASSERT( bs.samples[0] == (PixelRecord{p0[0], p0[1], p0[2], p0[3]}) );

    // esclave 7 : 2 LEDs x 2 frames, moins que l’échantillon
    T_ASSERT( verify_bin_file(st[1].path, bs, &e) );
    T_ASSERT( bs.total_leds == 4 && bs.samples.size() == 4 );

    const std::string odd = tmp_path("odd.bin");
    T_ASSERT( overwrite_file(odd, std::vector<uint8_t>(7, 0x11)) );
    T_ASSERT( verify_bin_file(odd, bs, &e) );
    T_ASSERT( !bs.valid && bs.total_leds == 1 && bs.samples.size() == 1 );

    T_ASSERT( !verify_bin_file(tmp_path("absent.bin"), bs, &e) );
    T_ASSERT( e.code == FormatError::IoError );
    return true;
}

// [I4]
static bool test_parallel_reads()
{
    const std::string path = tmp_path("parallel.pxld");
    const uint32_t n = 64;
    T_ASSERT( write_sample(path, n) );
    PxldReader r;
    PxldError e;
    T_ASSERT( r.open(path, &e) );

    std::atomic<int> mismatches{0};
    std::vector<std::thread> pool;
    for(int t=0; t<4; ++t)
    {
        pool.emplace_back([&r, &mismatches, t, n]()
        {
            for(uint32_t k=0; k<n; ++k)
            {
                const uint32_t id = (k*7 + (uint32_t)t*13) % n;
                Frame f;
                if(!r.read_frame(id, f) || f.header.frame_id != id || f.pixels != frame_pixels(id))
                    ++mismatches;
            }
        });
    }
    for(std::thread& th : pool) th.join();
    T_ASSERT( mismatches.load() == 0 );
    return true;
}

// [I5]
static bool test_preview()
{
    const std::string path = tmp_path("preview.pxld");
    T_ASSERT( write_sample(path, 1) );
    PxldReader r;
    PxldError e;
    T_ASSERT( r.open(path, &e) );
    Frame f;
    T_ASSERT( r.read_frame(0, f, &e) );

    const SlaveConfigSet cfg = sample_config();
    ImageRGB8 img;
    T_ASSERT( render_frame_rgb(f, &cfg, 2, img, &e) );
    T_ASSERT( img.w == 3*2 && img.h == 2*2 );
    T_ASSERT( img.data.size() == (size_t)img.w*img.h*3 );

    // ligne 0 : esclave 1, LED 0 = octets [0,3)
    T_ASSERT( img.data[0] == f.pixels[0] && img.data[1] == f.pixels[1] && img.data[2] == f.pixels[2] );
    // ligne 1 (y=2) : esclave 7 en gris depuis W (octet 12+3)
    const uint8_t* p = &img.data[(size_t)(2*img.w)*3];
    T_ASSERT( p[0] == f.pixels[15] && p[1] == f.pixels[15] && p[2] == f.pixels[15] );
    // au-delà des 2 LEDs de l’esclave 7 : noir
    const uint8_t* q = &img.data[(size_t)(2*img.w + 4)*3];
    T_ASSERT( q[0] == 0 && q[1] == 0 && q[2] == 0 );

    // sans configuration : RGB brut
    T_ASSERT( render_frame_rgb(f, nullptr, 1, img, &e) );
    T_ASSERT( img.w == 3 && img.h == 2 );
    T_ASSERT( img.data[3*3 + 0] == f.pixels[12] );

    const std::string png = tmp_path("frame.png");
    T_ASSERT( write_png(png, img, &e) );
    std::vector<uint8_t> bytes;
    T_ASSERT( read_whole_file(png, bytes, &e) );
    T_ASSERT( bytes.size() > 8 && bytes[0] == 0x89 && bytes[1] == 'P' && bytes[2] == 'N' && bytes[3] == 'G' );

    ImageRGB8 empty;
    T_ASSERT( !write_png(png, empty, &e) );
    T_ASSERT( e.code == FormatError::SizeMismatch );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    std::error_code ec;
    g_dir = fs::temp_directory_path(ec) / "pxld_minitest_io";
    fs::remove_all(g_dir, ec);
    if(!fs::create_directories(g_dir, ec))
    {
        std::cerr << "[FAIL] cannot create " << g_dir << ": " << ec.message() << "\n";
        return 1;
    }

    bool all_ok = true;
    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] =
    {
        {"writer_reader",  test_writer_reader},
        {"index_sidecar",  test_index_sidecar},
        {"stale_sidecar_without_checksum", test_stale_sidecar_without_checksum},
        {"split",          test_split},
        {"split_segments", test_split_segments},
        {"verify_bin",     test_verify_bin},
        {"parallel_reads", test_parallel_reads},
        {"preview",        test_preview},
    };

    std::cout << "{\n  \"io\": {\n";
    for(const Case& c : cases)
    {
        bool ok = c.fn();
        all_ok = all_ok && ok;
        std::cout << "    \"" << c.name << "\": " << (ok? "true" : "false") << ",\n";
    }
    std::cout << "    \"final_status\": " << (all_ok? "\"PASS\"" : "\"CHECK\"") << "\n";
    std::cout << "  }\n}\n";

    fs::remove_all(g_dir, ec);
    return all_ok? 0 : 1;
}
