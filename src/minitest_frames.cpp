// ============================================================================
//  File: src/minitest_frames.cpp — Tests frames, index, tranches d’esclaves
//  Project: PXLD v3 LED frame container
//
//  Objectifs testés :
//   [F1] encode/decode frame : identité, tailles recalculées
//   [F2] Index : offset(i) = 64 + i*(32 + S*24 + P), OutOfRange à total_frames
//   [F3] Tranche : esclave {offset 40, longueur 24} → octets [40,64), 6 LEDs,
//        led_at hors bornes → OutOfRange
//   [F4] Refus table : doublon, débordement, chevauchement, mal-aligné, inconnu
//   [F5] Fichier altéré : IndexCorruption, TruncatedFile (y compris étendue
//        gonflée derrière un index déjà construit), SizeMismatch,
//        ChecksumMismatch (fatal, aucun index)
//   [F6] Bout en bout : fichier minimal forgé octet par octet
//
//  Exécution :
//    ./minitest_frames  -> rapport JSON sur stdout, code 0 si PASS
// ============================================================================

#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "pxld/byte_source.hpp"
#include "pxld/crc32.hpp"
#include "pxld/frame_codec.hpp"
#include "pxld/header_codec.hpp"
#include "pxld/reader.hpp"
#include "pxld/slave_slice.hpp"
#include "pxld/writer.hpp"

using namespace pxld;

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

// Esclaves 1 (10 LEDs → [0,40)) et 2 (6 LEDs → [40,64)), P = 64.
static std::vector<SlaveEntry> sample_table()
{
    const std::vector<SlaveLayout> layout = { {1, 10}, {2, 6} };
    std::vector<SlaveEntry> table;
    make_slave_table(layout, table);
    return table;
}

static Frame sample_frame(uint32_t id)
{
    Frame f;
    f.header.frame_id = id;
    f.slaves = sample_table();
    f.pixels.resize(64);
    for(size_t k=0; k<f.pixels.size(); ++k) f.pixels[k] = (uint8_t)(k + id*3);
    return f;
}

static std::vector<uint8_t> sample_file(uint32_t frames)
{
    std::vector<Frame> v;
    for(uint32_t i=0; i<frames; ++i) v.push_back(sample_frame(i));
    FileHeader h;
    h.fps = 40;
    h.total_pixels = 16;
    std::vector<uint8_t> out;
    encode_file(h, v, out);
    return out;
}

static void repatch_crc(std::vector<uint8_t>& f)
{
    put_le32(&f[kChecksumOffset], compute_file_checksum(f.data(), f.size()));
}

// [F1]
static bool test_frame_roundtrip()
{
    Frame f = sample_frame(5);
    f.header.flags = 0x0102;
    f.header.slave_table_size = 999; // recalculé à l’encodage
    std::vector<uint8_t> b = encode_frame(f);
    T_ASSERT( b.size() == 32 + 2*24 + 64 );
    T_ASSERT( get_le32(&b[0]) == 5 );
    T_ASSERT( get_le32(&b[8]) == 48 );
    T_ASSERT( get_le32(&b[12]) == 64 );

    // SlaveEntry octet-exact
    const uint8_t* e2 = &b[32 + 24];
    T_ASSERT( e2[0] == 2 );
    T_ASSERT( get_le16(e2+2) == 41 );   // channel_start 1-based cumulatif
    T_ASSERT( get_le16(e2+4) == 24 );
    T_ASSERT( get_le16(e2+6) == 6 );
    T_ASSERT( get_le32(e2+8) == 40 );
    T_ASSERT( get_le32(e2+12) == 24 );

    Frame d;
    PxldError e;
    T_ASSERT( decode_frame_bytes(b.data(), b.size(), 2, 5, d, &e) );
    f.header.slave_table_size = 48;
    f.header.pixel_data_size = 64;
    T_ASSERT( d == f );

    T_ASSERT( !decode_frame_bytes(b.data(), b.size(), 2, 6, d, &e) );
    T_ASSERT( e.code == FormatError::IndexCorruption );
    T_ASSERT( !decode_frame_bytes(b.data(), b.size()-1, 2, 5, d, &e) );
    T_ASSERT( e.code == FormatError::TruncatedFile );
    return true;
}

// [F2]
static bool test_index()
{
    std::vector<uint8_t> f = sample_file(4);
    MemorySource src(f);
    VerifiedFile vf;
    PxldError e;
    T_ASSERT( open_verified(src, vf, &e) );
    T_ASSERT( vf.frame_count() == 4 );
    T_ASSERT( vf.index.size() == 4 );
    const uint64_t stride = 32 + 2*24 + 64;
    for(uint32_t i=0; i<4; ++i) T_ASSERT( vf.index[i] == 64 + i*stride );
    T_ASSERT( f.size() == 64 + 4*stride );

    for(uint32_t i=0; i<4; ++i)
    {
        Frame fr;
        T_ASSERT( decode_frame(src, vf.header, vf.index, i, fr, &e) );
        T_ASSERT( fr.header.frame_id == i );
        T_ASSERT( fr.pixels == sample_frame(i).pixels );
    }

    Frame fr;
    T_ASSERT( !decode_frame(src, vf.header, vf.index, 4, fr, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );

    // timestamps dérivés : 40 fps → 25 ms par frame
    T_ASSERT( vf.timestamp_ms(0) == 0.0 );
    T_ASSERT( vf.timestamp_ms(3) == 75.0 );
    T_ASSERT( frame_timestamp_ms(1, 30) > 33.33 && frame_timestamp_ms(1, 30) < 33.34 );
    T_ASSERT( frame_timestamp_ms(10, 0) == 0.0 );

    // zéro frame : index vide
    std::vector<uint8_t> empty = sample_file(0);
    T_ASSERT( empty.size() == 64 );
    MemorySource es(empty);
    T_ASSERT( open_verified(es, vf, &e) );
    T_ASSERT( vf.index.empty() );
    return true;
}

// [F3]
static bool test_slice()
{
    Frame f = sample_frame(0);
    SlaveSlice s;
    PxldError e;
    T_ASSERT( slice(f, 2, s, &e) );
    T_ASSERT( s.size == 24 );
    T_ASSERT( s.led_count() == 6 );
    T_ASSERT( s.data == f.pixels.data() + 40 );
    T_ASSERT( s.to_vector() == std::vector<uint8_t>(f.pixels.begin()+40, f.pixels.end()) );

    PixelRecord p = s.led(1);
    T_ASSERT( p.r == 44 && p.g == 45 && p.b == 46 && p.w == 47 );

    // accès borné
    PixelRecord q{};
    T_ASSERT( s.led_at(5, q, &e) );
    T_ASSERT( q == s.led(5) );
    T_ASSERT( !s.led_at(6, q, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );

    std::vector<PixelRecord> px;
    T_ASSERT( slave_pixels(f, 1, px, &e) );
    T_ASSERT( px.size() == 10 );
    T_ASSERT( px[9].w == 39 );

    T_ASSERT( !slice(f, 3, s, &e) );
    T_ASSERT( e.code == FormatError::UnknownSlave );
    T_ASSERT( find_slave(f, 3) == nullptr );

    // esclave vide : tranche de longueur nulle
    Frame z = f;
    SlaveEntry extra{};
    extra.slave_id = 9;
    extra.data_offset = 64;
    z.slaves.push_back(extra);
    T_ASSERT( slice(z, 9, s, &e) );
    T_ASSERT( s.size == 0 && s.led_count() == 0 );
    T_ASSERT( !s.led_at(0, q, &e) );
    T_ASSERT( e.code == FormatError::OutOfRange );
    return true;
}

// [F4]
static bool expect_table_reject(const Frame& f, FormatError code)
{
    std::vector<uint8_t> b = encode_frame(f);
    Frame d;
    PxldError e;
    T_ASSERT( !decode_frame_bytes(b.data(), b.size(), (uint16_t)f.slaves.size(), f.header.frame_id, d, &e) );
    T_ASSERT( e.code == code );
    return true;
}

static bool test_table_rejects()
{
    Frame f = sample_frame(0);
    f.slaves[1].slave_id = 1;
    T_ASSERT( expect_table_reject(f, FormatError::DuplicateSlaveId) );

    f = sample_frame(0);
    f.slaves[1].data_length = 28;     // [40,68) > 64
    T_ASSERT( expect_table_reject(f, FormatError::SlaveRangeOverflow) );

    f = sample_frame(0);
    f.slaves[1].data_offset = 36;     // [36,60) ∩ [0,40)
    T_ASSERT( expect_table_reject(f, FormatError::SlaveRangeOverlap) );

    // contigu non chevauchant, ordre inverse : accepté
    f = sample_frame(0);
    std::swap(f.slaves[0], f.slaves[1]);
    std::vector<uint8_t> b = encode_frame(f);
    Frame d;
    PxldError e;
    T_ASSERT( decode_frame_bytes(b.data(), b.size(), 2, 0, d, &e) );

    // data_length non multiple de 4 : la frame se décode, la tranche non
    f = sample_frame(0);
    f.slaves[1].data_length = 22;
    b = encode_frame(f);
    T_ASSERT( decode_frame_bytes(b.data(), b.size(), 2, 0, d, &e) );
    SlaveSlice s;
    T_ASSERT( !slice(d, 2, s, &e) );
    T_ASSERT( e.code == FormatError::MisalignedSlaveData );

    // slave_table_size incohérent avec total_slaves
    f = sample_frame(0);
    b = encode_frame(f);
    T_ASSERT( !decode_frame_bytes(b.data(), b.size(), 3, 0, d, &e) );
    T_ASSERT( e.code == FormatError::SizeMismatch );
    return true;
}

// [F5]
static bool test_damaged_files()
{
    const uint64_t stride = 32 + 2*24 + 64;
    PxldError e;
    VerifiedFile vf;
    Frame fr;

    // frame_id faux à l’offset de la frame 1 (CRC recalculé)
    std::vector<uint8_t> f = sample_file(3);
    put_le32(&f[64 + stride], 7);
    repatch_crc(f);
    {
        MemorySource src(f);
        T_ASSERT( open_verified(src, vf, &e) );
        T_ASSERT( decode_frame(src, vf.header, vf.index, 0, fr, &e) );
        T_ASSERT( !decode_frame(src, vf.header, vf.index, 1, fr, &e) );
        T_ASSERT( e.code == FormatError::IndexCorruption );
    }

    // index construit sur le fichier sain, pixel_data_size gonflé ensuite :
    // refus TruncatedFile avant allocation
    f = sample_file(3);
    {
        MemorySource good(f);
        T_ASSERT( open_verified(good, vf, &e) );
    }
    put_le32(&f[64 + stride + 12], 0xFFFFFFF0u);
    {
        MemorySource src(f);
        T_ASSERT( !decode_frame(src, vf.header, vf.index, 1, fr, &e) );
        T_ASSERT( e.code == FormatError::TruncatedFile );
        T_ASSERT( decode_frame(src, vf.header, vf.index, 2, fr, &e) );
    }

    // dernier octet absent
    f = sample_file(3);
    f.pop_back();
    repatch_crc(f);
    {
        MemorySource src(f);
        T_ASSERT( !open_verified(src, vf, &e) );
        T_ASSERT( e.code == FormatError::TruncatedFile );
    }

    // total_frames surévalué : l’en-tête de frame manque
    f = sample_file(2);
    put_le32(&f[9], 3);
    {
        MemorySource src(f);
        T_ASSERT( !open_verified(src, vf, &e) );
        T_ASSERT( e.code == FormatError::TruncatedFile );
    }

    // slave_table_size de la frame 0 incohérent
    f = sample_file(2);
    put_le32(&f[64 + 8], 24);
    repatch_crc(f);
    {
        MemorySource src(f);
        T_ASSERT( !open_verified(src, vf, &e) );
        T_ASSERT( e.code == FormatError::SizeMismatch );
    }

    // CRC faux : fatal, résultat non modifié
    f = sample_file(2);
    f[64 + 32 + 48 + 10] ^= 0x04;
    {
        MemorySource src(f);
        VerifiedFile untouched;
        T_ASSERT( !open_verified(src, untouched, &e) );
        T_ASSERT( e.code == FormatError::ChecksumMismatch );
        T_ASSERT( untouched.index.empty() );
    }

    // fichier plus court que l’en-tête
    std::vector<uint8_t> tiny(20, 0);
    {
        MemorySource src(tiny);
        T_ASSERT( !open_verified(src, vf, &e) );
        T_ASSERT( e.code == FormatError::TruncatedFile );
    }
    return true;
}

// [F6] fichier forgé : 40 fps, 1 frame, 1 esclave (id 0), 1 LED (255,0,0,31)
static bool test_crafted_file()
{
    std::vector<uint8_t> f(64 + 32 + 24 + 4, 0);
    std::memcpy(&f[0], "PXLD", 4);
    f[4] = 3;
    f[6] = 40;
    put_le16(&f[7], 1);
    put_le32(&f[9], 1);
    put_le32(&f[13], 1);
    put_le16(&f[17], 32);
    put_le16(&f[19], 24);
    put_le16(&f[21], 4050);
    f[27] = 1;
    uint8_t* fh = &f[64];
    put_le32(fh+8, 24);
    put_le32(fh+12, 4);
    uint8_t* se = &f[96];
    se[0] = 0;
    put_le16(se+2, 1);
    put_le16(se+4, 4);
    put_le16(se+6, 1);
    put_le32(se+8, 0);
    put_le32(se+12, 4);
    f[120] = 255;
    f[123] = 31;
    put_le32(&f[23], crc32(&f[27], f.size()-27));

    MemorySource src(f);
    VerifiedFile vf;
    PxldError e;
    T_ASSERT( open_verified(src, vf, &e) );
    T_ASSERT( vf.header.fps == 40 && vf.header.udp_port == 4050 );
    T_ASSERT( vf.header.total_pixels == 1 );
    T_ASSERT( vf.index.size() == 1 && vf.index[0] == 64 );

    Frame fr;
    T_ASSERT( decode_frame(src, vf.header, vf.index, 0, fr, &e) );
    T_ASSERT( vf.timestamp_ms(fr.header.frame_id) == 0.0 );
    std::vector<PixelRecord> px;
    T_ASSERT( fr.slaves.size() == 1 && fr.slaves[0].slave_id == 0 );
    T_ASSERT( slave_pixels(fr, 0, px, &e) );
    T_ASSERT( px.size() == 1 );
    const PixelRecord red{255, 0, 0, 31};
    T_ASSERT( px[0] == red );

    // réencodage identique octet par octet
    std::vector<uint8_t> again;
    T_ASSERT( encode_file(vf.header, std::vector<Frame>{fr}, again, &e) );
    T_ASSERT( again == f );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool all_ok = true;
    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] =
    {
        {"frame_roundtrip", test_frame_roundtrip},
        {"index",           test_index},
        {"slice",           test_slice},
        {"table_rejects",   test_table_rejects},
        {"damaged_files",   test_damaged_files},
        {"crafted_file",    test_crafted_file},
    };

    std::cout << "{\n  \"frames\": {\n";
    for(const Case& c : cases)
    {
        bool ok = c.fn();
        all_ok = all_ok && ok;
        std::cout << "    \"" << c.name << "\": " << (ok? "true" : "false") << ",\n";
    }
    std::cout << "    \"final_status\": " << (all_ok? "\"PASS\"" : "\"CHECK\"") << "\n";
    std::cout << "  }\n}\n";
    return all_ok? 0 : 1;
}
