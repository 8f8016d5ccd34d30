// ============================================================================
//  File: src/minitest_header.cpp — Tests en-tête 64 o + CRC32 fichier
//  Project: PXLD v3 LED frame container
//
//  Objectifs testés :
//   [H1] encode/decode en-tête : champs identiques, offsets octet-exacts
//   [H2] Refus : magic, version majeure, tailles 32/24, checksum_type, < 64 o
//   [H3] CRC32 [27, EOF) : vecteur connu, bit modifié dans la plage → CRC
//        différent, bit modifié dans [23,27) → CRC inchangé
//   [H4] verify_checksum : fichier intact OK, fichier altéré ChecksumMismatch,
//        checksum_type=0 → pas de vérification
//
//  Exécution :
//    ./minitest_header  -> rapport JSON sur stdout, code 0 si PASS
// ============================================================================

#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "pxld/byte_source.hpp"
#include "pxld/crc32.hpp"
#include "pxld/header_codec.hpp"
#include "pxld/writer.hpp"

using namespace pxld;

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static FileHeader sample_header()
{
    FileHeader h;
    h.minor_version = 0;
    h.fps = 40;
    h.total_slaves = 2;
    h.total_frames = 3;
    h.total_pixels = 16;
    h.udp_port = 4050;
    h.file_crc32 = 0xDEADBEEFu;
    h.checksum_type = 1;
    return h;
}

// Petit fichier valide : 2 frames, 2 esclaves (10 + 6 LEDs).
static std::vector<uint8_t> sample_file(ChecksumType ck = ChecksumType::Crc32)
{
    const std::vector<SlaveLayout> layout = { {1, 10}, {2, 6} };
    std::vector<SlaveEntry> table;
    make_slave_table(layout, table);
    std::vector<Frame> frames(2);
    for(size_t i=0; i<frames.size(); ++i)
    {
        frames[i].slaves = table;
        frames[i].pixels.resize(table_pixel_bytes(table));
        for(size_t k=0; k<frames[i].pixels.size(); ++k) frames[i].pixels[k] = (uint8_t)(k*7 + i*31);
    }
    FileHeader h;
    h.fps = 40;
    h.total_pixels = 16;
    h.checksum_type = (uint8_t)ck;
    std::vector<uint8_t> out;
    encode_file(h, frames, out);
    return out;
}

// [H1]
static bool test_header_roundtrip()
{
    const FileHeader h = sample_header();
    std::vector<uint8_t> b = encode_header(h);
    T_ASSERT( b.size() == kHeaderSize );
    T_ASSERT( std::memcmp(b.data(), "PXLD", 4) == 0 );
    T_ASSERT( b[4] == 3 && b[6] == 40 );
    T_ASSERT( get_le16(&b[7]) == 2 );
    T_ASSERT( get_le32(&b[9]) == 3 );
    T_ASSERT( get_le16(&b[17]) == 32 && get_le16(&b[19]) == 24 );
    T_ASSERT( get_le16(&b[21]) == 4050 );
    T_ASSERT( get_le32(&b[23]) == 0xDEADBEEFu );
    T_ASSERT( b[27] == 1 );
    for(size_t i=28; i<kHeaderSize; ++i) T_ASSERT( b[i] == 0 );

    FileHeader d;
    PxldError e;
    T_ASSERT( decode_header(b.data(), b.size(), d, &e) );
    T_ASSERT( d == h );

    // reserved non nul conservé en lecture
    b[40] = 0x5A;
    T_ASSERT( decode_header(b.data(), b.size(), d, &e) );
    T_ASSERT( d.reserved[40-28] == 0x5A );
    return true;
}

// [H2]
static bool expect_reject(std::vector<uint8_t> b, FormatError code)
{
    FileHeader d;
    PxldError e;
    T_ASSERT( !decode_header(b.data(), b.size(), d, &e) );
    T_ASSERT( e.code == code );
    T_ASSERT( !e.message().empty() );
    return true;
}

static bool test_header_rejects()
{
    const std::vector<uint8_t> ok = encode_header(sample_header());

    std::vector<uint8_t> b = ok;
    b[0] = 'X';
    T_ASSERT( expect_reject(b, FormatError::BadMagic) );

    b = ok;
    b[4] = 2;
    T_ASSERT( expect_reject(b, FormatError::UnsupportedVersion) );
    b[4] = 4;
    T_ASSERT( expect_reject(b, FormatError::UnsupportedVersion) );

    b = ok;
    put_le16(&b[17], 28);
    T_ASSERT( expect_reject(b, FormatError::StructuralMismatch) );
    b = ok;
    put_le16(&b[19], 32);
    T_ASSERT( expect_reject(b, FormatError::StructuralMismatch) );
    b = ok;
    b[27] = 2;
    T_ASSERT( expect_reject(b, FormatError::StructuralMismatch) );

    b = ok;
    b.resize(63);
    T_ASSERT( expect_reject(b, FormatError::TruncatedFile) );

    // version mineure libre
    b = ok;
    b[5] = 7;
    FileHeader d;
    T_ASSERT( decode_header(b.data(), b.size(), d) );
    T_ASSERT( d.minor_version == 7 );
    return true;
}

// [H3]
static bool test_crc_range()
{
    // Vecteur de référence CRC-32 (IEEE) : "123456789" → 0xCBF43926
    const char* v = "123456789";
    T_ASSERT( crc32((const uint8_t*)v, 9) == 0xCBF43926u );

    std::vector<uint8_t> f = sample_file();
    const uint32_t base = compute_file_checksum(f.data(), f.size());
    T_ASSERT( base == get_le32(&f[kChecksumOffset]) );

    // bit modifié dans [27, EOF) : CRC différent
    const size_t offsets[] = { 27, 28, 63, 64, 100, f.size()-1 };
    for(size_t pos : offsets)
    {
        std::vector<uint8_t> g = f;
        g[pos] ^= 0x01;
        T_ASSERT( compute_file_checksum(g.data(), g.size()) != base );
    }
    // bit modifié dans le champ CRC lui-même : CRC inchangé
    for(size_t pos=kChecksumOffset; pos<kChecksumTypeOffset; ++pos)
    {
        std::vector<uint8_t> g = f;
        g[pos] ^= 0x80;
        T_ASSERT( compute_file_checksum(g.data(), g.size()) == base );
    }

    // version flux == version mémoire
    MemorySource src(f);
    uint32_t streamed = 0;
    T_ASSERT( compute_file_checksum(src, streamed) );
    T_ASSERT( streamed == base );
    return true;
}

// [H4]
static bool test_verify_checksum()
{
    std::vector<uint8_t> f = sample_file();
    PxldError e;
    T_ASSERT( verify_checksum(f.data(), f.size(), &e) );

    std::vector<uint8_t> g = f;
    g[g.size()/2] ^= 0x10;
    T_ASSERT( !verify_checksum(g.data(), g.size(), &e) );
    T_ASSERT( e.code == FormatError::ChecksumMismatch );

    FileHeader h;
    T_ASSERT( decode_header(g.data(), kHeaderSize, h) );
    MemorySource src(g);
    e = PxldError{};
    T_ASSERT( !verify_checksum(src, h, &e) );
    T_ASSERT( e.code == FormatError::ChecksumMismatch );

    // checksum_type=0 : champ CRC à 0, pas de vérification
    std::vector<uint8_t> n = sample_file(ChecksumType::None);
    T_ASSERT( get_le32(&n[kChecksumOffset]) == 0 );
    n[n.size()-1] ^= 0xFF;
    T_ASSERT( verify_checksum(n.data(), n.size(), &e) );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool all_ok = true;
    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] =
    {
        {"header_roundtrip", test_header_roundtrip},
        {"header_rejects",   test_header_rejects},
        {"crc_range",        test_crc_range},
        {"verify_checksum",  test_verify_checksum},
    };

    std::cout << "{\n  \"header\": {\n";
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
