// ============================================================================
//  File: src/minitest_canonical.cpp — Tests canonicalisation LED + config
//  Project: PXLD v3 LED frame container
//
//  Objectifs testés :
//   [C1] Une LED : APA102C (R,G,B)→(R,G,B,0x1F), WS2812B (G,R,B)→(R,G,B,0xFF),
//        STANDARD_LED v→(0,0,0,v), capture trop courte → SizeMismatch
//   [C2] Un esclave multi-sorties : data_offset, bytes_per_pixel > natif,
//        bytes_per_pixel absent → 3 y compris STANDARD_LED
//   [C3] Document de configuration : formes acceptées, refus ConfigInvalid
//   [C4] Table d’esclaves dérivée : channel_start 1-based cumulatif,
//        limites 16 bits
//
//  Exécution :
//    ./minitest_canonical  -> rapport JSON sur stdout, code 0 si PASS
// ============================================================================

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "pxld/canonical.hpp"
#include "pxld/slave_config.hpp"
#include "pxld/writer.hpp"

using namespace pxld;

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static const char* kConfigDoc = R"({
  "version": 3,
  "slaves": [
    {
      "slave_id": 1,
      "name": "Façade",
      "description": "bandeau [haut]",
      "outputs": [
        {"label": "A", "type": "APA102C", "count": 2, "data_offset": 0, "bytes_per_pixel": 4},
        {"label": "B", "type": "WS2812B", "count": 1, "data_offset": 8}
      ]
    },
    {
      "slave_id": 7,
      "name": "Mono",
      "outputs": [
        {"label": "dim", "type": "STANDARD_LED", "count": 3, "data_offset": 0}
      ]
    }
  ]
})";

// [C1]
static bool test_single_led()
{
    const uint8_t raw[3] = {10, 20, 30};
    PixelRecord p;
    PxldError e;

    T_ASSERT( canonicalize_led(LedType::APA102C, raw, 3, p, &e) );
    T_ASSERT( p == (PixelRecord{10, 20, 30, 0x1F}) );

    T_ASSERT( canonicalize_led(LedType::WS2812B, raw, 3, p, &e) );
    T_ASSERT( p == (PixelRecord{20, 10, 30, 0xFF}) );

    const uint8_t mono = 0x80;
    T_ASSERT( canonicalize_led(LedType::STANDARD_LED, &mono, 1, p, &e) );
    T_ASSERT( p == (PixelRecord{0, 0, 0, 0x80}) );

    T_ASSERT( !canonicalize_led(LedType::WS2812B, raw, 2, p, &e) );
    T_ASSERT( e.code == FormatError::SizeMismatch );

    // retour vers l’ordre natif
    std::vector<uint8_t> back;
    raw_from_canonical(LedType::WS2812B, PixelRecord{20, 10, 30, 0xFF}, back);
    T_ASSERT( back == std::vector<uint8_t>({10, 20, 30}) );

    LedType t;
    T_ASSERT( parse_led_type("STANDARD_LED", t) && t==LedType::STANDARD_LED );
    T_ASSERT( !parse_led_type("apa102c", t) );
    T_ASSERT( std::string(led_type_name(LedType::APA102C)) == "APA102C" );
    return true;
}

// [C2]
static bool test_slave_canonicalization()
{
    SlaveConfigSet cfg;
    PxldError e;
    T_ASSERT( parse_slave_config(kConfigDoc, cfg, &e) );
    const SlaveConfig* s1 = cfg.find(1);
    T_ASSERT( s1 != nullptr );
    T_ASSERT( s1->raw_length() == 11 );

    // A : 2 LEDs de 4 octets (dernier octet ignoré), B : 1 LED à l’offset 8
    const std::vector<uint8_t> raw = {1,2,3,99, 4,5,6,99, 7,8,9};
    std::vector<uint8_t> out;
    T_ASSERT( canonicalize_slave(s1->outputs, raw.data(), raw.size(), out, &e) );
    const std::vector<uint8_t> expect =
    {
        1,2,3,0x1F,
        4,5,6,0x1F,
        8,7,9,0xFF
    };
    T_ASSERT( out == expect );

    // capture trop courte pour la sortie B
    out.clear();
    T_ASSERT( !canonicalize_slave(s1->outputs, raw.data(), 10, out, &e) );
    T_ASSERT( e.code == FormatError::SizeMismatch );

    // bytes_per_pixel absent : pas de 3 octets, valeur dans le premier
    const SlaveConfig* s7 = cfg.find(7);
    T_ASSERT( s7 != nullptr && s7->is_monochrome() );
    T_ASSERT( s7->outputs[0].bytes_per_pixel == 3 );
    T_ASSERT( s7->raw_length() == 9 );
    const std::vector<uint8_t> dim = {0,9,9, 0x80,9,9, 0xFF,9,9};
    out.clear();
    T_ASSERT( canonicalize_slave(s7->outputs, dim.data(), dim.size(), out, &e) );
    T_ASSERT( out.size() == 12 );
    T_ASSERT( out[3] == 0 && out[7] == 0x80 && out[11] == 0xFF );
    T_ASSERT( out[4] == 0 && out[5] == 0 && out[6] == 0 );

    std::vector<PixelRecord> px;
    T_ASSERT( pixels_from_bytes(out.data(), out.size(), px, &e) );
    T_ASSERT( px.size() == 3 && px[1].w == 0x80 );
    T_ASSERT( !pixels_from_bytes(out.data(), 7, px, &e) );
    T_ASSERT( e.code == FormatError::MisalignedSlaveData );
    return true;
}

// [C3]
static bool expect_config_reject(const std::string& js)
{
    SlaveConfigSet cfg;
    PxldError e;
    T_ASSERT( !parse_slave_config(js, cfg, &e) );
    T_ASSERT( e.code == FormatError::ConfigInvalid );
    return true;
}

static bool test_config_document()
{
    SlaveConfigSet cfg;
    PxldError e;
    T_ASSERT( parse_slave_config(kConfigDoc, cfg, &e) );
    T_ASSERT( cfg.slaves.size() == 2 );
    T_ASSERT( cfg.slaves[0].slave_id == 1 && cfg.slaves[1].slave_id == 7 );
    T_ASSERT( cfg.slaves[0].name == "Façade" );
    T_ASSERT( cfg.slaves[0].description == "bandeau [haut]" );
    T_ASSERT( cfg.slaves[0].outputs.size() == 2 );
    T_ASSERT( cfg.slaves[0].outputs[0].bytes_per_pixel == 4 );
    T_ASSERT( cfg.slaves[0].outputs[1].bytes_per_pixel == 3 );
    T_ASSERT( cfg.slaves[1].outputs[0].bytes_per_pixel == 3 );

    // STANDARD_LED tassé à 1 octet : à déclarer explicitement
    const std::string packed =
        R"({"slaves": [ {"slave_id": 2, "outputs": [ {"type": "STANDARD_LED", "count": 4, "bytes_per_pixel": 1} ]} ]})";
    SlaveConfigSet pk;
    T_ASSERT( parse_slave_config(packed, pk, &e) );
    T_ASSERT( pk.slaves[0].outputs[0].bytes_per_pixel == 1 && pk.slaves[0].raw_length() == 4 );
    T_ASSERT( cfg.slaves[0].pixel_count() == 3 );
    T_ASSERT( cfg.slaves[0].channel_count() == 12 );
    T_ASSERT( !cfg.slaves[0].is_monochrome() );
    T_ASSERT( cfg.find(2) == nullptr );

    LedType t;
    T_ASSERT( cfg.slaves[0].led_type_at(1, t) && t==LedType::APA102C );
    T_ASSERT( cfg.slaves[0].led_type_at(2, t) && t==LedType::WS2812B );
    T_ASSERT( !cfg.slaves[0].led_type_at(3, t) );

    // tableau nu au niveau racine
    const std::string bare = R"([ {"slave_id": 3, "outputs": [ {"type": "APA102C", "count": 5} ]} ])";
    T_ASSERT( parse_slave_config(bare, cfg, &e) );
    T_ASSERT( cfg.slaves.size() == 1 && cfg.slaves[0].pixel_count() == 5 );

    T_ASSERT( expect_config_reject("") );
    T_ASSERT( expect_config_reject(R"({"version": 3})") );
    T_ASSERT( expect_config_reject(R"({"slaves": []})") );
    T_ASSERT( expect_config_reject(R"({"slaves": [ {"name": "sans id"} ]})") );
    T_ASSERT( expect_config_reject(R"({"slaves": [ {"slave_id": 300} ]})") );
    T_ASSERT( expect_config_reject(R"({"slaves": [ {"slave_id": 1}, {"slave_id": 1} ]})") );
    T_ASSERT( expect_config_reject(
                  R"({"slaves": [ {"slave_id": 1, "outputs": [ {"type": "SK6812", "count": 1} ]} ]})") );
    T_ASSERT( expect_config_reject(
                  R"({"slaves": [ {"slave_id": 1, "outputs": [ {"count": 1} ]} ]})") );
    T_ASSERT( expect_config_reject(
                  R"({"slaves": [ {"slave_id": 1, "outputs": [ {"type": "WS2812B", "count": 1, "bytes_per_pixel": 2} ]} ]})") );
    T_ASSERT( expect_config_reject("[ {\"slave_id\": 1 ") );

    T_ASSERT( !load_slave_config("/nonexistent/pxld_slaves.json", cfg, &e) );
    T_ASSERT( e.code == FormatError::IoError );
    return true;
}

// [C4]
static bool test_slave_table()
{
    SlaveConfigSet cfg;
    PxldError e;
    T_ASSERT( parse_slave_config(kConfigDoc, cfg, &e) );
    std::vector<SlaveEntry> t;
    T_ASSERT( make_slave_table(cfg, t, &e) );
    T_ASSERT( t.size() == 2 );
    T_ASSERT( t[0].slave_id == 1 && t[0].channel_start == 1 && t[0].channel_count == 12 );
    T_ASSERT( t[0].pixel_count == 3 && t[0].data_offset == 0 && t[0].data_length == 12 );
    T_ASSERT( t[1].slave_id == 7 && t[1].channel_start == 13 && t[1].channel_count == 12 );
    T_ASSERT( t[1].data_offset == 12 && t[1].data_length == 12 );
    T_ASSERT( table_pixel_bytes(t) == 24 );

    const std::vector<SlaveLayout> big = { {1, 20000} };
    T_ASSERT( !make_slave_table(big, t, &e) );
    T_ASSERT( e.code == FormatError::SizeMismatch );

    const std::vector<SlaveLayout> dup = { {4, 1}, {4, 2} };
    T_ASSERT( !make_slave_table(dup, t, &e) );
    T_ASSERT( e.code == FormatError::DuplicateSlaveId );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool all_ok = true;
    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] =
    {
        {"single_led",             test_single_led},
        {"slave_canonicalization", test_slave_canonicalization},
        {"config_document",        test_config_document},
        {"slave_table",            test_slave_table},
    };

    std::cout << "{\n  \"canonical\": {\n";
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
