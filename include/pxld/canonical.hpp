// ============================================================================
//  File: include/pxld/canonical.hpp — Pixels physiques ↔ RGBW canonique (DOC+)
//  Project: PXLD v3 LED frame container
//
//  RÔLE
//  -----
//  • Normaliser à l’écriture (authoring) les octets bruts d’une LED vers le
//    PixelRecord 4 o du fichier. Le décodeur n’a jamais besoin du type de LED.
//  • Le type de LED vient de la configuration externe, pas du fichier.
//
//  ENCODAGES
//  ---------
//   APA102C       brut [R][G][B] → (R, G, B, 0x1F)   W = luminosité max APA102
//   WS2812B       brut [G][R][B] → (R, G, B, 0xFF)   permutation G/R
//   STANDARD_LED  brut [V]       → (0, 0, 0, V)      monochrome dans W
//
//  INVERSE
//  -------
//  • raw_from_canonical : contrat du transport (canonique → ordre natif).
//    La sentinelle W et les canaux couleur d’une LED mono sont perdus
//    (aller simple voulu).
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pxld/format.hpp"

namespace pxld
{

enum class LedType : uint8_t
{
    APA102C = 0,     // 3 canaux, ordre R,G,B
    WS2812B = 1,     // 3 canaux, ordre G,R,B
    STANDARD_LED = 2 // 1 canal, luminosité
};

constexpr uint8_t kApa102White = 0x1F;
constexpr uint8_t kWs2812White = 0xFF;

const char* led_type_name(LedType t);
bool parse_led_type(const std::string& s, LedType& out);

// Nombre d’octets bruts natifs par LED (3 ou 1).
inline size_t raw_bytes_per_led(LedType t)
{
    return t==LedType::STANDARD_LED? 1 : 3;
}

// `raw` doit contenir au moins raw_bytes_per_led(t) octets (les suivants sont
// ignorés). false + SizeMismatch sinon.
bool canonicalize_led(LedType t, const uint8_t* raw, size_t n, PixelRecord& out, PxldError* err = nullptr);

// Canonique → brut natif (raw_bytes_per_led(t) octets ajoutés à out).
void raw_from_canonical(LedType t, const PixelRecord& px, std::vector<uint8_t>& out);

// Un groupe de LEDs homogène dans la capture brute d’un esclave.
struct OutputSpec
{
    std::string label;
    LedType     type = LedType::APA102C;
    uint32_t    count = 0;            // nombre de LEDs
    uint32_t    data_offset = 0;      // offset dans la capture brute de l’esclave
    uint32_t    bytes_per_pixel = 3;  // >= raw_bytes_per_led(type)
    std::string description;

    uint64_t raw_end() const { return (uint64_t)data_offset + (uint64_t)count*bytes_per_pixel; }
};

// Canonicalise la capture brute d’un esclave, sorties dans l’ordre donné :
// out reçoit Σcount * 4 octets RGBW. SizeMismatch si `raw` est trop court.
bool canonicalize_slave(const std::vector<OutputSpec>& outputs, const uint8_t* raw, size_t n,
                        std::vector<uint8_t>& out, PxldError* err = nullptr);

// Décode un buffer RGBW (longueur multiple de 4) en PixelRecords.
bool pixels_from_bytes(const uint8_t* p, size_t n, std::vector<PixelRecord>& out, PxldError* err = nullptr);

} // namespace pxld
