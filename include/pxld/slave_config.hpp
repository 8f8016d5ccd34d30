// ============================================================================
//  File: include/pxld/slave_config.hpp — Configuration des esclaves (DOC+)
//  Project: PXLD v3 LED frame container
//
//  OBJET
//  -----
//  • Charger le document de configuration matériel (JSON) qui associe à
//    chaque esclave ses sorties LED : type, nombre, offset brut, octets/LED.
//  • Source du mapping type-de-LED → encodage pour le canonicaliseur et des
//    tailles de capture brute pour l’authoring.
//
//  FORMAT ACCEPTÉ
//  --------------
//   [ {slave}, ... ]                 ou   { "slaves": [ {slave}, ... ] }
//   slave  = { "slave_id": 0, "name": "...", "description": "...",
//              "outputs": [ {output}, ... ] }
//   output = { "label": "...", "type": "APA102C|WS2812B|STANDARD_LED",
//              "count": 10, "data_offset": 0, "bytes_per_pixel": 3,
//              "description": "..." }
//
//  REMARQUES
//  ---------
//  • Scanner JSON-lite naïf (clés/chaînes/entiers, tableaux d’objets) :
//    pas d’échappements unicode, pas de flottants. Suffisant pour ce document.
//  • bytes_per_pixel absent → 3, pour tous les types (STANDARD_LED compris).
//  • slave_id absent ou en double, type inconnu, bytes_per_pixel trop petit
//    → ConfigInvalid.
// ============================================================================

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "pxld/canonical.hpp"
#include "pxld/format.hpp"

namespace pxld
{

// ------------------ JSON-lite helpers (naïfs)
namespace json_lite
{
bool find_key(const std::string& js, const std::string& key, size_t& value_pos);
bool find_str(const std::string& js, const std::string& key, std::string& out);
bool find_uint(const std::string& js, const std::string& key, uint64_t& out);
// Contenu entre '[' et ']' du tableau `key` (profondeur respectée).
bool find_array(const std::string& js, const std::string& key, std::string& body);
// Objets {...} de premier niveau dans le contenu d’un tableau.
std::vector<std::string> split_objects(const std::string& array_body);
// Copie de js où le tableau `key` est vidé (évite les clés imbriquées homonymes).
std::string strip_array(const std::string& js, const std::string& key);
}

struct SlaveConfig
{
    uint8_t slave_id = 0;
    std::string name;
    std::string description;
    std::vector<OutputSpec> outputs;

    uint32_t pixel_count() const;
    uint32_t channel_count() const { return pixel_count() * (uint32_t)kBytesPerLed; }
    // Octets de capture brute nécessaires : max(data_offset + count*bpp).
    uint64_t raw_length() const;
    // Type de la LED n° led_index (ordre des sorties). false si hors plage.
    bool led_type_at(uint32_t led_index, LedType& out) const;
    bool is_monochrome() const;
};

struct SlaveConfigSet
{
    std::vector<SlaveConfig> slaves; // ordre du document

    const SlaveConfig* find(uint8_t slave_id) const;
    bool empty() const { return slaves.empty(); }
};

bool parse_slave_config(const std::string& json, SlaveConfigSet& out, PxldError* err = nullptr);
bool load_slave_config(const std::string& path, SlaveConfigSet& out, PxldError* err = nullptr);

} // namespace pxld
