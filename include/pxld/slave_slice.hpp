// ============================================================================
//  File: include/pxld/slave_slice.hpp
//  Extraction de la tranche d’octets d’un esclave dans le buffer d’une frame.
//  La tranche est une vue (pointeur + longueur) : valide tant que la Frame vit.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pxld/format.hpp"

namespace pxld
{

struct SlaveSlice
{
    const uint8_t* data = nullptr;
    size_t size = 0;

    size_t led_count() const { return size / kBytesPerLed; }

    // Non vérifié : i < led_count() à la charge de l’appelant.
    PixelRecord led(size_t i) const
    {
        const uint8_t* p = data + i*kBytesPerLed;
        return {p[0], p[1], p[2], p[3]};
    }
    // Variante bornée : OutOfRange si i >= led_count().
    bool led_at(size_t i, PixelRecord& out, PxldError* err = nullptr) const
    {
        if(i >= led_count())
            return fail(err, FormatError::OutOfRange,
                        "led " + std::to_string(i) + " not in [0," + std::to_string(led_count()) + ")");
        out = led(i);
        return true;
    }
    std::vector<uint8_t> to_vector() const { return std::vector<uint8_t>(data, data + size); }
};

// Entrée de table pour slave_id (recherche linéaire, ordre de table), nullptr si absente.
const SlaveEntry* find_slave(const Frame& f, uint8_t slave_id);

// [data_offset, data_offset+data_length) du buffer. UnknownSlave si l’id est
// absent, MisalignedSlaveData si data_length n’est pas multiple de 4,
// SlaveRangeOverflow si l’entrée dépasse le buffer (frame construite à la main).
bool slice(const Frame& f, uint8_t slave_id, SlaveSlice& out, PxldError* err = nullptr);

// Les LEDs RGBW de l’esclave.
bool slave_pixels(const Frame& f, uint8_t slave_id, std::vector<PixelRecord>& out, PxldError* err = nullptr);

} // namespace pxld
