// ============================================================================
//  File: include/pxld/preview.hpp — Aperçu PNG d’une frame (DOC+)
//  Project: PXLD v3 LED frame container
//
//  OBJET
//  -----
//  • Une ligne par esclave (ordre de table), une colonne par LED, bloc de
//    scale×scale pixels par LED. Largeur = max des LEDs par esclave.
//  • Avec configuration : les LEDs STANDARD_LED sont rendues en gris (W).
//    Sans configuration : RGB seul (W ignoré).
//  • Écriture PNG via stb_image_write (TU d’implémentation : compile_stb.cpp).
// ============================================================================

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "pxld/format.hpp"
#include "pxld/slave_config.hpp"

namespace pxld
{

struct ImageRGB8
{
    int w=0, h=0;
    std::vector<uint8_t> data; // w*h*3
};

// cfg peut être nullptr. scale >= 1.
bool render_frame_rgb(const Frame& f, const SlaveConfigSet* cfg, int scale, ImageRGB8& out,
                      PxldError* err = nullptr);

bool write_png(const std::string& path, const ImageRGB8& img, PxldError* err = nullptr);

} // namespace pxld
