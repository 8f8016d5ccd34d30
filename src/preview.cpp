// ============================================================================
//  File: src/preview.cpp — Rendu RGB d’une frame + PNG (stb_image_write)
// ============================================================================

#include "pxld/preview.hpp"
#include "pxld/slave_slice.hpp"

#include <algorithm>
#include <utility>

#include "stb_image_write.h"

namespace pxld
{

bool render_frame_rgb(const Frame& f, const SlaveConfigSet* cfg, int scale, ImageRGB8& out, PxldError* err)
{
    if(scale < 1) scale = 1;
    if(f.slaves.empty()) return fail(err, FormatError::SizeMismatch, "frame has no slave");

    size_t max_leds = 1;
    for(const SlaveEntry& e : f.slaves) max_leds = std::max<size_t>(max_leds, e.data_length / kBytesPerLed);

    ImageRGB8 img;
    img.w = (int)max_leds * scale;
    img.h = (int)f.slaves.size() * scale;
    img.data.assign((size_t)img.w*img.h*3, 0);

    for(size_t row=0; row<f.slaves.size(); ++row)
    {
        const SlaveEntry& e = f.slaves[row];
        SlaveSlice s;
        if(!slice(f, e.slave_id, s, err)) return false;
        const SlaveConfig* sc = cfg? cfg->find(e.slave_id) : nullptr;

        for(size_t i=0; i<s.led_count(); ++i)
        {
            PixelRecord px = s.led(i);
            uint8_t rgb[3] = {px.r, px.g, px.b};
            LedType t;
            if(sc && sc->led_type_at((uint32_t)i, t) && t==LedType::STANDARD_LED)
            {
                rgb[0] = rgb[1] = rgb[2] = px.w;
            }
            for(int dy=0; dy<scale; ++dy)
            {
                for(int dx=0; dx<scale; ++dx)
                {
                    size_t x = i*(size_t)scale + dx, y = row*(size_t)scale + dy;
                    uint8_t* p = &img.data[(y*(size_t)img.w + x)*3];
                    p[0]=rgb[0];
                    p[1]=rgb[1];
                    p[2]=rgb[2];
                }
            }
        }
    }
    out = std::move(img);
    return true;
}

bool write_png(const std::string& path, const ImageRGB8& img, PxldError* err)
{
    if(img.w<=0 || img.h<=0 || img.data.size() != (size_t)img.w*img.h*3)
        return fail(err, FormatError::SizeMismatch, "empty or inconsistent image");
    if(!stbi_write_png(path.c_str(), img.w, img.h, 3, img.data.data(), img.w*3))
        return fail(err, FormatError::IoError, path + ": PNG write failed");
    return true;
}

} // namespace pxld
