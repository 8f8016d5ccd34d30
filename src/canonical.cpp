// ============================================================================
//  File: src/canonical.cpp — Normalisation RGBW par type de LED
// ============================================================================

#include "pxld/canonical.hpp"

namespace pxld
{

const char* led_type_name(LedType t)
{
    switch(t)
    {
    case LedType::APA102C:
        return "APA102C";
    case LedType::WS2812B:
        return "WS2812B";
    case LedType::STANDARD_LED:
        return "STANDARD_LED";
    }
    return "UNKNOWN";
}

bool parse_led_type(const std::string& s, LedType& out)
{
    if(s=="APA102C") out = LedType::APA102C;
    else if(s=="WS2812B") out = LedType::WS2812B;
    else if(s=="STANDARD_LED") out = LedType::STANDARD_LED;
    else return false;
    return true;
}

bool canonicalize_led(LedType t, const uint8_t* raw, size_t n, PixelRecord& out, PxldError* err)
{
    if(n < raw_bytes_per_led(t))
        return fail(err, FormatError::SizeMismatch,
                    std::string(led_type_name(t)) + " needs " + std::to_string(raw_bytes_per_led(t)) +
                    " raw bytes, got " + std::to_string(n));
    switch(t)
    {
    case LedType::APA102C:
        out = {raw[0], raw[1], raw[2], kApa102White};
        break;
    case LedType::WS2812B:
        out = {raw[1], raw[0], raw[2], kWs2812White};
        break;
    case LedType::STANDARD_LED:
        out = {0x00, 0x00, 0x00, raw[0]};
        break;
    }
    return true;
}

void raw_from_canonical(LedType t, const PixelRecord& px, std::vector<uint8_t>& out)
{
    switch(t)
    {
    case LedType::APA102C:
        out.push_back(px.r);
        out.push_back(px.g);
        out.push_back(px.b);
        break;
    case LedType::WS2812B:
        out.push_back(px.g);
        out.push_back(px.r);
        out.push_back(px.b);
        break;
    case LedType::STANDARD_LED:
        out.push_back(px.w);
        break;
    }
}

bool canonicalize_slave(const std::vector<OutputSpec>& outputs, const uint8_t* raw, size_t n,
                        std::vector<uint8_t>& out, PxldError* err)
{
    for(const OutputSpec& o : outputs)
    {
        if(o.bytes_per_pixel < raw_bytes_per_led(o.type))
            return fail(err, FormatError::ConfigInvalid,
                        "output '" + o.label + "': bytes_per_pixel " + std::to_string(o.bytes_per_pixel) +
                        " < native width of " + led_type_name(o.type));
        if(o.raw_end() > n)
            return fail(err, FormatError::SizeMismatch,
                        "output '" + o.label + "' needs raw bytes up to " + std::to_string(o.raw_end()) +
                        ", capture has " + std::to_string(n));
        for(uint32_t i=0; i<o.count; ++i)
        {
            const uint8_t* src = raw + o.data_offset + (size_t)i*o.bytes_per_pixel;
            PixelRecord px{};
            if(!canonicalize_led(o.type, src, o.bytes_per_pixel, px, err)) return false;
            out.push_back(px.r);
            out.push_back(px.g);
            out.push_back(px.b);
            out.push_back(px.w);
        }
    }
    return true;
}

bool pixels_from_bytes(const uint8_t* p, size_t n, std::vector<PixelRecord>& out, PxldError* err)
{
    if(n % kBytesPerLed)
        return fail(err, FormatError::MisalignedSlaveData,
                    std::to_string(n) + " bytes is not a whole number of RGBW records");
    out.resize(n / kBytesPerLed);
    for(size_t i=0; i<out.size(); ++i)
    {
        const uint8_t* q = p + i*kBytesPerLed;
        out[i] = {q[0], q[1], q[2], q[3]};
    }
    return true;
}

} // namespace pxld
