#pragma once

#include <cstdint>
#include <vector>

// https://en.wikipedia.org/wiki/YCbCr

namespace RasterCodec
{
enum class ColorStandard
{
    BT601,
    BT709,
    BT2020
};

enum class ColorRange
{
    Full,   // 0..255
    Limited // Y 16..235, Cb and Cr 16..240
};

enum class Rounding
{
    Nearest,
    Truncate,
    Ceiling,
    Bankers
};

struct ColorConversionOptions
{
    ColorStandard standard = ColorStandard::BT601;
    ColorRange range = ColorRange::Full;
    Rounding rounding = Rounding::Nearest;
};

struct YCbCr
{
    uint8_t y, cb, cr;
};

struct Rgb
{
    uint8_t r, g, b;
};

// Luma weights, green is 1 - kr - kb
struct LumaCoefficients
{
    double kr, kb;

    double kg() const
    {
        return 1 - kr - kb;
    }
};

LumaCoefficients lumaCoefficients( ColorStandard standard );

double applyRounding( double value, Rounding rounding );

YCbCr rgbToYCbCr( uint8_t r, uint8_t g, uint8_t b, const ColorConversionOptions &options = {} );
Rgb yCbCrToRgb( uint8_t y, uint8_t cb, uint8_t cr, const ColorConversionOptions &options = {} );

// Interleaved four channel buffers, the fourth channel is copied as is
std::vector<uint8_t> convertRgbaToYCbCr( const std::vector<uint8_t> &rgba, uint32_t width, uint32_t height, const ColorConversionOptions &options = {} );
std::vector<uint8_t> convertYCbCrToRgba( const std::vector<uint8_t> &ycbcra, uint32_t width, uint32_t height, const ColorConversionOptions &options = {} );

struct ConversionAccuracy
{
    double maxError = 0;
    double averageError = 0;
    double rmse = 0;
};

// Over the RGB channels of two RGBA buffers
ConversionAccuracy analyzeConversionAccuracy( const std::vector<uint8_t> &original, const std::vector<uint8_t> &converted, uint32_t width, uint32_t height );
}
