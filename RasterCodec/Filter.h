#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <array>

// https://www.w3.org/TR/png/#9Filters

namespace RasterCodec
{
enum class FilterType : uint8_t
{
    None = 0,
    Sub = 1,
    Up = 2,
    Average = 3,
    Paeth = 4
};

constexpr unsigned filterTypeCount = 5;

// Throws StructuralError for anything above 4
FilterType toFilterType( unsigned value );

// Closest of a (left), b (up), c (upper left) to a + b - c, ties prefer a, then b
uint8_t paethPredictor( int a, int b, int c );

// Use empty `previous` for the first line
std::vector<uint8_t> applyFilter( const std::vector<uint8_t> &line, const std::vector<uint8_t> &previous, FilterType type, unsigned bytesPerPixel );
std::vector<uint8_t> reverseFilter( const std::vector<uint8_t> &filtered, const std::vector<uint8_t> &previous, FilterType type, unsigned bytesPerPixel );

// Sum of absolute values of the bytes taken as signed
unsigned filterScore( const std::vector<uint8_t> &filtered );

// Lowest score, lower filter type on ties
FilterType selectFilter( const std::vector<uint8_t> &line, const std::vector<uint8_t> &previous, unsigned bytesPerPixel );

// Filtered stream of `rows` lines, each prefixed with its filter type
// Adaptive selection per line when `fixed` is empty
std::vector<uint8_t> filterScanlines( const std::vector<uint8_t> &raw, uint32_t columns, uint32_t rows, unsigned bitsPerPixel, std::optional<FilterType> fixed );

// Reconstructs `rows` lines from a filtered stream, filter bytes removed
// Throws PixelDataSizeError when `size` does not match the geometry
std::vector<uint8_t> unfilterScanlines( const uint8_t *data, size_t size, uint32_t columns, uint32_t rows, unsigned bitsPerPixel );

// Number of lines using each filter type
std::array<size_t, filterTypeCount> analyzeFilterUsage( const std::vector<uint8_t> &filtered, uint32_t columns, uint32_t rows, unsigned bitsPerPixel );
}
