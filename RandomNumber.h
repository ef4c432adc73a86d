#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Park-Miller minimal standard generator, reproducible for a given seed
class RandomNumber
{
public:
    RandomNumber();
    explicit RandomNumber( int64_t seed );
    void setSeed( int64_t seed );

    // Numbers from start to finish, both included
    int64_t getInteger( int64_t start, int64_t finish );
    double getReal( double start, double finish );

    uint8_t getByte();
    std::vector<uint8_t> getBytes( size_t count );
private:
    void next();

    int64_t z;
};
