#include <iostream>

#include "Tests/Fixtures.h"

int main( int argc, char **argv )
{
    std::vector<std::string> whitelist, blacklist;
    parseTestFilters( argc, argv, whitelist, blacklist );

    // Expected warnings are captured per test
    Log::threshold( LogLevel::Error );

    Tests tests( std::cout, whitelist, blacklist );

    chunkTests( tests );
    headerTests( tests );
    filterTests( tests );
    pixelTests( tests );
    interlaceTests( tests );
    zlibTests( tests );
    metadataTests( tests );
    pngTests( tests );
    colorSpaceTests( tests );
    blockTests( tests );
    dctTests( tests );
    quantizationTests( tests );
    huffmanTests( tests );
    markerTests( tests );
    jpegTests( tests );
    logTests( tests );

    return tests.run() == 0 ? 0 : 1;
}
