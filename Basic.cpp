#include "Basic.h"

#include <cstring>

void copy( void *destination, const void *source, size_t bytes )
{
    if( bytes > 0 )
        std::memcpy( destination, source, bytes );
}

void clear( void *destination, size_t bytes )
{
    if( bytes > 0 )
        std::memset( destination, 0, bytes );
}

bool compare( const void *source0, const void *source1, size_t bytes )
{
    if( bytes <= 0 )
        return true;

    return std::memcmp( source0, source1, bytes ) == 0;
}

size_t stringLength( const char *string )
{
    return std::strlen( string );
}
