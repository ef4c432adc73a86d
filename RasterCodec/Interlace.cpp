#include "RasterCodec/Interlace.h"

namespace RasterCodec
{
Adam7Step::Adam7Step( unsigned pass )
{
    makeException( pass < 7 );
    startX = adam7Start[pass][0];
    startY = adam7Start[pass][1];
    incX   = adam7Increment[pass][0];
    incY   = adam7Increment[pass][1];
}

Adam7Size::Adam7Size( const Adam7Step &step, uint32_t w, uint32_t h )
{
    columns = ( w > step.startX ) ? ( ( w - step.startX + step.incX - 1 ) / step.incX ) : 0;
    rows = ( h > step.startY ) ? ( ( h - step.startY + step.incY - 1 ) / step.incY ) : 0;
}
}
