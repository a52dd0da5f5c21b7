/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 * 
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 * 
 * 1. Redistributions of source code must retain the above copyright notice, 
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice, 
 *    this list of conditions and the following disclaimer in the documentation 
 *    and/or other materials provided with the distribution.
 * 
 * 3. Neither the name of the University of Washington nor the names of its 
 *    contributors may be used to endorse or promote products derived from this 
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED 
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR 
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, 
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, 
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, 
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR 
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF 
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef __raster_tiler__
#define __raster_tiler__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>

#include "OsApi.h"
#include "LuaEngine.h"
#include "GeoLib.h"

/******************************************************************************
 * RASTER TILER CLASS
 ******************************************************************************/

/*
 * Splits a raster into <prefix>_<n>.tif tiles.  Tiles are numbered from 1,
 * walking columns in the outer loop and rows in the inner loop, and tiles on
 * the right and bottom edges only cover the pixels that remain.
 */
class RasterTiler
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* TILE_EXTENSION;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            int     index;
            int     xoff;
            int     yoff;
            int     xsize;
            int     ysize;
        } tile_window_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static int          tile            (const char* src_file, const char* prefix, int tile_width, int tile_height,
                                             GeoLib::pixel_type_t type=GeoLib::PIXEL_FLOAT32,
                                             bool nodata_provided=false, double nodata=0.0);
        static int          countTiles      (int width, int height, int tile_width, int tile_height);
        static std::string  tileName        (const char* prefix, int index);

        static int          luaTile         (lua_State* L);

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void         writeTile       (GDALDatasetH src, const char* dst_file, const tile_window_t& window,
                                             GeoLib::pixel_type_t type, bool nodata_provided, double nodata);
};

#endif  /* __raster_tiler__ */
