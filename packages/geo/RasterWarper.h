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

#ifndef __raster_warper__
#define __raster_warper__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <vector>
#include <gdal.h>

#include "OsApi.h"
#include "LuaEngine.h"
#include "GeoLib.h"

/******************************************************************************
 * RESIZE TARGET CLASS
 ******************************************************************************/

/*
 * Output size of a resize, either as a pixel dimension or as a pixel
 * resolution in the units of the source projection.  Exactly one of the two
 * is ever set.
 */
class ResizeTarget
{
    public:

        typedef enum {
            BY_DIMENSION    = 0,
            BY_RESOLUTION   = 1
        } resize_mode_t;

        static ResizeTarget byDimension     (long width, long height);
        static ResizeTarget byResolution    (double xres, double yres);

        resize_mode_t   getMode     (void) const { return mode; }
        long            getWidth    (void) const { return width; }
        long            getHeight   (void) const { return height; }
        double          getXRes     (void) const { return xres; }
        double          getYRes     (void) const { return yres; }

    private:

                        ResizeTarget    (resize_mode_t _mode, long _width, long _height, double _xres, double _yres);

        resize_mode_t   mode;
        long            width;
        long            height;
        double          xres;
        double          yres;
};

/******************************************************************************
 * RASTER WARPER CLASS
 ******************************************************************************/

class RasterWarper
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* RESAMPLING_ALGO;
        static const double CROP_NODATA;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void     resize          (const char* src_file, const char* dst_file, const ResizeTarget& target,
                                         GeoLib::pixel_type_t type=GeoLib::PIXEL_FLOAT32);
        static void     crop            (const char* src_file, const char* dst_file, const char* vector_file,
                                         GeoLib::pixel_type_t type=GeoLib::PIXEL_FLOAT32, bool nodata_provided=false, double nodata=0.0);

        static int      luaResize       (lua_State* L);
        static int      luaCrop         (lua_State* L);

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void     checkCutline    (const char* vector_file);
        static void     warp            (const char* src_file, const char* dst_file, const std::vector<std::string>& args,
                                         GeoLib::pixel_type_t type);
};

#endif  /* __raster_warper__ */
