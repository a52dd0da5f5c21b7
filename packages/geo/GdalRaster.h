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

#ifndef __gdal_raster__
#define __gdal_raster__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <gdal_priv.h>

#include "OsApi.h"
#include "LuaEngine.h"
#include "RasterArray.h"

/******************************************************************************
 * Typedef and macros used by GDAL rasters
 ******************************************************************************/

#define CHECKPTR(p)                                                           \
do                                                                            \
{                                                                             \
    if ((p) == NULL)                                                          \
    {                                                                         \
        throw RunTimeException(CRITICAL, RTE_ERROR,                           \
              "NULL pointer detected (%s():%d)", __FUNCTION__, __LINE__);     \
    }                                                                         \
} while (0)


#define CHECK_GDALERR(e)                                                      \
do                                                                            \
{                                                                             \
    if ((e))   /* CPLErr and OGRErr types have 0 for no error  */             \
    {                                                                         \
        throw RunTimeException(CRITICAL, RTE_ERROR,                           \
              "GDAL ERROR detected: %d (%s():%d)", e, __FUNCTION__, __LINE__);\
    }                                                                         \
} while (0)

/******************************************************************************
 * GDAL RASTER CLASS
 ******************************************************************************/

/*
 * Read-only handle to a raster file.  The dataset is opened on construction
 * and closed when the handle goes out of scope.
 */
class GdalRaster
{
    public:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit            GdalRaster      (const std::string& _fileName);
                            ~GdalRaster     (void);

                            GdalRaster      (const GdalRaster&) = delete;
        GdalRaster&         operator=       (const GdalRaster&) = delete;

        RasterArray*        readArray       (int bandNum=0) const;

        const std::string&  getFileName     (void) const { return fileName; }
        GDALDataset*        getDataset      (void) const { return dset; }
        int                 getRows         (void) const { return ysize; }
        int                 getCols         (void) const { return xsize; }
        int                 getBandCount    (void) const { return bandCount; }
        const double*       getGeoTransform (void) const { return geoTransform; }
        double              getXRes         (void) const { return geoTransform[1]; }
        double              getYRes         (void) const { return geoTransform[5]; }
        std::string         getProjection   (void) const;

        /*--------------------------------------------------------------------
         * Static Methods
         *--------------------------------------------------------------------*/

        static RasterArray* asArray         (const char* path, int bandNum=0);
        static int          luaAsArray      (lua_State* L);

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::string     fileName;
        GDALDataset*    dset;
        int             xsize;
        int             ysize;
        int             bandCount;
        double          geoTransform[6];
};

#endif  /* __gdal_raster__ */
