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

/******************************************************************************
 *INCLUDES
 ******************************************************************************/

#include "core.h"
#include "geo.h"
#include <gdal.h>
#include <cpl_conv.h>
#include <cpl_error.h>

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#define LUA_GEO_LIBNAME  "geo"

/******************************************************************************
 * GEO FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Configuration for local batch processing of large rasters and mosaics
 *----------------------------------------------------------------------------*/
static void configGDAL(void)
{
    /*
     * Prevents GDAL from listing the directory of every raster it opens.
     * Sidecar files (.aux.xml, .ovr) are not used by any of the geo operations.
     */
    CPLSetConfigOption("GDAL_DISABLE_READDIR_ON_OPEN", "EMPTY_DIR");

    /*
     * Default GDAL block cache. The value can be either in Mb, bytes or percent of the physical RAM
     * Recommended 200Mb
     */
    CPLSetConfigOption("GDAL_CACHEMAX", "200");

    /*
     * Defaults to 100. Used by gcore/gdalproxypool.cpp
     * Number of datasets that can be opened simultaneously by the GDALProxyPool mechanism (used by VRT for example).
     * Can be increased to get better random I/O performance with VRT mosaics made of numerous underlying raster files.
     * Be careful : on Linux systems, the number of file handles that can be opened by a process is generally limited to 1024.
     */
    CPLSetConfigOption("GDAL_MAX_DATASET_POOL_SIZE", "300");

    /*
     * Masks created for warped and cropped GeoTIFFs are stored inside the output file
     * instead of an external .msk file.
     */
    CPLSetConfigOption("GDAL_TIFF_INTERNAL_MASK", "YES");
}

/*----------------------------------------------------------------------------
 * geo_open
 *----------------------------------------------------------------------------*/
int geo_open (lua_State* L)
{
    static const struct luaL_Reg geo_functions[] = {
        {"parms",       GeoParms::luaCreate},
        {"array",       GdalRaster::luaAsArray},
        {"newarray",    ArrayObject::luaCreate},
        {"buildvrt",    VrtRaster::luaBuildVRT},
        {"vrt2tiff",    VrtRaster::luaMaterialize},
        {"merge",       VrtRaster::luaMerge},
        {"tile",        RasterTiler::luaTile},
        {"resize",      RasterWarper::luaResize},
        {"crop",        RasterWarper::luaCrop},
        {"write",       RasterWriter::luaWrite},
        {"gridtile",    GeoLib::luaCalcGridTile},
        {"mgrs",        GeoLib::luaCalcMGRS},
        {"utm",         GeoLib::luaCalcUTM},
        {"rasterinfo",  GeoInfo::luaRasterInfo},
        {"vectorinfo",  GeoInfo::luaVectorInfo},
#ifdef __unittesting__
        {"ut_geolib",   UT_GeoLib::luaCreate},
        {"ut_rasterio", UT_RasterIO::luaCreate},
        {"ut_mosaic",   UT_Mosaic::luaCreate},
        {"ut_tiler",    UT_Tiler::luaCreate},
        {"ut_warp",     UT_Warp::luaCreate},
        {"ut_geoinfo",  UT_GeoInfo::luaCreate},
#endif
        {NULL,          NULL}
    };

    /* Set Package Library */
    luaL_newlib(L, geo_functions);

    /* Set Globals */
    LuaEngine::setAttrStr   (L, "FLOAT32",      GeoLib::FLOAT32_NAME);
    LuaEngine::setAttrStr   (L, "FLOAT64",      GeoLib::FLOAT64_NAME);
    LuaEngine::setAttrStr   (L, "UINT16",       GeoLib::UINT16_NAME);
    LuaEngine::setAttrStr   (L, "BYTE",         GeoLib::BYTE_NAME);
    LuaEngine::setAttrNum   (L, "NODATA",       GeoParms::DEFAULT_NODATA);

    return 1;
}

/*----------------------------------------------------------------------------
 * Error handler called by GDAL lib on errors
 *----------------------------------------------------------------------------*/
void GdalErrHandler(CPLErr eErrClass, int err_no, const char *msg)
{
    event_level_t lvl;
    switch(eErrClass)
    {
        case CE_Debug:      lvl = DEBUG;    break;
        case CE_Warning:    lvl = WARNING;  break;
        case CE_Failure:    lvl = ERROR;    break;
        case CE_Fatal:      lvl = CRITICAL; break;
        default:            lvl = INFO;     break;
    }
    mlog(lvl, "GDAL %d: %s", err_no, msg);
}

/******************************************************************************
 * EXPORTED FUNCTIONS
 ******************************************************************************/
extern "C" {
void initgeo (void)
{
    /* Register all gdal drivers */
    GDALAllRegister();

    /* Custom GDAL configuration */
    configGDAL();

    /* Register GDAL custom error handler */
    void (*fptrGdalErrorHandler)(CPLErr, int, const char *) = GdalErrHandler;
    CPLSetErrorHandler(fptrGdalErrorHandler);

    /* Extend Lua */
    LuaEngine::extend(LUA_GEO_LIBNAME, geo_open);

    /* Indicate Presence of Package */
    LuaEngine::indicate(LUA_GEO_LIBNAME, LIBID);

    /* Display Status */
    print2term("%s package initialized (%s)\n", LUA_GEO_LIBNAME, LIBID);
}

void deinitgeo (void)
{
    CPLSetErrorHandler(NULL);
    GDALDestroy();
}
}
