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
 * INCLUDES
 ******************************************************************************/

#include <climits>
#include <filesystem>
#include <gdal_utils.h>

#include "RasterTiler.h"
#include "GdalRaster.h"
#include "GeoParms.h"
#include "LuaObject.h"
#include "EventLib.h"
#include "StringLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* RasterTiler::TILE_EXTENSION = ".tif";

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * tile
 *
 *  returns number of tiles written; tiles whose file already exists are
 *  skipped so an interrupted job can be resumed
 *----------------------------------------------------------------------------*/
int RasterTiler::tile(const char* src_file, const char* prefix, int tile_width, int tile_height,
                      GeoLib::pixel_type_t type, bool nodata_provided, double nodata)
{
    if(tile_width <= 0 || tile_height <= 0)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Invalid tile size: %d x %d", tile_width, tile_height);
    }

    GdalRaster raster(src_file);
    const int width = raster.getCols();
    const int height = raster.getRows();

    int tile_index = 0;
    int tiles_written = 0;
    int tiles_skipped = 0;

    for(int i = 0; i < width; i += tile_width)
    {
        for(int j = 0; j < height; j += tile_height)
        {
            tile_window_t window;
            window.index = ++tile_index;
            window.xoff = i;
            window.yoff = j;
            window.xsize = MIN(tile_width, width - i);
            window.ysize = MIN(tile_height, height - j);

            const std::string dst_file = tileName(prefix, window.index);
            if(std::filesystem::exists(dst_file))
            {
                mlog(DEBUG, "Skipping existing tile %s", dst_file.c_str());
                tiles_skipped++;
                continue;
            }

            writeTile(static_cast<GDALDatasetH>(raster.getDataset()), dst_file.c_str(), window, type, nodata_provided, nodata);
            tiles_written++;
        }
    }

    mlog(INFO, "Tiled %s into %d tiles (%d written, %d skipped)", src_file, tile_index, tiles_written, tiles_skipped);
    return tiles_written;
}

/*----------------------------------------------------------------------------
 * countTiles
 *----------------------------------------------------------------------------*/
int RasterTiler::countTiles(int width, int height, int tile_width, int tile_height)
{
    if(tile_width <= 0 || tile_height <= 0) return 0;
    const int cols = (width + tile_width - 1) / tile_width;
    const int rows = (height + tile_height - 1) / tile_height;
    return cols * rows;
}

/*----------------------------------------------------------------------------
 * tileName
 *----------------------------------------------------------------------------*/
std::string RasterTiler::tileName(const char* prefix, int index)
{
    return std::string(prefix) + "_" + std::to_string(index) + TILE_EXTENSION;
}

/*----------------------------------------------------------------------------
 * luaTile - tile(<src>, <prefix>, <tile width>, <tile height>, [<parms>]) --> status, count
 *----------------------------------------------------------------------------*/
int RasterTiler::luaTile(lua_State* L)
{
    GeoParms* parms = NULL;
    int count = 0;

    try
    {
        const char* src_file = LuaObject::getLuaString(L, 1);
        const char* prefix = LuaObject::getLuaString(L, 2);
        const long tile_width = LuaObject::getLuaInteger(L, 3);
        const long tile_height = LuaObject::getLuaInteger(L, 4);
        if(tile_width > INT_MAX || tile_height > INT_MAX)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "Invalid tile size: %ld x %ld", tile_width, tile_height);
        }
        parms = GeoParms::getLuaParms(L, 5);

        if(parms)
        {
            count = tile(src_file, prefix, tile_width, tile_height, parms->getPixelType(), parms->hasNoData(), parms->getNoData());
        }
        else
        {
            count = tile(src_file, prefix, tile_width, tile_height);
        }
    }
    catch(const RunTimeException& e)
    {
        if(parms) parms->releaseLuaObject();
        mlog(e.level(), "Error tiling raster: %s", e.what());
        return LuaObject::returnLuaError(L, e.code());
    }

    if(parms) parms->releaseLuaObject();
    lua_pushboolean(L, true);
    lua_pushinteger(L, count);
    return 2;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * writeTile
 *
 *  the window is clipped to the source extent before extraction
 *----------------------------------------------------------------------------*/
void RasterTiler::writeTile(GDALDatasetH src, const char* dst_file, const tile_window_t& window,
                            GeoLib::pixel_type_t type, bool nodata_provided, double nodata)
{
    char xoff_str[MAX_STR_SIZE];
    char yoff_str[MAX_STR_SIZE];
    char xsize_str[MAX_STR_SIZE];
    char ysize_str[MAX_STR_SIZE];
    StringLib::format(xoff_str, MAX_STR_SIZE, "%d", window.xoff);
    StringLib::format(yoff_str, MAX_STR_SIZE, "%d", window.yoff);
    StringLib::format(xsize_str, MAX_STR_SIZE, "%d", window.xsize);
    StringLib::format(ysize_str, MAX_STR_SIZE, "%d", window.ysize);

    char** options = NULL;
    options = CSLAddString(options, "-of");
    options = CSLAddString(options, "GTiff");
    options = CSLAddString(options, "-ot");
    options = CSLAddString(options, GeoLib::type2str(type));
    options = CSLAddString(options, "-srcwin");
    options = CSLAddString(options, xoff_str);
    options = CSLAddString(options, yoff_str);
    options = CSLAddString(options, xsize_str);
    options = CSLAddString(options, ysize_str);
    if(nodata_provided)
    {
        char nodata_str[MAX_STR_SIZE];
        StringLib::format(nodata_str, MAX_STR_SIZE, "%.17g", nodata);
        options = CSLAddString(options, "-a_nodata");
        options = CSLAddString(options, nodata_str);
    }

    GDALTranslateOptions* translate_options = GDALTranslateOptionsNew(options, NULL);
    CSLDestroy(options);
    CHECKPTR(translate_options);

    int usage_error = FALSE;
    GDALDatasetH dstDset = GDALTranslate(dst_file, src, translate_options, &usage_error);
    GDALTranslateOptionsFree(translate_options);

    if(dstDset == NULL || usage_error)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to write tile %s", dst_file);
    }

    GDALClose(dstDset);
    mlog(DEBUG, "Created tile %s: %d x %d at (%d, %d)", dst_file, window.xsize, window.ysize, window.xoff, window.yoff);
}
