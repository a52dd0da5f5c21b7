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

#include <filesystem>
#include <string>

#include "UT_Tiler.h"
#include "UT_GeoFixture.h"
#include "GdalRaster.h"
#include "RasterArray.h"
#include "RasterTiler.h"
#include "TempFile.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Tiler::LUA_META_NAME = "UT_Tiler";
const struct luaL_Reg UT_Tiler::LUA_META_TABLE[] = {
    {"grid",        testGrid},
    {"resume",      testResume},
    {NULL,          NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static const UT_GeoFixture::raster_def_t SOURCE_RASTER = {100, 100, 1, 500000.0, 4000000.0, 30.0, 32633};
static const int TILE_SIZE = 40;

static double gridValue (int row, int col, int band)
{
    (void)band;
    return (row * 1000.0) + col;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_Tiler::luaCreate (lua_State* L)
{
    try
    {
        return createLuaObject(L, new UT_Tiler(L));
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error creating %s: %s", LUA_META_NAME, e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_Tiler::UT_Tiler (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testGrid
 *--------------------------------------------------------------------------------------*/
int UT_Tiler::testGrid(lua_State* L)
{
    UT_Tiler* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Tiler*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        UT_GeoFixture fixture("grid");
        const std::string src_file = fixture.makeRaster("source.tif", SOURCE_RASTER, gridValue);
        const std::string prefix = fixture.path("tile");

        // 1) Tile Count
        const int count = RasterTiler::tile(src_file.c_str(), prefix.c_str(), TILE_SIZE, TILE_SIZE);
        ut_assert(lua_obj, count == 9, "Unexpected tile count: %d", count);
        ut_assert(lua_obj, RasterTiler::countTiles(100, 100, TILE_SIZE, TILE_SIZE) == 9, "Unexpected grid size");
        ut_assert(lua_obj, RasterTiler::countTiles(100, 100, 0, TILE_SIZE) == 0, "Grid of zero width tiles");
        ut_assert(lua_obj, RasterTiler::tileName("out/t", 12) == "out/t_12.tif", "Unexpected tile name: %s", RasterTiler::tileName("out/t", 12).c_str());

        // 2) Tiles Ordered By Column Then Row
        const int expected_xoff[9] = {0, 0, 0, 40, 40, 40, 80, 80, 80};
        const int expected_yoff[9] = {0, 40, 80, 0, 40, 80, 0, 40, 80};
        for(int i = 0; i < 9; i++)
        {
            const std::string tile_file = RasterTiler::tileName(prefix.c_str(), i + 1);
            GdalRaster tile(tile_file);
            const int cols = (expected_xoff[i] == 80) ? 20 : 40;
            const int rows = (expected_yoff[i] == 80) ? 20 : 40;
            ut_assert(lua_obj, tile.getCols() == cols && tile.getRows() == rows, "Tile %d has size %d x %d", i + 1, tile.getCols(), tile.getRows());

            const double ulx = SOURCE_RASTER.ulx + (expected_xoff[i] * SOURCE_RASTER.res);
            const double uly = SOURCE_RASTER.uly - (expected_yoff[i] * SOURCE_RASTER.res);
            ut_assert(lua_obj, tile.getGeoTransform()[0] == ulx && tile.getGeoTransform()[3] == uly, "Tile %d has origin %lf, %lf", i + 1, tile.getGeoTransform()[0], tile.getGeoTransform()[3]);

            RasterArray* array = tile.readArray();
            ut_assert(lua_obj, array->get(0, 0) == gridValue(expected_yoff[i], expected_xoff[i], 0), "Tile %d has corner value %lf", i + 1, array->get(0, 0));
            delete array;
        }
        ut_assert(lua_obj, !std::filesystem::exists(RasterTiler::tileName(prefix.c_str(), 10)), "Extra tile written");

        // 3) Pixel Type And No Data
        const std::string typed_prefix = fixture.path("byte");
        const int typed_count = RasterTiler::tile(src_file.c_str(), typed_prefix.c_str(), 60, 100, GeoLib::PIXEL_UINT16, true, 0.0);
        ut_assert(lua_obj, typed_count == 2, "Unexpected tile count: %d", typed_count);
        GdalRaster typed(RasterTiler::tileName(typed_prefix.c_str(), 2));
        GDALRasterBand* band = typed.getDataset()->GetRasterBand(1);
        ut_assert(lua_obj, band->GetRasterDataType() == GDT_UInt16, "Unexpected data type: %d", band->GetRasterDataType());
        int has_nodata = FALSE;
        const double nodata = band->GetNoDataValue(&has_nodata);
        ut_assert(lua_obj, has_nodata && nodata == 0.0, "Unexpected nodata: %lf", nodata);
        ut_assert(lua_obj, typed.getCols() == 40 && typed.getRows() == 100, "Unexpected size: %d x %d", typed.getCols(), typed.getRows());

        // 4) Invalid Tile Size
        try
        {
            RasterTiler::tile(src_file.c_str(), prefix.c_str(), 0, TILE_SIZE);
            ut_assert(lua_obj, false, "Tiled with zero width");
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_ERROR, "Wrong error code: %d", e.code());
        }

        // 5) Missing Source
        try
        {
            RasterTiler::tile(fixture.path("missing.tif").c_str(), prefix.c_str(), TILE_SIZE, TILE_SIZE);
            ut_assert(lua_obj, false, "Tiled missing source");
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_DATA_UNAVAILABLE, "Wrong error code: %d", e.code());
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testResume
 *--------------------------------------------------------------------------------------*/
int UT_Tiler::testResume(lua_State* L)
{
    UT_Tiler* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Tiler*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        UT_GeoFixture fixture("resume");
        const std::string src_file = fixture.makeRaster("source.tif", SOURCE_RASTER, gridValue);
        const std::string prefix = fixture.path("tile");

        // 1) Initial Run
        int count = RasterTiler::tile(src_file.c_str(), prefix.c_str(), TILE_SIZE, TILE_SIZE);
        ut_assert(lua_obj, count == 9, "Unexpected tile count: %d", count);
        const std::string first_tile = RasterTiler::tileName(prefix.c_str(), 1);
        const std::string original = UT_GeoFixture::readFile(first_tile);

        // 2) Rerun Writes Nothing
        count = RasterTiler::tile(src_file.c_str(), prefix.c_str(), TILE_SIZE, TILE_SIZE);
        ut_assert(lua_obj, count == 0, "Unexpected tile count on rerun: %d", count);

        // 3) Interrupted Run Is Completed
        TempFile::removeFile(RasterTiler::tileName(prefix.c_str(), 5).c_str());
        TempFile::removeFile(RasterTiler::tileName(prefix.c_str(), 9).c_str());
        count = RasterTiler::tile(src_file.c_str(), prefix.c_str(), TILE_SIZE, TILE_SIZE);
        ut_assert(lua_obj, count == 2, "Unexpected tile count on resume: %d", count);
        ut_assert(lua_obj, std::filesystem::exists(RasterTiler::tileName(prefix.c_str(), 5)), "Tile 5 not restored");
        ut_assert(lua_obj, std::filesystem::exists(RasterTiler::tileName(prefix.c_str(), 9)), "Tile 9 not restored");

        // 4) Existing Tiles Untouched
        ut_assert(lua_obj, UT_GeoFixture::readFile(first_tile) == original, "Existing tile was rewritten: %s", first_tile.c_str());

        // 5) Restored Tile Content
        RasterArray* array = GdalRaster::asArray(RasterTiler::tileName(prefix.c_str(), 9).c_str());
        ut_assert(lua_obj, array->getRows() == 20 && array->getCols() == 20, "Unexpected size: %u x %u", array->getRows(), array->getCols());
        ut_assert(lua_obj, array->get(19, 19) == gridValue(99, 99, 0), "Unexpected value: %lf", array->get(19, 19));
        delete array;
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
