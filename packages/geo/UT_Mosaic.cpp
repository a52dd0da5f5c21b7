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
#include <vector>

#include "UT_Mosaic.h"
#include "UT_GeoFixture.h"
#include "GdalRaster.h"
#include "RasterArray.h"
#include "TempFile.h"
#include "VrtRaster.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Mosaic::LUA_META_NAME = "UT_Mosaic";
const struct luaL_Reg UT_Mosaic::LUA_META_TABLE[] = {
    {"merge",       testMerge},
    {"missing",     testMissingSource},
    {"tempfile",    testTempFile},
    {NULL,          NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/* two 100x100 tiles offset by 50 pixels in x */
static const UT_GeoFixture::raster_def_t WEST_TILE = {100, 100, 1, 400000.0, 5400000.0, 10.0, 32631};
static const UT_GeoFixture::raster_def_t EAST_TILE = {100, 100, 1, 400500.0, 5400000.0, 10.0, 32631};

static double westValue (int row, int col, int band) { (void)row; (void)col; (void)band; return 1.0; }
static double eastValue (int row, int col, int band) { (void)row; (void)col; (void)band; return 2.0; }

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_Mosaic::luaCreate (lua_State* L)
{
    try
    {
        return createLuaObject(L, new UT_Mosaic(L));
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
UT_Mosaic::UT_Mosaic (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testMerge
 *--------------------------------------------------------------------------------------*/
int UT_Mosaic::testMerge(lua_State* L)
{
    UT_Mosaic* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Mosaic*>(getLuaSelf(L, 1));
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
        UT_GeoFixture fixture("merge");
        const std::vector<std::string> rlist = {
            fixture.makeRaster("west.tif", WEST_TILE, westValue),
            fixture.makeRaster("east.tif", EAST_TILE, eastValue)
        };
        const std::string vrt_file = fixture.path("mosaic.vrt");
        const std::string dst_file = fixture.path("merged.tif");

        // 1) Merge Overlapping Tiles
        VrtRaster::merge(rlist, vrt_file.c_str(), dst_file.c_str());
        ut_assert(lua_obj, !std::filesystem::exists(vrt_file), "Mosaic not removed after merge: %s", vrt_file.c_str());

        // 2) Check Merged Extent
        GdalRaster merged(dst_file);
        ut_assert(lua_obj, merged.getCols() == 150 && merged.getRows() == 100, "Unexpected size: %d x %d", merged.getCols(), merged.getRows());
        ut_assert(lua_obj, merged.getGeoTransform()[0] == WEST_TILE.ulx, "Unexpected origin: %lf", merged.getGeoTransform()[0]);

        // 3) Later Source Wins In Overlap
        RasterArray* array = merged.readArray();
        ut_assert(lua_obj, array->get(50, 10) == 1.0, "Unexpected west value: %lf", array->get(50, 10));
        ut_assert(lua_obj, array->get(50, 75) == 2.0, "Unexpected overlap value: %lf", array->get(50, 75));
        ut_assert(lua_obj, array->get(50, 140) == 2.0, "Unexpected east value: %lf", array->get(50, 140));
        delete array;

        // 4) Layout Of Rendered Raster
        GDALDataset* dset = merged.getDataset();
        const char* interleave = dset->GetMetadataItem("INTERLEAVE", "IMAGE_STRUCTURE");
        ut_assert(lua_obj, interleave && std::string(interleave) == "BAND", "Unexpected interleave: %s", interleave ? interleave : "none");
        int block_x = 0;
        int block_y = 0;
        dset->GetRasterBand(1)->GetBlockSize(&block_x, &block_y);
        ut_assert(lua_obj, block_x == 256 && block_y == 256, "Raster is not tiled: %d x %d blocks", block_x, block_y);

        // 5) Build Without Materializing
        VrtRaster::buildVRT(rlist, vrt_file.c_str());
        ut_assert(lua_obj, std::filesystem::exists(vrt_file), "Mosaic not created: %s", vrt_file.c_str());
        GdalRaster mosaic(vrt_file);
        ut_assert(lua_obj, mosaic.getCols() == 150, "Unexpected mosaic width: %d", mosaic.getCols());
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
 * testMissingSource
 *--------------------------------------------------------------------------------------*/
int UT_Mosaic::testMissingSource(lua_State* L)
{
    UT_Mosaic* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Mosaic*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    UT_GeoFixture fixture("missing_source");
    const std::string vrt_file = fixture.path("mosaic.vrt");
    const std::string dst_file = fixture.path("merged.tif");
    std::vector<std::string> rlist;

    try
    {
        rlist.push_back(fixture.makeRaster("west.tif", WEST_TILE, westValue));
        rlist.push_back(fixture.makeRaster("east.tif", EAST_TILE, eastValue));
        VrtRaster::buildVRT(rlist, vrt_file.c_str());
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Failed to set up mosaic: %s", e.what());
        lua_pushboolean(L, ut_status(lua_obj));
        return 1;
    }

    // 1) Source Removed After Build
    TempFile::removeFile(rlist[1].c_str());
    try
    {
        VrtRaster::materialize(vrt_file.c_str(), dst_file.c_str());
        ut_assert(lua_obj, false, "Rendered mosaic with missing source");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_RENDER_FAILURE, "Wrong error code: %d", e.code());
    }

    // 2) Missing Source At Build
    try
    {
        VrtRaster::buildVRT(rlist, fixture.path("other.vrt").c_str());
        ut_assert(lua_obj, false, "Built mosaic with missing source");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_DATA_UNAVAILABLE, "Wrong error code: %d", e.code());
    }

    // 3) Empty Source List
    try
    {
        VrtRaster::buildVRT(std::vector<std::string>(), fixture.path("empty.vrt").c_str());
        ut_assert(lua_obj, false, "Built mosaic with no sources");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_ERROR, "Wrong error code: %d", e.code());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testTempFile
 *--------------------------------------------------------------------------------------*/
int UT_Mosaic::testTempFile(lua_State* L)
{
    UT_Mosaic* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Mosaic*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    UT_GeoFixture fixture("tempfile");
    std::string scratch;
    std::string retained;

    try
    {
        scratch = fixture.makeFile("scratch.vrt", "<VRTDataset/>\n");
        retained = fixture.makeFile("retained.vrt", "<VRTDataset/>\n");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Failed to set up scratch files: %s", e.what());
        lua_pushboolean(L, ut_status(lua_obj));
        return 1;
    }

    // 1) Removed When Released
    {
        TempFile guard(scratch.c_str());
        ut_assert(lua_obj, !guard.isKept(), "Guard kept by default");
    }
    ut_assert(lua_obj, !std::filesystem::exists(scratch), "Temporary file not removed: %s", scratch.c_str());

    // 2) Retained When Kept
    {
        TempFile guard(retained.c_str());
        guard.keep();
        ut_assert(lua_obj, guard.isKept(), "Guard not kept");
    }
    ut_assert(lua_obj, std::filesystem::exists(retained), "Kept file removed: %s", retained.c_str());

    // 3) Mosaic Retained When Merge Fails
    const std::string vrt_file = fixture.path("mosaic.vrt");
    try
    {
        const std::vector<std::string> rlist = {
            fixture.makeRaster("west.tif", WEST_TILE, westValue),
            fixture.makeRaster("east.tif", EAST_TILE, eastValue)
        };
        const std::string dst_file = fixture.path("no_such_directory/merged.tif");
        VrtRaster::merge(rlist, vrt_file.c_str(), dst_file.c_str());
        ut_assert(lua_obj, false, "Merged into missing directory");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_RENDER_FAILURE, "Wrong error code: %d", e.code());
    }
    ut_assert(lua_obj, std::filesystem::exists(vrt_file), "Mosaic removed after failed merge: %s", vrt_file.c_str());

    // 4) Removing A Missing File
    ut_assert(lua_obj, !TempFile::removeFile(fixture.path("absent.vrt").c_str()), "Removed a file that does not exist");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
