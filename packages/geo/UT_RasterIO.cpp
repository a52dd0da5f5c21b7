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

#include <cmath>
#include <filesystem>
#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include "UT_RasterIO.h"
#include "UT_GeoFixture.h"
#include "GdalRaster.h"
#include "RasterArray.h"
#include "RasterWriter.h"
#include "GeoParms.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_RasterIO::LUA_META_NAME = "UT_RasterIO";
const struct luaL_Reg UT_RasterIO::LUA_META_TABLE[] = {
    {"read",        testRead},
    {"write",       testWrite},
    {"mismatch",    testShapeMismatch},
    {"missing",     testMissing},
    {NULL,          NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static const UT_GeoFixture::raster_def_t UTM_RASTER = {20, 10, 3, 448000.0, 5412000.0, 30.0, 32631};
static const UT_GeoFixture::raster_def_t GEO_RASTER = {20, 10, 1, 2.0, 49.0, 0.01, 4326};

static double rampValue (int row, int col, int band)
{
    return (band * 1000.0) + (row * 100.0) + col;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_RasterIO::luaCreate (lua_State* L)
{
    try
    {
        return createLuaObject(L, new UT_RasterIO(L));
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
UT_RasterIO::UT_RasterIO (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testRead
 *--------------------------------------------------------------------------------------*/
int UT_RasterIO::testRead(lua_State* L)
{
    UT_RasterIO* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_RasterIO*>(getLuaSelf(L, 1));
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
        UT_GeoFixture fixture("read");
        const std::string multi = fixture.makeRaster("multi.tif", UTM_RASTER, rampValue);
        const std::string single = fixture.makeRaster("single.tif", GEO_RASTER, rampValue);

        // 1) Stacked Bands
        RasterArray* array = GdalRaster::asArray(multi.c_str());
        ut_assert(lua_obj, array->getRank() == 3, "Expected rank 3, got %d", array->getRank());
        ut_assert(lua_obj, array->getRows() == 10 && array->getCols() == 20 && array->getBands() == 3,
                  "Unexpected shape: %u x %u x %u", array->getRows(), array->getCols(), array->getBands());
        ut_assert(lua_obj, array->get(4, 7, 2) == rampValue(4, 7, 2), "Unexpected value: %lf", array->get(4, 7, 2));
        ut_assert(lua_obj, array->get(9, 19, 0) == rampValue(9, 19, 0), "Unexpected value: %lf", array->get(9, 19, 0));
        delete array;

        // 2) Selected Band
        array = GdalRaster::asArray(multi.c_str(), 2);
        ut_assert(lua_obj, array->getRank() == 2, "Expected rank 2, got %d", array->getRank());
        ut_assert(lua_obj, array->get(4, 7) == rampValue(4, 7, 1), "Unexpected value: %lf", array->get(4, 7));
        delete array;

        // 3) Single Band Source
        array = GdalRaster::asArray(single.c_str());
        ut_assert(lua_obj, array->getRank() == 2, "Expected rank 2, got %d", array->getRank());
        ut_assert(lua_obj, array->get(2, 3) == rampValue(2, 3, 0), "Unexpected value: %lf", array->get(2, 3));
        delete array;

        // 4) Handle Attributes
        GdalRaster raster(multi);
        ut_assert(lua_obj, raster.getBandCount() == 3, "Unexpected band count: %d", raster.getBandCount());
        ut_assert(lua_obj, raster.getXRes() == 30.0 && raster.getYRes() == -30.0, "Unexpected resolution: %lf, %lf", raster.getXRes(), raster.getYRes());
        ut_assert(lua_obj, raster.getGeoTransform()[0] == 448000.0, "Unexpected origin: %lf", raster.getGeoTransform()[0]);
        ut_assert(lua_obj, !raster.getProjection().empty(), "Missing projection");

        // 5) Band Out of Range
        try
        {
            array = GdalRaster::asArray(multi.c_str(), 4);
            delete array;
            ut_assert(lua_obj, false, "Read of band 4 succeeded");
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_ERROR, "Wrong error code: %d", e.code());
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
 * testWrite
 *--------------------------------------------------------------------------------------*/
int UT_RasterIO::testWrite(lua_State* L)
{
    UT_RasterIO* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_RasterIO*>(getLuaSelf(L, 1));
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
        UT_GeoFixture fixture("write");
        const std::string geom_ref = fixture.makeRaster("geom.tif", UTM_RASTER, rampValue);
        const std::string proj_ref = fixture.makeRaster("proj.tif", GEO_RASTER, rampValue);
        const std::string output = fixture.path("output.tif");

        RasterArray array(10, 20, 2);
        for(uint32_t r = 0; r < 10; r++)
            for(uint32_t c = 0; c < 20; c++)
                for(uint32_t b = 0; b < 2; b++)
                    array.set(r, c, b, rampValue(r, c, b) + 0.5);

        // 1) Write Float32 With Independent References
        RasterWriter::write(output.c_str(), array, proj_ref.c_str(), geom_ref.c_str(), GeoLib::PIXEL_FLOAT32, GeoParms::DEFAULT_NODATA);
        {
            GdalRaster raster(output);
            ut_assert(lua_obj, raster.getRows() == 10 && raster.getCols() == 20, "Unexpected size: %d x %d", raster.getRows(), raster.getCols());
            ut_assert(lua_obj, raster.getBandCount() == 2, "Unexpected band count: %d", raster.getBandCount());

            GDALRasterBand* band = raster.getDataset()->GetRasterBand(1);
            ut_assert(lua_obj, band->GetRasterDataType() == GDT_Float32, "Unexpected data type: %d", band->GetRasterDataType());

            int has_nodata = FALSE;
            const double nodata = band->GetNoDataValue(&has_nodata);
            ut_assert(lua_obj, has_nodata && std::fabs(nodata - GeoParms::DEFAULT_NODATA) < 1e-9, "Unexpected nodata: %lf", nodata);

            GdalRaster geom_raster(geom_ref);
            for(int i = 0; i < 6; i++)
            {
                ut_assert(lua_obj, raster.getGeoTransform()[i] == geom_raster.getGeoTransform()[i], "Geotransform[%d] differs", i);
            }

            OGRSpatialReference out_srs;
            OGRSpatialReference ref_srs;
            GdalRaster proj_raster(proj_ref);
            out_srs.importFromWkt(raster.getProjection().c_str());
            ref_srs.importFromWkt(proj_raster.getProjection().c_str());
            ut_assert(lua_obj, out_srs.IsSame(&ref_srs), "Projection not inherited from %s", proj_ref.c_str());
        }

        // 2) Round Trip
        RasterArray* reread = GdalRaster::asArray(output.c_str());
        ut_assert(lua_obj, reread->getRank() == 3 && reread->getBands() == 2, "Unexpected rank %d", reread->getRank());
        ut_assert(lua_obj, reread->get(3, 5, 1) == rampValue(3, 5, 1) + 0.5, "Unexpected value: %lf", reread->get(3, 5, 1));
        delete reread;

        // 3) Overwrite As UInt16
        RasterArray counts(10, 20, 0, 7.0);
        RasterWriter::write(output.c_str(), counts, geom_ref.c_str(), geom_ref.c_str(), GeoLib::PIXEL_UINT16, 0.0);
        {
            GdalRaster raster(output);
            ut_assert(lua_obj, raster.getBandCount() == 1, "Unexpected band count: %d", raster.getBandCount());
            GDALRasterBand* band = raster.getDataset()->GetRasterBand(1);
            ut_assert(lua_obj, band->GetRasterDataType() == GDT_UInt16, "Unexpected data type: %d", band->GetRasterDataType());
            RasterArray* values = raster.readArray();
            ut_assert(lua_obj, values->getRank() == 2 && values->get(9, 19) == 7.0, "Unexpected value: %lf", values->get(9, 19));
            delete values;
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
 * testShapeMismatch
 *--------------------------------------------------------------------------------------*/
int UT_RasterIO::testShapeMismatch(lua_State* L)
{
    UT_RasterIO* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_RasterIO*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    UT_GeoFixture fixture("mismatch");
    const std::string output = fixture.path("output.tif");

    try
    {
        const std::string geom_ref = fixture.makeRaster("geom.tif", UTM_RASTER, rampValue);

        // 1) Transposed Array
        RasterArray transposed(20, 10);
        try
        {
            RasterWriter::write(output.c_str(), transposed, geom_ref.c_str(), geom_ref.c_str(), GeoLib::PIXEL_FLOAT32, GeoParms::DEFAULT_NODATA);
            ut_assert(lua_obj, false, "Transposed array was written");
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_SHAPE_MISMATCH, "Wrong error code: %d", e.code());
        }
        ut_assert(lua_obj, !std::filesystem::exists(output), "Output created on shape mismatch");

        // 2) Default No Data On Integer Types
        RasterArray array(10, 20, 0, 12.0);
        const GeoLib::pixel_type_t integer_types[2] = {GeoLib::PIXEL_BYTE, GeoLib::PIXEL_UINT16};
        const GDALDataType integer_gdal[2] = {GDT_Byte, GDT_UInt16};
        for(int i = 0; i < 2; i++)
        {
            RasterWriter::write(output.c_str(), array, geom_ref.c_str(), geom_ref.c_str(), integer_types[i], GeoParms::DEFAULT_NODATA);
            GdalRaster raster(output);
            ut_assert(lua_obj, raster.getRows() == 10 && raster.getCols() == 20, "Unexpected size: %d x %d", raster.getRows(), raster.getCols());
            GDALRasterBand* band = raster.getDataset()->GetRasterBand(1);
            ut_assert(lua_obj, band->GetRasterDataType() == integer_gdal[i], "Unexpected data type: %d", band->GetRasterDataType());
            RasterArray* values = raster.readArray();
            ut_assert(lua_obj, values->get(4, 11) == 12.0, "Unexpected value as %s: %lf", GeoLib::type2str(integer_types[i]), values->get(4, 11));
            delete values;
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
 * testMissing
 *--------------------------------------------------------------------------------------*/
int UT_RasterIO::testMissing(lua_State* L)
{
    UT_RasterIO* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_RasterIO*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    UT_GeoFixture fixture("missing");
    const std::string missing = fixture.path("missing.tif");
    std::string not_raster;
    try
    {
        not_raster = fixture.makeFile("notes.txt", "not a raster\n");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Failed to set up text file: %s", e.what());
    }

    // 1) Open Missing File
    try
    {
        GdalRaster raster(missing);
        ut_assert(lua_obj, false, "Opened missing raster");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_DATA_UNAVAILABLE, "Wrong error code: %d", e.code());
    }

    // 2) Open Non Raster File
    try
    {
        RasterArray* array = GdalRaster::asArray(not_raster.c_str());
        delete array;
        ut_assert(lua_obj, false, "Read text file as raster");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_DATA_UNAVAILABLE, "Wrong error code: %d", e.code());
    }

    // 3) Write With Missing Reference
    try
    {
        RasterArray array(10, 20);
        RasterWriter::write(fixture.path("out.tif").c_str(), array, missing.c_str(), missing.c_str(), GeoLib::PIXEL_FLOAT32, GeoParms::DEFAULT_NODATA);
        ut_assert(lua_obj, false, "Wrote raster with missing reference");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_DATA_UNAVAILABLE, "Wrong error code: %d", e.code());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
