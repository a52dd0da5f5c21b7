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
#include <string>

#include "UT_Warp.h"
#include "UT_GeoFixture.h"
#include "GdalRaster.h"
#include "GeoParms.h"
#include "RasterArray.h"
#include "RasterWarper.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Warp::LUA_META_NAME = "UT_Warp";
const struct luaL_Reg UT_Warp::LUA_META_TABLE[] = {
    {"resize",      testResize},
    {"config",      testConfig},
    {"crop",        testCrop},
    {"nogeometry",  testNoGeometry},
    {NULL,          NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static const UT_GeoFixture::raster_def_t UTM_RASTER = {100, 50, 1, 600000.0, 4500000.0, 10.0, 32618};
static const UT_GeoFixture::raster_def_t GEO_RASTER = {100, 100, 1, 10.0, 50.0, 0.01, 4326};

static const char* CROP_POLYGON =
    "{\"type\": \"FeatureCollection\", \"features\": [{\"type\": \"Feature\", \"properties\": {},"
    " \"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[[10.2, 49.3], [10.5, 49.3], [10.5, 49.7], [10.2, 49.7], [10.2, 49.3]]]}}]}\n";

static const char* CROP_TRIANGLE =
    "{\"type\": \"FeatureCollection\", \"features\": [{\"type\": \"Feature\", \"properties\": {},"
    " \"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[[10.2, 49.3], [10.5, 49.3], [10.2, 49.7], [10.2, 49.3]]]}}]}\n";

static const char* EMPTY_COLLECTION =
    "{\"type\": \"FeatureCollection\", \"features\": []}\n";

static const char* POINT_COLLECTION =
    "{\"type\": \"FeatureCollection\", \"features\": [{\"type\": \"Feature\", \"properties\": {},"
    " \"geometry\": {\"type\": \"Point\", \"coordinates\": [10.3, 49.5]}}]}\n";

static double constantValue (int row, int col, int band)
{
    (void)row; (void)col; (void)band;
    return 5.0;
}

/*
 * builds parameters from a lua table; whole numbers are pushed as integers
 */
typedef struct {
    const char* key;
    const char* str;
    double      num;
} parm_field_t;

static GeoParms* makeParms (lua_State* L, const parm_field_t* fields, int num_fields)
{
    lua_newtable(L);
    for(int i = 0; i < num_fields; i++)
    {
        const lua_Integer inum = static_cast<lua_Integer>(fields[i].num);
        if(fields[i].str)                                       lua_pushstring(L, fields[i].str);
        else if(static_cast<double>(inum) == fields[i].num)     lua_pushinteger(L, inum);
        else                                                    lua_pushnumber(L, fields[i].num);
        lua_setfield(L, -2, fields[i].key);
    }

    GeoParms* parms = NULL;
    try
    {
        parms = new GeoParms(L, lua_gettop(L));
    }
    catch(const RunTimeException&)
    {
        lua_pop(L, 1);
        throw;
    }

    lua_pop(L, 1);
    return parms;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_Warp::luaCreate (lua_State* L)
{
    try
    {
        return createLuaObject(L, new UT_Warp(L));
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
UT_Warp::UT_Warp (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testResize
 *--------------------------------------------------------------------------------------*/
int UT_Warp::testResize(lua_State* L)
{
    UT_Warp* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Warp*>(getLuaSelf(L, 1));
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
        UT_GeoFixture fixture("resize");
        const std::string src_file = fixture.makeRaster("source.tif", UTM_RASTER, constantValue);
        const std::string dst_file = fixture.path("resized.tif");

        // 1) Resize By Dimension
        RasterWarper::resize(src_file.c_str(), dst_file.c_str(), ResizeTarget::byDimension(50, 25));
        {
            GdalRaster resized(dst_file);
            ut_assert(lua_obj, resized.getCols() == 50 && resized.getRows() == 25, "Unexpected size: %d x %d", resized.getCols(), resized.getRows());
            ut_assert(lua_obj, resized.getXRes() == 20.0, "Unexpected resolution: %lf", resized.getXRes());
            GDALRasterBand* band = resized.getDataset()->GetRasterBand(1);
            ut_assert(lua_obj, band->GetRasterDataType() == GDT_Float32, "Unexpected data type: %d", band->GetRasterDataType());
            RasterArray* array = resized.readArray();
            ut_assert(lua_obj, std::fabs(array->get(12, 25) - 5.0) < 0.001, "Unexpected value: %lf", array->get(12, 25));
            delete array;
        }

        // 2) Resize By Resolution Over Existing Output
        RasterWarper::resize(src_file.c_str(), dst_file.c_str(), ResizeTarget::byResolution(20.0, 20.0), GeoLib::PIXEL_BYTE);
        {
            GdalRaster resized(dst_file);
            ut_assert(lua_obj, resized.getCols() == 50 && resized.getRows() == 25, "Unexpected size: %d x %d", resized.getCols(), resized.getRows());
            ut_assert(lua_obj, resized.getXRes() == 20.0, "Unexpected resolution: %lf", resized.getXRes());
            GDALRasterBand* band = resized.getDataset()->GetRasterBand(1);
            ut_assert(lua_obj, band->GetRasterDataType() == GDT_Byte, "Unexpected data type: %d", band->GetRasterDataType());
        }

        // 3) Missing Source
        try
        {
            RasterWarper::resize(fixture.path("missing.tif").c_str(), dst_file.c_str(), ResizeTarget::byDimension(50, 25));
            ut_assert(lua_obj, false, "Resized missing source");
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
 * testConfig
 *--------------------------------------------------------------------------------------*/
int UT_Warp::testConfig(lua_State* L)
{
    UT_Warp* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Warp*>(getLuaSelf(L, 1));
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
        // 1) Resize By Dimension
        const parm_field_t by_dimension[] = {{"width", NULL, 640}, {"height", NULL, 480}, {"type", "UInt16", 0}};
        GeoParms* parms = makeParms(L, by_dimension, 3);
        ut_assert(lua_obj, parms->hasResize(), "Resize not configured");
        ut_assert(lua_obj, parms->getResizeTarget().getMode() == ResizeTarget::BY_DIMENSION, "Unexpected resize mode");
        ut_assert(lua_obj, parms->getResizeTarget().getWidth() == 640 && parms->getResizeTarget().getHeight() == 480, "Unexpected dimension");
        ut_assert(lua_obj, parms->getPixelType() == GeoLib::PIXEL_UINT16, "Unexpected pixel type: %s", GeoLib::type2str(parms->getPixelType()));
        ut_assert(lua_obj, !parms->hasNoData(), "Unexpected nodata");
        delete parms;

        // 2) Resize By Resolution
        const parm_field_t by_resolution[] = {{"xres", NULL, 0.5}, {"yres", NULL, 0.25}, {"nodata", NULL, -1.0}};
        parms = makeParms(L, by_resolution, 3);
        ut_assert(lua_obj, parms->getResizeTarget().getMode() == ResizeTarget::BY_RESOLUTION, "Unexpected resize mode");
        ut_assert(lua_obj, parms->getResizeTarget().getXRes() == 0.5 && parms->getResizeTarget().getYRes() == 0.25, "Unexpected resolution");
        ut_assert(lua_obj, parms->getPixelType() == GeoLib::PIXEL_FLOAT32, "Unexpected pixel type: %s", GeoLib::type2str(parms->getPixelType()));
        ut_assert(lua_obj, parms->hasNoData() && parms->getNoData() == -1.0, "Unexpected nodata: %lf", parms->getNoData());
        delete parms;

        // 3) No Resize Supplied
        parms = makeParms(L, NULL, 0);
        ut_assert(lua_obj, !parms->hasResize(), "Unexpected resize");
        try
        {
            parms->getResizeTarget();
            ut_assert(lua_obj, false, "Resize target without configuration");
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_CONFIG_AMBIGUOUS, "Wrong error code: %d", e.code());
        }
        delete parms;
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // 4) Mixed Groups
    const parm_field_t mixed[] = {{"width", NULL, 640}, {"height", NULL, 480}, {"xres", NULL, 0.5}};
    try
    {
        delete makeParms(L, mixed, 3);
        ut_assert(lua_obj, false, "Accepted dimension and resolution together");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_CONFIG_AMBIGUOUS, "Wrong error code: %d", e.code());
    }

    // 5) Half Supplied Groups
    const parm_field_t width_only[] = {{"width", NULL, 640}};
    const parm_field_t yres_only[] = {{"yres", NULL, 0.5}};
    const parm_field_t* halves[] = {width_only, yres_only};
    for(int i = 0; i < 2; i++)
    {
        try
        {
            delete makeParms(L, halves[i], 1);
            ut_assert(lua_obj, false, "Accepted half of a resize group: %s", halves[i][0].key);
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_CONFIG_AMBIGUOUS, "Wrong error code: %d", e.code());
        }
    }

    // 6) Non Positive Targets
    try
    {
        ResizeTarget::byDimension(0, 480);
        ut_assert(lua_obj, false, "Accepted zero width");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_CONFIG_AMBIGUOUS, "Wrong error code: %d", e.code());
    }
    try
    {
        ResizeTarget::byResolution(0.5, -0.5);
        ut_assert(lua_obj, false, "Accepted negative resolution");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_CONFIG_AMBIGUOUS, "Wrong error code: %d", e.code());
    }

    // 7) Unsupported Pixel Type
    const parm_field_t bad_type[] = {{"type", "Int8", 0}};
    try
    {
        delete makeParms(L, bad_type, 1);
        ut_assert(lua_obj, false, "Accepted pixel type Int8");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, e.code() == RTE_UNSUPPORTED_PIXEL_TYPE, "Wrong error code: %d", e.code());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testCrop
 *--------------------------------------------------------------------------------------*/
int UT_Warp::testCrop(lua_State* L)
{
    UT_Warp* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Warp*>(getLuaSelf(L, 1));
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
        UT_GeoFixture fixture("crop");
        const std::string src_file = fixture.makeRaster("source.tif", GEO_RASTER, constantValue);
        const std::string vector_file = fixture.makeFile("area.geojson", CROP_POLYGON);
        const std::string dst_file = fixture.path("cropped.tif");

        // 1) Crop To Polygon Envelope
        RasterWarper::crop(src_file.c_str(), dst_file.c_str(), vector_file.c_str());
        GdalRaster cropped(dst_file);
        ut_assert(lua_obj, cropped.getCols() >= 30 && cropped.getCols() <= 31, "Unexpected width: %d", cropped.getCols());
        ut_assert(lua_obj, cropped.getRows() >= 40 && cropped.getRows() <= 41, "Unexpected height: %d", cropped.getRows());
        ut_assert(lua_obj, std::fabs(cropped.getGeoTransform()[0] - 10.2) < 0.011, "Unexpected west edge: %lf", cropped.getGeoTransform()[0]);
        ut_assert(lua_obj, std::fabs(cropped.getGeoTransform()[3] - 49.7) < 0.011, "Unexpected north edge: %lf", cropped.getGeoTransform()[3]);

        // 2) Interior Values Preserved
        RasterArray* array = cropped.readArray();
        ut_assert(lua_obj, std::fabs(array->get(20, 15) - 5.0) < 0.001, "Unexpected value: %lf", array->get(20, 15));
        delete array;

        // 3) Pixels Outside Triangle Marked As No Data
        const std::string triangle_file = fixture.makeFile("triangle.geojson", CROP_TRIANGLE);
        const std::string triangle_dst = fixture.path("triangle.tif");
        RasterWarper::crop(src_file.c_str(), triangle_dst.c_str(), triangle_file.c_str());
        GdalRaster triangle(triangle_dst);
        ut_assert(lua_obj, triangle.getCols() >= 30 && triangle.getCols() <= 31, "Unexpected width: %d", triangle.getCols());
        ut_assert(lua_obj, triangle.getRows() >= 40 && triangle.getRows() <= 41, "Unexpected height: %d", triangle.getRows());

        int has_nodata = FALSE;
        const double nodata = triangle.getDataset()->GetRasterBand(1)->GetNoDataValue(&has_nodata);
        ut_assert(lua_obj, has_nodata && std::fabs(nodata - RasterWarper::CROP_NODATA) < 0.01, "Unexpected nodata: %lf", nodata);

        RasterArray* values = triangle.readArray();
        ut_assert(lua_obj, std::fabs(values->get(35, 2) - 5.0) < 0.001, "Unexpected value inside triangle: %lf", values->get(35, 2));
        ut_assert(lua_obj, std::fabs(values->get(2, 27) - RasterWarper::CROP_NODATA) < 0.01, "Pixel outside triangle not excluded: %lf", values->get(2, 27));
        delete values;

        // 4) Caller Supplied Marker
        RasterWarper::crop(src_file.c_str(), triangle_dst.c_str(), triangle_file.c_str(), GeoLib::PIXEL_UINT16, true, 65535.0);
        RasterArray* marked = GdalRaster::asArray(triangle_dst.c_str());
        ut_assert(lua_obj, marked->get(2, 27) == 65535.0, "Unexpected marker: %lf", marked->get(2, 27));
        ut_assert(lua_obj, marked->get(35, 2) == 5.0, "Unexpected value inside triangle: %lf", marked->get(35, 2));
        delete marked;
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
 * testNoGeometry
 *--------------------------------------------------------------------------------------*/
int UT_Warp::testNoGeometry(lua_State* L)
{
    UT_Warp* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Warp*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s\n", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    UT_GeoFixture fixture("nogeometry");
    const std::string dst_file = fixture.path("cropped.tif");
    std::string src_file;
    std::string cutlines[3];

    try
    {
        src_file = fixture.makeRaster("source.tif", GEO_RASTER, constantValue);
        cutlines[0] = fixture.makeFile("empty.geojson", EMPTY_COLLECTION);
        cutlines[1] = fixture.makeFile("point.geojson", POINT_COLLECTION);
        cutlines[2] = fixture.path("missing.geojson");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Failed to set up cutlines: %s", e.what());
        lua_pushboolean(L, ut_status(lua_obj));
        return 1;
    }

    // 1) Empty, Point Only And Missing Cutlines
    for(int i = 0; i < 3; i++)
    {
        try
        {
            RasterWarper::crop(src_file.c_str(), dst_file.c_str(), cutlines[i].c_str());
            ut_assert(lua_obj, false, "Cropped with cutline %s", cutlines[i].c_str());
        }
        catch(const RunTimeException& e)
        {
            ut_assert(lua_obj, e.code() == RTE_GEOMETRY_UNAVAILABLE, "Wrong error code for %s: %d", cutlines[i].c_str(), e.code());
        }
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
