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

#include <string>
#include <gdal_priv.h>
#include <gdal_utils.h>
#include <ogrsf_frmts.h>

#include "RasterWarper.h"
#include "GdalRaster.h"
#include "GeoParms.h"
#include "LuaObject.h"
#include "EventLib.h"
#include "StringLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* RasterWarper::RESAMPLING_ALGO = "cubic";
const double RasterWarper::CROP_NODATA = -9999.9;

/******************************************************************************
 * RESIZE TARGET METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * byDimension
 *----------------------------------------------------------------------------*/
ResizeTarget ResizeTarget::byDimension(long width, long height)
{
    if(width <= 0 || height <= 0)
    {
        throw RunTimeException(CRITICAL, RTE_CONFIG_AMBIGUOUS, "resize dimensions must be positive: %ld x %ld", width, height);
    }
    return ResizeTarget(BY_DIMENSION, width, height, 0.0, 0.0);
}

/*----------------------------------------------------------------------------
 * byResolution
 *----------------------------------------------------------------------------*/
ResizeTarget ResizeTarget::byResolution(double xres, double yres)
{
    if(!(xres > 0.0) || !(yres > 0.0))
    {
        throw RunTimeException(CRITICAL, RTE_CONFIG_AMBIGUOUS, "resize resolution must be positive: %lf x %lf", xres, yres);
    }
    return ResizeTarget(BY_RESOLUTION, 0, 0, xres, yres);
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
ResizeTarget::ResizeTarget(resize_mode_t _mode, long _width, long _height, double _xres, double _yres):
    mode(_mode),
    width(_width),
    height(_height),
    xres(_xres),
    yres(_yres)
{
}

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * resize
 *----------------------------------------------------------------------------*/
void RasterWarper::resize(const char* src_file, const char* dst_file, const ResizeTarget& target, GeoLib::pixel_type_t type)
{
    std::vector<std::string> args;

    if(target.getMode() == ResizeTarget::BY_DIMENSION)
    {
        args.push_back("-ts");
        args.push_back(std::to_string(target.getWidth()));
        args.push_back(std::to_string(target.getHeight()));
    }
    else
    {
        char xres_str[MAX_STR_SIZE];
        char yres_str[MAX_STR_SIZE];
        StringLib::format(xres_str, MAX_STR_SIZE, "%.17g", target.getXRes());
        StringLib::format(yres_str, MAX_STR_SIZE, "%.17g", target.getYRes());
        args.push_back("-tr");
        args.push_back(xres_str);
        args.push_back(yres_str);
    }

    warp(src_file, dst_file, args, type);
}

/*----------------------------------------------------------------------------
 * crop
 *
 *  output extent is the envelope of the cutline, pixels outside of the
 *  cutline are set to nodata; without a caller supplied value the marker is
 *  CROP_NODATA, or 0 for pixel types that cannot hold it
 *----------------------------------------------------------------------------*/
void RasterWarper::crop(const char* src_file, const char* dst_file, const char* vector_file, GeoLib::pixel_type_t type,
                        bool nodata_provided, double nodata)
{
    checkCutline(vector_file);

    if(!nodata_provided)
    {
        nodata = GeoLib::isRepresentable(type, CROP_NODATA) ? CROP_NODATA : 0.0;
    }
    else if(!GeoLib::isRepresentable(type, nodata))
    {
        mlog(WARNING, "Crop no data value %lf cannot be represented as %s", nodata, GeoLib::type2str(type));
    }

    char nodata_str[MAX_STR_SIZE];
    StringLib::format(nodata_str, MAX_STR_SIZE, "%.17g", nodata);

    std::vector<std::string> args;
    args.push_back("-cutline");
    args.push_back(vector_file);
    args.push_back("-crop_to_cutline");
    args.push_back("-dstnodata");
    args.push_back(nodata_str);

    warp(src_file, dst_file, args, type);
}

/*----------------------------------------------------------------------------
 * luaResize - resize(<src>, <dst>, <parms>)
 *----------------------------------------------------------------------------*/
int RasterWarper::luaResize(lua_State* L)
{
    GeoParms* parms = NULL;

    try
    {
        const char* src_file = LuaObject::getLuaString(L, 1);
        const char* dst_file = LuaObject::getLuaString(L, 2);
        parms = GeoParms::getLuaParms(L, 3);
        if(parms == NULL)
        {
            throw RunTimeException(CRITICAL, RTE_CONFIG_AMBIGUOUS, "resize requires parameters with a dimension or a resolution");
        }

        resize(src_file, dst_file, parms->getResizeTarget(), parms->getPixelType());
    }
    catch(const RunTimeException& e)
    {
        if(parms) parms->releaseLuaObject();
        mlog(e.level(), "Error resizing raster: %s", e.what());
        return LuaObject::returnLuaError(L, e.code());
    }

    parms->releaseLuaObject();
    return LuaObject::returnLuaStatus(L, true);
}

/*----------------------------------------------------------------------------
 * luaCrop - crop(<src>, <dst>, <vector>, [<parms>])
 *----------------------------------------------------------------------------*/
int RasterWarper::luaCrop(lua_State* L)
{
    GeoParms* parms = NULL;

    try
    {
        const char* src_file = LuaObject::getLuaString(L, 1);
        const char* dst_file = LuaObject::getLuaString(L, 2);
        const char* vector_file = LuaObject::getLuaString(L, 3);
        parms = GeoParms::getLuaParms(L, 4);

        if(parms) crop(src_file, dst_file, vector_file, parms->getPixelType(), parms->hasNoData(), parms->getNoData());
        else      crop(src_file, dst_file, vector_file);
    }
    catch(const RunTimeException& e)
    {
        if(parms) parms->releaseLuaObject();
        mlog(e.level(), "Error cropping raster: %s", e.what());
        return LuaObject::returnLuaError(L, e.code());
    }

    if(parms) parms->releaseLuaObject();
    return LuaObject::returnLuaStatus(L, true);
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * checkCutline
 *
 *  the first layer must hold at least one non-empty areal geometry
 *----------------------------------------------------------------------------*/
void RasterWarper::checkCutline(const char* vector_file)
{
    GDALDataset* dset = static_cast<GDALDataset*>(GDALOpenEx(vector_file, GDAL_OF_VECTOR | GDAL_OF_READONLY, NULL, NULL, NULL));
    if(dset == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_GEOMETRY_UNAVAILABLE, "Failed to open cutline: %s", vector_file);
    }

    bool found = false;
    OGRLayer* layer = (dset->GetLayerCount() > 0) ? dset->GetLayer(0) : NULL;
    if(layer)
    {
        OGRFeature* feature = NULL;
        layer->ResetReading();
        while(!found && (feature = layer->GetNextFeature()) != NULL)
        {
            const OGRGeometry* geo = feature->GetGeometryRef();
            if(geo && !geo->IsEmpty() && geo->getDimension() == 2)
            {
                found = true;
            }
            OGRFeature::DestroyFeature(feature);
        }
    }

    GDALClose(dset);

    if(!found)
    {
        throw RunTimeException(CRITICAL, RTE_GEOMETRY_UNAVAILABLE, "No polygon geometry found in cutline: %s", vector_file);
    }
}

/*----------------------------------------------------------------------------
 * warp
 *----------------------------------------------------------------------------*/
void RasterWarper::warp(const char* src_file, const char* dst_file, const std::vector<std::string>& args, GeoLib::pixel_type_t type)
{
    GdalRaster raster(src_file);

    /* Existing output is always replaced */
    char** options = NULL;
    options = CSLAddString(options, "-of");
    options = CSLAddString(options, "GTiff");
    options = CSLAddString(options, "-r");
    options = CSLAddString(options, RESAMPLING_ALGO);
    options = CSLAddString(options, "-ot");
    options = CSLAddString(options, GeoLib::type2str(type));
    options = CSLAddString(options, "-overwrite");
    for(const std::string& arg: args)
    {
        options = CSLAddString(options, arg.c_str());
    }

    GDALWarpAppOptions* warp_options = GDALWarpAppOptionsNew(options, NULL);
    CSLDestroy(options);
    CHECKPTR(warp_options);

    GDALDatasetH src = static_cast<GDALDatasetH>(raster.getDataset());
    int usage_error = FALSE;
    GDALDatasetH dstDset = GDALWarp(dst_file, NULL, 1, &src, warp_options, &usage_error);
    GDALWarpAppOptionsFree(warp_options);

    if(dstDset == NULL || usage_error)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to warp %s into %s", src_file, dst_file);
    }

    GDALClose(dstDset);
    mlog(DEBUG, "Warped %s into %s", src_file, dst_file);
}
