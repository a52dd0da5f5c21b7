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

#include "GdalRaster.h"
#include "ArrayObject.h"
#include "LuaObject.h"
#include "EventLib.h"

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
GdalRaster::GdalRaster(const std::string& _fileName):
    fileName(_fileName),
    dset(NULL),
    xsize(0),
    ysize(0),
    bandCount(0)
{
    dset = static_cast<GDALDataset*>(GDALOpenEx(fileName.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, NULL, NULL, NULL));
    if(dset == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_DATA_UNAVAILABLE, "Failed to open raster: %s", fileName.c_str());
    }

    mlog(DEBUG, "Opened %s", fileName.c_str());

    xsize = dset->GetRasterXSize();
    ysize = dset->GetRasterYSize();
    bandCount = dset->GetRasterCount();

    /* Rasters without georeferencing fall back to the identity transform */
    const CPLErr err = dset->GetGeoTransform(geoTransform);
    if(err != CE_None)
    {
        mlog(DEBUG, "No geotransform available for %s", fileName.c_str());
        geoTransform[0] = 0.0; geoTransform[1] = 1.0; geoTransform[2] = 0.0;
        geoTransform[3] = 0.0; geoTransform[4] = 0.0; geoTransform[5] = 1.0;
    }
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
GdalRaster::~GdalRaster(void)
{
    if(dset) GDALClose((GDALDatasetH)dset);
}

/*----------------------------------------------------------------------------
 * readArray
 *
 *  bandNum of 0 reads every band; a single band raster, or a specific band,
 *  produces a rank 2 array
 *----------------------------------------------------------------------------*/
RasterArray* GdalRaster::readArray(int bandNum) const
{
    if(bandNum < 0 || bandNum > bandCount)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Band %d not available in %s (%d bands)", bandNum, fileName.c_str(), bandCount);
    }

    if(bandCount == 0)
    {
        throw RunTimeException(CRITICAL, RTE_DATA_UNAVAILABLE, "No bands in raster: %s", fileName.c_str());
    }

    CPLErr err = CE_None;
    RasterArray* array = NULL;

    if(bandNum > 0 || bandCount == 1)
    {
        GDALRasterBand* band = dset->GetRasterBand(bandNum > 0 ? bandNum : 1);
        CHECKPTR(band);

        array = new RasterArray(ysize, xsize);
        err = band->RasterIO(GF_Read, 0, 0, xsize, ysize, array->getData(), xsize, ysize, GDT_Float64, 0, 0, NULL);
    }
    else
    {
        /* Band interleaved by pixel */
        const GSpacing pixel_space = static_cast<GSpacing>(bandCount) * sizeof(double);
        const GSpacing line_space = pixel_space * xsize;
        const GSpacing band_space = sizeof(double);

        array = new RasterArray(ysize, xsize, bandCount);
        err = dset->RasterIO(GF_Read, 0, 0, xsize, ysize, array->getData(), xsize, ysize, GDT_Float64,
                             bandCount, NULL, pixel_space, line_space, band_space, NULL);
    }

    if(err != CE_None)
    {
        delete array;
        throw RunTimeException(CRITICAL, RTE_DATA_UNAVAILABLE, "RasterIO call failed on %s: %d", fileName.c_str(), err);
    }

    return array;
}

/*----------------------------------------------------------------------------
 * getProjection
 *----------------------------------------------------------------------------*/
std::string GdalRaster::getProjection(void) const
{
    const char* projref = dset->GetProjectionRef();
    if(projref == NULL) return std::string();
    return std::string(projref);
}

/*----------------------------------------------------------------------------
 * asArray
 *----------------------------------------------------------------------------*/
RasterArray* GdalRaster::asArray(const char* path, int bandNum)
{
    GdalRaster raster(path);
    return raster.readArray(bandNum);
}

/*----------------------------------------------------------------------------
 * luaAsArray - asarray(<path>, [<band>]) --> array | false, rc
 *----------------------------------------------------------------------------*/
int GdalRaster::luaAsArray(lua_State* L)
{
    try
    {
        const char* path = LuaObject::getLuaString(L, 1);
        const long band = LuaObject::getLuaInteger(L, 2, true, 0);
        if(band < 0 || band > INT_MAX)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "invalid band: %ld", band);
        }
        return ArrayObject::pushArray(L, asArray(path, band));
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error reading raster: %s", e.what());
        return LuaObject::returnLuaError(L, e.code());
    }
}
