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

#include <gdal_priv.h>

#include "RasterWriter.h"
#include "GdalRaster.h"
#include "ArrayObject.h"
#include "GeoParms.h"
#include "LuaObject.h"
#include "EventLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* RasterWriter::DRIVER_NAME = "GTiff";

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * write
 *
 *  geotransform comes from geom_file and projection from proj_file; the array
 *  must have the same number of rows and columns as geom_file
 *----------------------------------------------------------------------------*/
void RasterWriter::write(const char* dst_file, const RasterArray& array, const char* proj_file, const char* geom_file,
                         GeoLib::pixel_type_t type, double nodata)
{
    const int rows = array.getRows();
    const int cols = array.getCols();
    const int bands = array.getBands();

    std::string projref;
    double geotransform[6];

    /* Reference Geometry */
    {
        GdalRaster geom_raster(geom_file);
        if(geom_raster.getRows() != rows || geom_raster.getCols() != cols)
        {
            throw RunTimeException(CRITICAL, RTE_SHAPE_MISMATCH, "Array shape %d x %d does not match %s (%d x %d)",
                                   rows, cols, geom_file, geom_raster.getRows(), geom_raster.getCols());
        }
        const double* gt = geom_raster.getGeoTransform();
        for(int i = 0; i < 6; i++) geotransform[i] = gt[i];
    }

    /* Reference Projection */
    {
        GdalRaster proj_raster(proj_file);
        projref = proj_raster.getProjection();
    }

    /* GDAL stores an out of range no data value as given */
    const bool representable = GeoLib::isRepresentable(type, nodata);
    if(!representable)
    {
        mlog(WARNING, "No data value %lf cannot be represented as %s in %s", nodata, GeoLib::type2str(type), dst_file);
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(DRIVER_NAME);
    CHECKPTR(driver);

    /* Create replaces any existing file */
    GDALDataset* dset = driver->Create(dst_file, cols, rows, bands, GeoLib::type2gdal(type), NULL);
    if(dset == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to create raster: %s", dst_file);
    }

    try
    {
        CHECK_GDALERR(dset->SetGeoTransform(geotransform));
        if(!projref.empty())
        {
            CHECK_GDALERR(dset->SetProjection(projref.c_str()));
        }

        const GSpacing pixel_space = static_cast<GSpacing>(bands) * sizeof(double);
        const GSpacing line_space = pixel_space * cols;

        for(int b = 0; b < bands; b++)
        {
            GDALRasterBand* band = dset->GetRasterBand(b + 1);
            CHECKPTR(band);
            const CPLErr nodata_err = band->SetNoDataValue(nodata);
            if(nodata_err != CE_None)
            {
                if(representable) throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to set no data value %lf: %d", nodata, nodata_err);
                mlog(WARNING, "No data value not set on band %d of %s", b + 1, dst_file);
            }

            /* Array is band interleaved by pixel, GDAL performs the type conversion */
            void* data = const_cast<double*>(array.getData() + b);
            const CPLErr err = band->RasterIO(GF_Write, 0, 0, cols, rows, data, cols, rows, GDT_Float64, pixel_space, line_space, NULL);
            if(err != CE_None)
            {
                throw RunTimeException(CRITICAL, RTE_ERROR, "RasterIO call failed: %d", err);
            }
        }

        dset->FlushCache();
    }
    catch(const RunTimeException&)
    {
        GDALClose(dset);
        throw;
    }

    GDALClose(dset);
    mlog(DEBUG, "Wrote %d band %s raster %s (%d x %d)", bands, GeoLib::type2str(type), dst_file, rows, cols);
}

/*----------------------------------------------------------------------------
 * luaWrite - write(<dst>, <array>, <projection reference>, <geometry reference>, [<parms>])
 *----------------------------------------------------------------------------*/
int RasterWriter::luaWrite(lua_State* L)
{
    ArrayObject* array = NULL;
    GeoParms* parms = NULL;

    try
    {
        const char* dst_file = LuaObject::getLuaString(L, 1);
        array = ArrayObject::getLuaArray(L, 2);
        const char* proj_file = LuaObject::getLuaString(L, 3);
        const char* geom_file = LuaObject::getLuaString(L, 4);
        parms = GeoParms::getLuaParms(L, 5);

        GeoLib::pixel_type_t type = GeoLib::PIXEL_FLOAT32;
        double nodata = GeoParms::DEFAULT_NODATA;
        if(parms)
        {
            type = parms->getPixelType();
            if(parms->hasNoData()) nodata = parms->getNoData();
        }

        write(dst_file, array->getArray(), proj_file, geom_file, type, nodata);
    }
    catch(const RunTimeException& e)
    {
        if(array) array->releaseLuaObject();
        if(parms) parms->releaseLuaObject();
        mlog(e.level(), "Error writing raster: %s", e.what());
        return LuaObject::returnLuaError(L, e.code());
    }

    array->releaseLuaObject();
    if(parms) parms->releaseLuaObject();
    return LuaObject::returnLuaStatus(L, true);
}
