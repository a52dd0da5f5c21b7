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
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include "UT_GeoFixture.h"
#include "GdalRaster.h"
#include "EventLib.h"

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_GeoFixture::UT_GeoFixture(const char* name)
{
    std::filesystem::path dir = std::filesystem::temp_directory_path();
    dir /= "geosat_" + std::string(name) + "_" + std::to_string(getpid());
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    directory = dir.string();
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
UT_GeoFixture::~UT_GeoFixture(void)
{
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
    if(ec) mlog(WARNING, "Failed to remove %s: %s", directory.c_str(), ec.message().c_str());
}

/*----------------------------------------------------------------------------
 * path
 *----------------------------------------------------------------------------*/
std::string UT_GeoFixture::path(const char* file_name) const
{
    return directory + PATH_DELIMETER + file_name;
}

/*----------------------------------------------------------------------------
 * makeRaster
 *----------------------------------------------------------------------------*/
std::string UT_GeoFixture::makeRaster(const char* file_name, const raster_def_t& def, const pixel_func_t& value, GeoLib::pixel_type_t type) const
{
    const std::string file_path = path(file_name);

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    CHECKPTR(driver);

    GDALDataset* dset = driver->Create(file_path.c_str(), def.cols, def.rows, def.bands, GeoLib::type2gdal(type), NULL);
    CHECKPTR(dset);

    double geotransform[6] = {def.ulx, def.res, 0.0, def.uly, 0.0, -def.res};
    CHECK_GDALERR(dset->SetGeoTransform(geotransform));

    OGRSpatialReference srs;
    CHECK_GDALERR(srs.importFromEPSG(def.epsg));
    char* wkt = NULL;
    srs.exportToWkt(&wkt);
    CHECK_GDALERR(dset->SetProjection(wkt));
    CPLFree(wkt);

    std::vector<double> data(static_cast<size_t>(def.cols) * def.rows);
    for(int b = 0; b < def.bands; b++)
    {
        for(int r = 0; r < def.rows; r++)
        {
            for(int c = 0; c < def.cols; c++)
            {
                data[(static_cast<size_t>(r) * def.cols) + c] = value(r, c, b);
            }
        }

        GDALRasterBand* band = dset->GetRasterBand(b + 1);
        CHECK_GDALERR(band->RasterIO(GF_Write, 0, 0, def.cols, def.rows, data.data(), def.cols, def.rows, GDT_Float64, 0, 0, NULL));
    }

    GDALClose(dset);
    return file_path;
}

/*----------------------------------------------------------------------------
 * makeFile
 *----------------------------------------------------------------------------*/
std::string UT_GeoFixture::makeFile(const char* file_name, const char* contents) const
{
    const std::string file_path = path(file_name);
    std::ofstream out(file_path, std::ios::out | std::ios::trunc);
    if(!out)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to create %s", file_path.c_str());
    }
    out << contents;
    return file_path;
}

/*----------------------------------------------------------------------------
 * readFile
 *----------------------------------------------------------------------------*/
std::string UT_GeoFixture::readFile(const std::string& file_path)
{
    std::ifstream in(file_path, std::ios::in | std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}
