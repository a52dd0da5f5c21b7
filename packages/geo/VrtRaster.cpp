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
#include <gdal_utils.h>
#include <cpl_minixml.h>
#include <cpl_vsi.h>

#include "VrtRaster.h"
#include "GdalRaster.h"
#include "TempFile.h"
#include "LuaObject.h"
#include "EventLib.h"

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * buildVRT
 *----------------------------------------------------------------------------*/
void VrtRaster::buildVRT(const std::vector<std::string>& rlist, const char* vrt_file)
{
    if(rlist.empty())
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "No source rasters supplied for %s", vrt_file);
    }

    /* GDALBuildVRT skips sources it cannot open, so check them up front */
    std::vector<const char*> rasters;
    for(const std::string& raster: rlist)
    {
        VSIStatBufL sbuf;
        if(VSIStatL(raster.c_str(), &sbuf) != 0)
        {
            throw RunTimeException(CRITICAL, RTE_DATA_UNAVAILABLE, "Source raster not found: %s", raster.c_str());
        }
        rasters.push_back(raster.c_str());
    }

    char** options = NULL;
    options = CSLAddString(options, "-allow_projection_difference");
    GDALBuildVRTOptions* vrt_options = GDALBuildVRTOptionsNew(options, NULL);
    CSLDestroy(options);
    CHECKPTR(vrt_options);

    int usage_error = FALSE;
    GDALDataset* vrtDset = static_cast<GDALDataset*>(GDALBuildVRT(vrt_file, rasters.size(), NULL, rasters.data(), vrt_options, &usage_error));
    GDALBuildVRTOptionsFree(vrt_options);

    if(vrtDset == NULL || usage_error)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to build VRT %s from %d sources", vrt_file, static_cast<int>(rasters.size()));
    }

    GDALClose(vrtDset);
    mlog(DEBUG, "Created %s", vrt_file);
}

/*----------------------------------------------------------------------------
 * materialize
 *
 *  renders VRT into an uncompressed, band interleaved, tiled GeoTIFF
 *----------------------------------------------------------------------------*/
void VrtRaster::materialize(const char* vrt_file, const char* dst_file)
{
    checkSources(vrt_file);

    GDALDatasetH vrtDset = GDALOpenEx(vrt_file, GDAL_OF_RASTER | GDAL_OF_READONLY, NULL, NULL, NULL);
    if(vrtDset == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_RENDER_FAILURE, "Failed to open VRT: %s", vrt_file);
    }

    char** options = NULL;
    options = CSLAddString(options, "-of");
    options = CSLAddString(options, "GTiff");
    options = CSLAddString(options, "-co");
    options = CSLAddString(options, "INTERLEAVE=BAND");
    options = CSLAddString(options, "-co");
    options = CSLAddString(options, "TILED=YES");
    GDALTranslateOptions* translate_options = GDALTranslateOptionsNew(options, NULL);
    CSLDestroy(options);
    if(translate_options == NULL)
    {
        GDALClose(vrtDset);
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to create translate options for %s", vrt_file);
    }

    CPLErrorReset();
    int usage_error = FALSE;
    GDALDatasetH dstDset = GDALTranslate(dst_file, vrtDset, translate_options, &usage_error);
    const CPLErr last_err = CPLGetLastErrorType();
    GDALTranslateOptionsFree(translate_options);
    if(dstDset) GDALClose(dstDset);
    GDALClose(vrtDset);

    if(dstDset == NULL || usage_error || last_err >= CE_Failure)
    {
        throw RunTimeException(CRITICAL, RTE_RENDER_FAILURE, "Failed to render %s into %s", vrt_file, dst_file);
    }

    mlog(DEBUG, "Rendered %s into %s", vrt_file, dst_file);
}

/*----------------------------------------------------------------------------
 * merge
 *
 *  the VRT is removed once the merged raster is written; on failure it is
 *  left in place so the mosaic can be inspected
 *----------------------------------------------------------------------------*/
void VrtRaster::merge(const std::vector<std::string>& rlist, const char* tmp_file, const char* dst_file)
{
    TempFile vrt(tmp_file);

    try
    {
        buildVRT(rlist, vrt.getPath());
        materialize(vrt.getPath(), dst_file);
    }
    catch(const RunTimeException& e)
    {
        vrt.keep();
        mlog(e.level(), "Merge into %s failed, mosaic retained at %s", dst_file, vrt.getPath());
        throw;
    }
}

/*----------------------------------------------------------------------------
 * luaBuildVRT - buildvrt({<paths>}, <vrt file>)
 *----------------------------------------------------------------------------*/
int VrtRaster::luaBuildVRT(lua_State* L)
{
    try
    {
        std::vector<std::string> rlist;
        getLuaPaths(L, 1, rlist);
        const char* vrt_file = LuaObject::getLuaString(L, 2);
        buildVRT(rlist, vrt_file);
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error building VRT: %s", e.what());
        return LuaObject::returnLuaError(L, e.code());
    }

    return LuaObject::returnLuaStatus(L, true);
}

/*----------------------------------------------------------------------------
 * luaMaterialize - vrt2tiff(<vrt file>, <tiff file>)
 *----------------------------------------------------------------------------*/
int VrtRaster::luaMaterialize(lua_State* L)
{
    try
    {
        const char* vrt_file = LuaObject::getLuaString(L, 1);
        const char* dst_file = LuaObject::getLuaString(L, 2);
        materialize(vrt_file, dst_file);
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error materializing VRT: %s", e.what());
        return LuaObject::returnLuaError(L, e.code());
    }

    return LuaObject::returnLuaStatus(L, true);
}

/*----------------------------------------------------------------------------
 * luaMerge - merge({<paths>}, <tmp vrt file>, <tiff file>)
 *----------------------------------------------------------------------------*/
int VrtRaster::luaMerge(lua_State* L)
{
    try
    {
        std::vector<std::string> rlist;
        getLuaPaths(L, 1, rlist);
        const char* tmp_file = LuaObject::getLuaString(L, 2);
        const char* dst_file = LuaObject::getLuaString(L, 3);
        merge(rlist, tmp_file, dst_file);
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error merging rasters: %s", e.what());
        return LuaObject::returnLuaError(L, e.code());
    }

    return LuaObject::returnLuaStatus(L, true);
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * checkSources
 *
 *  VRT sources are opened lazily at read time, so a missing source is only
 *  detected by walking the descriptor
 *----------------------------------------------------------------------------*/
void VrtRaster::checkSources(const char* vrt_file)
{
    CPLXMLNode* root = CPLParseXMLFile(vrt_file);
    if(root == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_RENDER_FAILURE, "Failed to parse VRT: %s", vrt_file);
    }

    const std::string vrt_dir = CPLGetPath(vrt_file);
    std::string missing;

    std::vector<CPLXMLNode*> stack = {root};
    while(!stack.empty() && missing.empty())
    {
        CPLXMLNode* node = stack.back();
        stack.pop_back();

        for(; node != NULL; node = node->psNext)
        {
            if(node->eType != CXT_Element) continue;

            if(EQUAL(node->pszValue, "SourceFilename"))
            {
                const char* name = CPLGetXMLValue(node, NULL, "");
                const bool relative = atoi(CPLGetXMLValue(node, "relativeToVRT", "0")) != 0;
                const std::string path = relative ? std::string(CPLFormFilename(vrt_dir.c_str(), name, NULL)) : std::string(name);

                VSIStatBufL sbuf;
                if(VSIStatL(path.c_str(), &sbuf) != 0)
                {
                    missing = path;
                    break;
                }
            }
            else if(node->psChild)
            {
                stack.push_back(node->psChild);
            }
        }
    }

    CPLDestroyXMLNode(root);

    if(!missing.empty())
    {
        throw RunTimeException(CRITICAL, RTE_RENDER_FAILURE, "Source %s referenced by %s is missing", missing.c_str(), vrt_file);
    }
}

/*----------------------------------------------------------------------------
 * getLuaPaths
 *----------------------------------------------------------------------------*/
void VrtRaster::getLuaPaths(lua_State* L, int parm, std::vector<std::string>& rlist)
{
    if(lua_type(L, parm) != LUA_TTABLE)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Source rasters must be supplied as a lua table");
    }

    const int num_paths = lua_rawlen(L, parm);
    for(int i = 1; i <= num_paths; i++)
    {
        lua_rawgeti(L, parm, i);
        const bool is_string = (lua_type(L, -1) == LUA_TSTRING);
        if(is_string) rlist.push_back(lua_tostring(L, -1));
        lua_pop(L, 1);
        if(!is_string)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "Source raster %d is not a string", i);
        }
    }
}
