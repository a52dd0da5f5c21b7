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

#include "RasterArray.h"

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
RasterArray::RasterArray(uint32_t _rows, uint32_t _cols, uint32_t _bands, double fill):
    rows(_rows),
    cols(_cols),
    bands(_bands > 0 ? _bands : 1),
    stacked(_bands > 0)
{
    if(rows == 0 || cols == 0)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "invalid array shape: %u x %u", rows, cols);
    }

    data.assign(static_cast<size_t>(rows) * cols * bands, fill);
}

/*----------------------------------------------------------------------------
 * get
 *----------------------------------------------------------------------------*/
double RasterArray::get(uint32_t row, uint32_t col, uint32_t band) const
{
    return data[offset(row, col, band)];
}

/*----------------------------------------------------------------------------
 * set
 *----------------------------------------------------------------------------*/
void RasterArray::set(uint32_t row, uint32_t col, uint32_t band, double value)
{
    data[offset(row, col, band)] = value;
}

/*----------------------------------------------------------------------------
 * set
 *----------------------------------------------------------------------------*/
void RasterArray::set(uint32_t row, uint32_t col, double value)
{
    data[offset(row, col, 0)] = value;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * offset
 *----------------------------------------------------------------------------*/
size_t RasterArray::offset(uint32_t row, uint32_t col, uint32_t band) const
{
    if(row >= rows || col >= cols || band >= bands)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "index (%u, %u, %u) out of bounds for array of shape (%u, %u, %u)", row, col, band, rows, cols, bands);
    }

    return ((static_cast<size_t>(row) * cols) + col) * bands + band;
}
