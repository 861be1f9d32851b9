/**
 * @file OutputFormat.hpp
 * Output encodings and the small enums that select segmentation and
 * placement behaviour.
 */
#pragma once

namespace pcanvas
{

enum class OutputFormat
{
    Webp = 0,   // lossy, quality driven by the size budget
    Jpeg = 1,   // lossy, fixed quality
    Png = 2,    // lossless
};

enum class BackgroundEdgeMode
{
    Auto = 0,
    White = 1,
    Black = 2,
};

enum class CenterMode
{
    BoundingBox = 0,
    Centroid = 1,
};

}
