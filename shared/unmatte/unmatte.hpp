#pragma once
#include <opencv2/core.hpp>

namespace pcanvas
{

struct UnmatteSettings
{
    cv::Scalar matte {255, 255, 255};   // BGR
    double maxMatteDistance {0.35};     // normalized RGB distance
    double opaqueLevel {0.95};
    double transparentLevel {0.05};
};

// Removes the light halo a previous matte left on translucent edge pixels of a
// BGRA image, in place. Only edge pixels that are close to the matte color and
// whose unmatted color is clearly not matte are changed; alpha is never touched.
// Returns the number of corrected pixels. Non-BGRA input is left as is.
int unmatteEdges(cv::Mat& bgra, const UnmatteSettings& settings = UnmatteSettings{});

}
