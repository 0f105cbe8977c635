#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <opencv2/core/mat.hpp>

#include <pcr/util.hpp>

/*
        Writes a four channel C, M, Y, K image with 0 meaning no ink
        Samples are stored inverted with an Adobe marker, the convention print software expects
*/
bool WriteCmykJpeg(const fs::path& path, const cv::Mat& cmyk, int32_t quality, PixelDensity density);

struct JpegInfo
{
    uint32_t m_Width;
    uint32_t m_Height;
    uint32_t m_Components;
    std::string m_ColorSpace;
    bool m_AdobeMarker;

    // Dots per inch, empty if the file stores no absolute density
    std::optional<uint32_t> m_Dpi;
};

// Reads only the headers of a jpeg file
std::optional<JpegInfo> ProbeJpeg(const fs::path& path);
