// Copyright (c) 2024-2026 The bpdf authors
//
// This file is part of bpdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BPDFPIXMAP_HH
#define BPDFPIXMAP_HH

#include <bpdf/DLL.h>

#include <bpdf/BPDFObjectHandle.hh>

#include <string>

// An uncompressed raster of 8-bit samples. Rows run from top to bottom with no padding and
// components are interleaved, so pixels holds width * height * components bytes. Only gray
// (1 component) and RGB (3 components) images are used.
class BPDFPixmap
{
  public:
    BPDFPixmap() = default;
    BPDF_DLL
    BPDFPixmap(int width, int height, int components);
    BPDF_DLL
    BPDFPixmap(int width, int height, int components, std::string pixels);

    BPDF_DLL
    bool empty() const;

    // Decode an image XObject. Only images with 8 bits per component in DeviceGray, DeviceRGB,
    // or an ICC-based space with 1 or 3 components, without masks, whose data is uncompressed,
    // flate-compressed without a predictor, or DCT-encoded, are supported. On failure, false is
    // returned and reason explains why.
    BPDF_DLL
    static bool fromImage(BPDFObjectHandle image, BPDFPixmap& result, std::string& reason);
    // Decode a JPEG file. Throws BPDFExc with bpdf_e_unsupported if it isn't gray or RGB.
    BPDF_DLL
    static BPDFPixmap fromJPEG(std::string const& data);

    // Return a copy scaled to the new size by averaging the covered source pixels when
    // shrinking and by nearest neighbor when growing
    BPDF_DLL
    BPDFPixmap resample(int new_width, int new_height) const;
    // Copy src into this image with its top left corner at x, y, clipping at the edges.
    // Components are converted if they differ.
    BPDF_DLL
    void paste(BPDFPixmap const& src, int x, int y);
    // Convert to gray
    BPDF_DLL
    BPDFPixmap toGray() const;

    BPDF_DLL
    std::string toJPEG(int quality) const;
    // Binary PGM for gray images, PPM for RGB
    BPDF_DLL
    std::string toPNM() const;

    int width{0};
    int height{0};
    int components{0};
    std::string pixels;
};

#endif // BPDFPIXMAP_HH
