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

#ifndef PL_DCT_HH
#define PL_DCT_HH

#include <bpdf/Pipeline.hh>

#include <string>

// JPEG (DCTDecode) codec. A decoding pipeline turns JPEG data into interleaved 8-bit samples; an
// encoding pipeline turns gray or RGB samples into baseline JPEG data. libjpeg needs the whole
// input, so nothing is passed on until finish() is called. libjpeg errors are thrown as
// std::runtime_error.
class BPDF_DLL_CLASS Pl_DCT: public Pipeline
{
  public:
    struct Header
    {
        int width{0};
        int height{0};
        int components{0};
    };

    BPDF_DLL
    Pl_DCT(char const* identifier, Pipeline* next);

    // The written data must be exactly width * height * components bytes. components must be 1
    // or 3. quality is the libjpeg quality setting from 1 to 100.
    BPDF_DLL
    Pl_DCT(
        char const* identifier, Pipeline* next, int width, int height, int components, int quality);

    BPDF_DLL
    ~Pl_DCT() override = default;

    BPDF_DLL
    void write(unsigned char const* data, size_t len) override;
    BPDF_DLL
    void finish() override;

    // For a decoding pipeline, the dimensions of the last decoded image
    Header const&
    getHeader() const
    {
        return header;
    }

    // Read the frame header of JPEG data without decoding the scans
    BPDF_DLL
    static Header readHeader(std::string const& data);

  private:
    bool encoding{false};
    int quality{0};
    Header header;
    std::string data;
};

#endif // PL_DCT_HH
