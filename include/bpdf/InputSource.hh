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

#ifndef BPDF_INPUTSOURCE_HH
#define BPDF_INPUTSOURCE_HH

#include <bpdf/DLL.h>
#include <bpdf/Types.h>

#include <cstdio>
#include <string>

// Random access to the bytes of a document. Subclasses supply positioning and raw reads. Line
// handling is built on those here.
//
// last_offset is the position at which the most recent read or readLine started, which is what
// error messages report.
class BPDF_DLL_CLASS InputSource
{
  public:
    BPDF_DLL
    virtual ~InputSource() = default;

    virtual std::string const& getName() const = 0;
    virtual bpdf_offset_t tell() = 0;
    // whence is SEEK_SET, SEEK_CUR or SEEK_END
    virtual void seek(bpdf_offset_t offset, int whence) = 0;
    virtual size_t read(char* buffer, size_t length) = 0;
    // Step back over the character just read
    virtual void unreadCh(char ch) = 0;

    // Read up to count bytes from "at", or from the current position if at is negative.
    BPDF_DLL
    std::string read(size_t count, bpdf_offset_t at = -1);

    // Return up to max_line_length characters of the current line and move past its end of line
    // marker, which is any run of \r and \n characters.
    BPDF_DLL
    std::string readLine(size_t max_line_length);

    // Move past the end of the current line and return the offset where the line ended.
    BPDF_DLL
    bpdf_offset_t skipLine();

    BPDF_DLL
    bpdf_offset_t getSize();

    bpdf_offset_t
    getLastOffset() const
    {
        return last_offset;
    }
    void
    setLastOffset(bpdf_offset_t offset)
    {
        last_offset = offset;
    }

  protected:
    bpdf_offset_t last_offset{0};
};

#endif // BPDF_INPUTSOURCE_HH
