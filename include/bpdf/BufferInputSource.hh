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

#ifndef BUFFERINPUTSOURCE_HH
#define BUFFERINPUTSOURCE_HH

#include <bpdf/InputSource.hh>

// Reads from an in-memory copy of a document or of a decoded object stream
class BPDF_DLL_CLASS BufferInputSource: public InputSource
{
  public:
    BPDF_DLL
    BufferInputSource(std::string description, std::string contents);

    BPDF_DLL
    std::string const& getName() const override;
    BPDF_DLL
    bpdf_offset_t tell() override;
    BPDF_DLL
    void seek(bpdf_offset_t offset, int whence) override;
    BPDF_DLL
    size_t read(char* buffer, size_t length) override;
    BPDF_DLL
    void unreadCh(char ch) override;

    using InputSource::read;

  private:
    size_t remaining() const;

    std::string description;
    std::string contents;
    bpdf_offset_t pos{0};
};

#endif // BUFFERINPUTSOURCE_HH
