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

#ifndef FILEINPUTSOURCE_HH
#define FILEINPUTSOURCE_HH

#include <bpdf/InputSource.hh>

// Reads a file on disk through stdio. The file stays open for the life of the object.
class BPDF_DLL_CLASS FileInputSource: public InputSource
{
  public:
    BPDF_DLL
    explicit FileInputSource(std::string const& filename);
    BPDF_DLL
    ~FileInputSource() override;

    FileInputSource(FileInputSource const&) = delete;
    FileInputSource& operator=(FileInputSource const&) = delete;

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
    std::string filename;
    FILE* file;
};

#endif // FILEINPUTSOURCE_HH
