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

#ifndef PL_COUNT_HH
#define PL_COUNT_HH

#include <bpdf/Pipeline.hh>
#include <bpdf/Types.h>

// Passes data through and keeps the number of bytes seen. BPDFWriter uses the count as the file
// offset of whatever it writes next.
class BPDF_DLL_CLASS Pl_Count: public Pipeline
{
  public:
    BPDF_DLL
    Pl_Count(char const* identifier, Pipeline* next);

    BPDF_DLL
    void write(unsigned char const*, size_t) override;
    BPDF_DLL
    void finish() override;

    bpdf_offset_t
    getCount() const
    {
        return count;
    }

  private:
    bpdf_offset_t count{0};
};

#endif // PL_COUNT_HH
