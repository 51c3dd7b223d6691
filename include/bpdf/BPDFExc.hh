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

#ifndef BPDFEXC_HH
#define BPDFEXC_HH

#include <bpdf/Constants.h>
#include <bpdf/DLL.h>
#include <bpdf/Types.h>

#include <stdexcept>
#include <string>

// Errors from reading, operating on or writing documents. what() combines the location and the
// message as "file (object, offset N): message", leaving out parts that are empty. An offset of
// zero or less means no offset is known.
class BPDF_DLL_CLASS BPDFExc: public std::runtime_error
{
  public:
    BPDF_DLL
    BPDFExc(
        bpdf_error_code_e error_code,
        std::string const& filename,
        std::string const& object,
        bpdf_offset_t offset,
        std::string const& message);

    BPDF_DLL
    bpdf_error_code_e getErrorCode() const;
    BPDF_DLL
    std::string const& getFilename() const;
    // The message without the location prefix
    BPDF_DLL
    std::string const& getMessageDetail() const;

    // Stable name of an error code such as "MalformedDocument" or "IoFailure", used in batch
    // reports.
    BPDF_DLL
    static char const* kindName(bpdf_error_code_e);

  private:
    bpdf_error_code_e error_code;
    std::string filename;
    std::string detail;
};

#endif // BPDFEXC_HH
