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

#ifndef BPDFUSAGE_HH
#define BPDFUSAGE_HH

#include <bpdf/DLL.h>

#include <stdexcept>
#include <string>

// Thrown for errors in how a command line or batch file is written
class BPDF_DLL_CLASS BPDFUsage: public std::runtime_error
{
  public:
    BPDF_DLL
    BPDFUsage(std::string const& msg);
};

#endif // BPDFUSAGE_HH
