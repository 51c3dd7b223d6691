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

#ifndef BPDFOBJECTHELPER_HH
#define BPDFOBJECTHELPER_HH

#include <bpdf/DLL.h>

#include <bpdf/BPDFObjectHandle.hh>

// This is a base class for object helpers, which provide a higher-level API for specific kinds of
// objects. A helper is always initialized with a BPDFObjectHandle, and the underlying handle can
// always be retrieved, so helpers and direct object manipulation can be freely mixed.
class BPDFObjectHelper
{
  public:
    BPDF_DLL
    BPDFObjectHelper(BPDFObjectHandle oh) :
        oh(oh)
    {
    }
    BPDF_DLL
    virtual ~BPDFObjectHelper() = default;
    BPDF_DLL
    BPDFObjectHandle
    getObjectHandle() const
    {
        return oh;
    }

  protected:
    BPDFObjectHandle oh;
};

#endif // BPDFOBJECTHELPER_HH
