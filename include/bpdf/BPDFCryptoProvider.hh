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

#ifndef BPDFCRYPTOPROVIDER_HH
#define BPDFCRYPTOPROVIDER_HH

#include <bpdf/BPDFCryptoImpl.hh>
#include <bpdf/DLL.h>

#include <functional>
#include <memory>

// Factory for crypto implementations. By default, getImpl returns a new OpenSSL-backed
// implementation. A different factory may be installed with setFactory before any documents
// are processed; passing an empty function restores the default.

class BPDFCryptoProvider
{
  public:
    BPDF_DLL
    static std::shared_ptr<BPDFCryptoImpl> getImpl();

    BPDF_DLL
    static void setFactory(std::function<std::shared_ptr<BPDFCryptoImpl>()>);

  private:
    BPDFCryptoProvider() = delete;
};

#endif // BPDFCRYPTOPROVIDER_HH
