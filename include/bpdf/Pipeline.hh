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

// A Pipeline is one stage of a byte-stream filter chain. By convention, subclasses are called
// Pl_Something. A stage created with a next pipeline passes its output on to it; the caller owns
// every stage in a chain and must keep each one alive while the chain is in use.
//
// finish() must be called before a pipeline is destroyed or buffered output is lost. Destructors
// don't throw, whether or not finish() was called.

#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <bpdf/DLL.h>

#include <string>
#include <string_view>

class BPDF_DLL_CLASS Pipeline
{
  public:
    BPDF_DLL
    Pipeline(char const* identifier, Pipeline* next);

    BPDF_DLL
    virtual ~Pipeline() = default;

    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;

    // Filters implement write and finish and forward to next()->write and next()->finish.
    BPDF_DLL
    virtual void write(unsigned char const* data, size_t len) = 0;
    BPDF_DLL
    virtual void finish() = 0;

    BPDF_DLL
    void write(char const* data, size_t len);
    BPDF_DLL
    void writeString(std::string_view);

    std::string const&
    getIdentifier() const
    {
        return identifier;
    }

  protected:
    Pipeline*
    next() const
    {
        return next_;
    }

    std::string identifier;

  private:
    Pipeline* next_;
};

#endif // PIPELINE_HH
