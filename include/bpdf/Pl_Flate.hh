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

#ifndef PL_FLATE_HH
#define PL_FLATE_HH

#include <bpdf/Pipeline.hh>

#include <memory>

// zlib (FlateDecode) compression and decompression. Inflating accepts the damage other PDF readers
// accept: a bad Adler-32 checksum and data that stops before the final block.
class BPDF_DLL_CLASS Pl_Flate: public Pipeline
{
  public:
    enum action_e { a_inflate, a_deflate };

    // level is 1 (fastest) through 9 (smallest), or -1 for zlib's default. It is ignored when
    // inflating.
    BPDF_DLL
    Pl_Flate(char const* identifier, Pipeline* next, action_e action, int level = -1);
    BPDF_DLL
    ~Pl_Flate() override;

    BPDF_DLL
    void write(unsigned char const* data, size_t len) override;
    BPDF_DLL
    void finish() override;

  private:
    void start();
    void run(int flush);
    int end();
    void check(char const* where, int code);

    struct Stream;
    std::unique_ptr<Stream> stream;
    action_e action;
    int level;
    bool started{false};
    bool finished{false};
};

#endif // PL_FLATE_HH
