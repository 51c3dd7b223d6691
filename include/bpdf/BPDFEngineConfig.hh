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

#ifndef BPDFENGINECONFIG_HH
#define BPDFENGINECONFIG_HH

#include <bpdf/DLL.h>

#include <memory>
#include <string>

class BPDFLogger;
class BPDFOCRRecognizer;
class BPDFPageRasterizer;

// Engine settings. A copy is handed to every operation and to the batch processor; nothing in
// the library reads settings from anywhere else. Front ends fill this in from their own
// configuration.
struct BPDFEngineConfig
{
    enum quality_e { q_low, q_medium, q_high };

    // Directory for outputs whose path is not given explicitly
    std::string output_dir{"."};
    // Default tier for the compress operation
    quality_e quality{q_medium};
    std::string ocr_language{"eng"};
    int ocr_dpi{300};
    // Worker caps. max_jobs <= 0 means the number of hardware threads.
    int max_jobs{0};
    int max_ocr_jobs{1};
    // Replace existing output files instead of choosing a new name
    bool overwrite{false};
    // Password used to open encrypted inputs
    std::string password;

    // A null logger means BPDFLogger::defaultLogger()
    std::shared_ptr<BPDFLogger> logger;
    // Needed by the ocr operation and by extract-text with ocr=true
    std::shared_ptr<BPDFOCRRecognizer> recognizer;
    // A null rasterizer means BPDFDefaultRasterizer
    std::shared_ptr<BPDFPageRasterizer> rasterizer;

    BPDF_DLL
    static char const* qualityName(quality_e);
    // Returns false if name is not low, medium or high
    BPDF_DLL
    static bool parseQuality(std::string const& name, quality_e& quality);

    BPDF_DLL
    std::shared_ptr<BPDFLogger> getLogger() const;
};

#endif // BPDFENGINECONFIG_HH
