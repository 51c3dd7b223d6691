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

#ifndef BPDFTESSERACTRECOGNIZER_HH
#define BPDFTESSERACTRECOGNIZER_HH

#include <bpdf/BPDFOCRBridge.hh>

#include <string>

// Recognizer backed by tesseract. This class is only available when bpdf is built with
// BPDF_WITH_TESSERACT. Every call uses its own tesseract instance, so one recognizer may be
// shared by several workers.
class BPDF_DLL_CLASS BPDFTesseractRecognizer: public BPDFOCRRecognizer
{
  public:
    // tessdata_path is the directory containing the trained data files. If empty, tesseract
    // uses TESSDATA_PREFIX or its built-in default.
    BPDF_DLL
    BPDFTesseractRecognizer(std::string const& tessdata_path = "");
    BPDF_DLL
    ~BPDFTesseractRecognizer() override = default;

    // Returns one span per recognized word. Throws BPDFExc with bpdf_e_ocr_unavailable if
    // tesseract can't be initialized for the language.
    BPDF_DLL
    std::vector<BPDFOCRSpan>
    recognize(BPDFPixmap const& image, std::string const& language, int dpi) override;

  private:
    std::string tessdata_path;
};

#endif // BPDFTESSERACTRECOGNIZER_HH
