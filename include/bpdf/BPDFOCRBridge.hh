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

#ifndef BPDFOCRBRIDGE_HH
#define BPDFOCRBRIDGE_HH

#include <bpdf/DLL.h>

#include <bpdf/BPDFPageObjectHelper.hh>
#include <bpdf/BPDFPixmap.hh>

#include <memory>
#include <string>
#include <vector>

class BPDF;

// A piece of recognized text. The bounding box is in pixels of the recognized image with the
// origin at its top left corner. confidence runs from 0 to 100.
struct BPDFOCRSpan
{
    std::string text;
    int x{0};
    int y{0};
    int width{0};
    int height{0};
    double confidence{0.0};
};

// Text recognition engine. The batch processor may call recognize from several OCR workers at
// once, so implementations must not share mutable state between calls.
class BPDF_DLL_CLASS BPDFOCRRecognizer
{
  public:
    BPDF_DLL
    virtual ~BPDFOCRRecognizer() = default;

    // language is a recognizer-specific language code such as "eng" or "eng+deu". dpi is the
    // resolution the image was produced at.
    virtual std::vector<BPDFOCRSpan>
    recognize(BPDFPixmap const& image, std::string const& language, int dpi) = 0;
};

// Produces an image of a page as it is displayed: the crop box with /Rotate applied, top row
// first, at dpi pixels per inch.
class BPDF_DLL_CLASS BPDFPageRasterizer
{
  public:
    BPDF_DLL
    virtual ~BPDFPageRasterizer() = default;

    // Return false with a reason if the page can't be rasterized
    virtual bool rasterize(
        BPDFPageObjectHelper const& page, int dpi, BPDFPixmap& result, std::string& reason) = 0;
};

// Rasterizer for scanned pages. It draws the largest image the page's content places onto a
// white gray-scale canvas and ignores everything else on the page, which is enough for pages
// that are a single scan. Pages with no image it can decode are rejected.
class BPDF_DLL_CLASS BPDFDefaultRasterizer: public BPDFPageRasterizer
{
  public:
    BPDF_DLL
    ~BPDFDefaultRasterizer() override = default;
    BPDF_DLL
    bool rasterize(
        BPDFPageObjectHelper const& page,
        int dpi,
        BPDFPixmap& result,
        std::string& reason) override;

    // Pages larger than this many pixels in either direction are rejected
    static int const max_dimension = 20000;
};

// Adds invisible text layers to pages that have little or no text. Each page that gets a layer
// is marked in /PieceInfo, and marked pages are never processed again.
class BPDFOCRBridge
{
  public:
    struct Options
    {
        std::string language{"eng"};
        int dpi{300};
        // Pages with at least this many text-showing operators are left alone
        int min_text_runs{1};
        // Recognized spans below this confidence are dropped
        double min_confidence{0.0};
    };

    // A null rasterizer means BPDFDefaultRasterizer. A null recognizer is allowed here but
    // makes process throw.
    BPDF_DLL
    BPDFOCRBridge(
        std::shared_ptr<BPDFOCRRecognizer> recognizer,
        std::shared_ptr<BPDFPageRasterizer> rasterizer);

    // Add text layers to the given pages, or to all pages if pages is empty. Pages that can't be
    // rasterized are described in warnings and left unchanged. Returns the number of pages that
    // received a text layer. Throws BPDFExc with bpdf_e_ocr_unavailable if there is no
    // recognizer.
    BPDF_DLL
    int process(
        BPDF& pdf,
        Options const& options,
        std::vector<std::string>& warnings,
        std::vector<int> const& pages = {});

    // True if the page has been through process()
    BPDF_DLL
    static bool hasTextLayer(BPDFPageObjectHelper const& page);

  private:
    void addTextLayer(
        BPDFPageObjectHelper& page,
        BPDFPixmap const& image,
        std::vector<BPDFOCRSpan> const& spans,
        Options const& options);
    static void markPage(BPDFPageObjectHelper& page);

    std::shared_ptr<BPDFOCRRecognizer> recognizer;
    std::shared_ptr<BPDFPageRasterizer> rasterizer;
};

#endif // BPDFOCRBRIDGE_HH
