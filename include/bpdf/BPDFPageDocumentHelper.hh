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

#ifndef BPDFPAGEDOCUMENTHELPER_HH
#define BPDFPAGEDOCUMENTHELPER_HH

#include <bpdf/BPDFPageObjectHelper.hh>

#include <bpdf/DLL.h>

#include <vector>

class BPDF;

// Page-level operations on a whole document. The underlying page tree is managed by BPDF; this
// class wraps the results in page helpers.
class BPDFPageDocumentHelper
{
  public:
    BPDF_DLL
    BPDFPageDocumentHelper(BPDF&);
    BPDF_DLL
    virtual ~BPDFPageDocumentHelper() = default;

    BPDF_DLL
    std::vector<BPDFPageObjectHelper> getAllPages();
    BPDF_DLL
    int getPageCount();
    // index is from zero; throws BPDFExc with bpdf_e_invalid_range if out of range
    BPDF_DLL
    BPDFPageObjectHelper getPage(int index);

    // Add a page at the beginning or end. A page from another document is copied.
    BPDF_DLL
    void addPage(BPDFPageObjectHelper newpage, bool first);
    BPDF_DLL
    void addPageAt(BPDFPageObjectHelper newpage, bool before, BPDFPageObjectHelper refpage);
    BPDF_DLL
    void removePage(BPDFPageObjectHelper page);
    // Replace the page at index with newpage
    BPDF_DLL
    void replacePage(int index, BPDFPageObjectHelper newpage);

    // Return the pages selected by a numeric range such as "1-3,5,r1" as zero-based indices.
    // An empty range selects every page. Throws BPDFExc with bpdf_e_invalid_range for syntax
    // errors or pages that don't exist.
    BPDF_DLL
    std::vector<int> selectPages(std::string const& range);

  private:
    BPDF& pdf;
};

#endif // BPDFPAGEDOCUMENTHELPER_HH
