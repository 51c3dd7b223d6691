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

#ifndef BPDFPAGEOBJECTHELPER_HH
#define BPDFPAGEOBJECTHELPER_HH

#include <bpdf/BPDFObjectHelper.hh>

#include <bpdf/BPDFMatrix.hh>
#include <bpdf/DLL.h>

#include <map>
#include <string>
#include <vector>

class BPDFPageObjectHelper: public BPDFObjectHelper
{
  public:
    // An image drawn by the page's content. matrix maps the unit square onto the image's
    // position in default user space.
    struct ImagePlacement
    {
        std::string name;
        BPDFObjectHandle image;
        BPDFMatrix matrix;
    };

    BPDF_DLL
    BPDFPageObjectHelper(BPDFObjectHandle);
    BPDF_DLL
    ~BPDFPageObjectHelper() override = default;

    // Return the page's value for name. /MediaBox, /CropBox, /Resources and /Rotate are looked
    // up through /Parent if the page doesn't have them.
    BPDF_DLL
    BPDFObjectHandle getAttribute(std::string const& name) const;

    // Page boxes. A missing or invalid MediaBox is US Letter; a missing CropBox is the MediaBox.
    BPDF_DLL
    BPDFObjectHandle::Rectangle getMediaBox() const;
    BPDF_DLL
    BPDFObjectHandle::Rectangle getCropBox() const;

    // Rotation in degrees, one of 0, 90, 180 or 270. Values that are not multiples of 90 are
    // treated as 0.
    BPDF_DLL
    int getRotation() const;
    // Set the rotation to angle or, with relative, add angle to the current rotation. angle must
    // be a multiple of 90, otherwise BPDFExc with bpdf_e_invalid_angle is thrown.
    BPDF_DLL
    void rotatePage(int angle, bool relative);

    // Return the page's resource dictionary, creating an empty one if there is none. The result
    // belongs to this page only; a shared resource dictionary is copied first.
    BPDF_DLL
    BPDFObjectHandle getResources();
    // Add resource to the /type subdictionary of the page's resources under a name that starts
    // with prefix and is not used by any other resource of the page. Returns the name without
    // the leading slash.
    BPDF_DLL
    std::string addResource(
        std::string const& type, std::string const& prefix, BPDFObjectHandle resource);

    // Image XObjects of the page by resource name
    BPDF_DLL
    std::map<std::string, BPDFObjectHandle> getImages() const;

    // Images drawn directly by the page's content streams, in drawing order. Images drawn by
    // form XObjects are not included.
    BPDF_DLL
    std::vector<ImagePlacement> getImagePlacements() const;

    BPDF_DLL
    std::vector<BPDFObjectHandle> getPageContents() const;
    BPDF_DLL
    void addPageContents(BPDFObjectHandle contents, bool first);
    // Return the page's content streams, decoded and joined by newlines
    BPDF_DLL
    std::string getContentsData() const;
    BPDF_DLL
    void parseContents(BPDFObjectHandle::ParserCallbacks* callbacks) const;

    // Add content as a new content stream. The page's existing content is first bracketed by q
    // and Q so that its graphics state can't leak into the new content. With under, the new
    // content is drawn before the existing content, otherwise after it.
    BPDF_DLL
    void addContentFragment(std::string const& content, bool under);

    // Return a new indirect page that is a shallow copy of this one
    BPDF_DLL
    BPDFPageObjectHelper shallowCopyPage() const;
};

#endif // BPDFPAGEOBJECTHELPER_HH
