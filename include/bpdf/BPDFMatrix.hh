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

#ifndef BPDFMATRIX_HH
#define BPDFMATRIX_HH

#include <bpdf/BPDFObjectHandle.hh>
#include <bpdf/DLL.h>

#include <string>

// This class represents a PDF transformation matrix using a tuple such that
//
//                      | a b 0 |
// (a, b, c, d, e, f) = | c d 0 |
//                      | e f 1 |
class BPDFMatrix
{
  public:
    BPDF_DLL
    BPDFMatrix();
    BPDF_DLL
    BPDFMatrix(double a, double b, double c, double d, double e, double f);
    // From a six-element array of numbers. Anything else gives the identity matrix.
    BPDF_DLL
    explicit BPDFMatrix(BPDFObjectHandle const& array);

    // Returns the six values separated by spaces as real numbers with trimmed zeroes.
    BPDF_DLL
    std::string unparse() const;

    // Replace this with other * this
    BPDF_DLL
    void concat(BPDFMatrix const& other);

    // Same as concat(sx, 0, 0, sy, 0, 0)
    BPDF_DLL
    void scale(double sx, double sy);

    // Same as concat(1, 0, 0, 1, tx, ty)
    BPDF_DLL
    void translate(double tx, double ty);

    // Any value other than 90, 180, or 270 is ignored
    BPDF_DLL
    void rotatex90(int angle);

    // Rotate counterclockwise by an arbitrary angle in degrees
    BPDF_DLL
    void rotate(double degrees);

    // Returns false and leaves result unchanged if the matrix is singular
    BPDF_DLL
    bool invert(BPDFMatrix& result) const;

    // Transform a point: [x y 1] * this
    BPDF_DLL
    void transform(double x, double y, double& xp, double& yp) const;

    // Return the smallest rectangle that contains the transformed corners of r
    BPDF_DLL
    BPDFObjectHandle::Rectangle transformRectangle(BPDFObjectHandle::Rectangle r) const;

    // operator== tests for exact equality
    BPDF_DLL
    bool operator==(BPDFMatrix const& rhs) const;
    BPDF_DLL
    bool
    operator!=(BPDFMatrix const& rhs) const
    {
        return !operator==(rhs);
    }

    double a;
    double b;
    double c;
    double d;
    double e;
    double f;
};

#endif // BPDFMATRIX_HH
