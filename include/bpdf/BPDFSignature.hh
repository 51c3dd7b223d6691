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

#ifndef BPDFSIGNATURE_HH
#define BPDFSIGNATURE_HH

#include <bpdf/DLL.h>

#include <string>
#include <vector>

class BPDF;

// Byte-range signatures with detached PKCS#7 (adbe.pkcs7.detached) using SHA-256.
//
// Signing is done in two phases. The document is first written with a signature dictionary
// whose /ByteRange and /Contents are fixed-width placeholders. Once the final layout is known,
// the byte ranges are patched into place and the signature over everything except the /Contents
// string is filled into the reserved space. Neither step changes the length of the file.
class BPDFSignature
{
  public:
    enum status_e { s_valid, s_invalid, s_no_signature };

    struct SignOptions
    {
        // Contents of a PKCS#12 file holding the private key and certificate
        std::string pkcs12;
        std::string pkcs12_password;
        std::string reason;
        std::string name;
        // Bytes reserved for the DER-encoded signature
        size_t reservation{4096};
    };

    struct Info
    {
        std::string field_name;
        std::string signer_name;
        std::string reason;
        std::string signing_time;
        status_e status{s_invalid};
        // Why the signature is invalid
        std::string message;
    };

    // Add a signature field to the first page of pdf and return the signed file. Throws BPDFExc
    // with bpdf_e_signature if the key can't be used or the reservation is too small, and with
    // bpdf_e_pages if the document has no pages.
    BPDF_DLL
    static std::string sign(BPDF& pdf, SignOptions const& options);

    // Check every signature field of the file. Nothing in the file is trusted: each signature is
    // recomputed over the byte ranges it declares, and the ranges must cover the whole file
    // except exactly the signature's /Contents string. The signer's certificate chain is not
    // validated. An encrypted file needs its password.
    BPDF_DLL
    static std::vector<Info> verify(std::string const& data, std::string const& password = "");

    // s_no_signature if there are none, s_invalid if any signature is invalid, else s_valid
    BPDF_DLL
    static status_e overallStatus(std::vector<Info> const&);
    BPDF_DLL
    static char const* statusName(status_e);
};

#endif // BPDFSIGNATURE_HH
