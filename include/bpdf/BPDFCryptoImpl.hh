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

#ifndef BPDFCRYPTOIMPL_HH
#define BPDFCRYPTOIMPL_HH

#include <bpdf/DLL.h>

#include <string>

// Cryptographic primitives needed by the standard security handler. BPDFCryptoProvider creates
// instances; the built-in one is backed by OpenSSL. An instance holds one hash and one cipher
// context and is used by one thread at a time.
class BPDF_DLL_CLASS BPDFCryptoImpl
{
  public:
    enum hash_e { h_md5, h_sha256, h_sha384, h_sha512 };
    enum cipher_e { c_rc4, c_aes_cbc };

    BPDF_DLL
    BPDFCryptoImpl() = default;
    BPDF_DLL
    virtual ~BPDFCryptoImpl() = default;

    BPDF_DLL
    virtual void provideRandomData(unsigned char* data, size_t len) = 0;

    // hashFinish returns the raw digest. Another hash may be started afterwards.
    BPDF_DLL
    virtual void hashStart(hash_e) = 0;
    BPDF_DLL
    virtual void hashUpdate(unsigned char const* data, size_t len) = 0;
    BPDF_DLL
    virtual std::string hashFinish() = 0;

    // RC4 keys may be 1 to 256 bytes long. AES keys are 16 or 32 bytes with a 16-byte iv; no
    // padding is added or removed, so AES input must be a whole number of 16-byte blocks. out may
    // be the same as in.
    BPDF_DLL
    virtual void
    cipherStart(cipher_e, bool encrypt, std::string const& key, std::string const& iv) = 0;
    BPDF_DLL
    virtual void cipherUpdate(unsigned char const* in, size_t len, unsigned char* out) = 0;
};

#endif // BPDFCRYPTOIMPL_HH
