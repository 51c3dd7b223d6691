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

#ifndef BPDFWRITER_HH
#define BPDFWRITER_HH

#include <bpdf/Constants.h>
#include <bpdf/DLL.h>
#include <bpdf/Types.h>

#include <bpdf/BPDFObjGen.hh>
#include <bpdf/BPDFObjectHandle.hh>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class BPDF;
class Pipeline;

// This class implements a simple writer for saving BPDF objects to new PDF files. Objects
// reachable from the trailer are renumbered consecutively in the order in which they are first
// encountered and written with a classic cross-reference table. Unreferenced objects are not
// written.
//
// By default, streams that have no filters are compressed with /FlateDecode and all other
// stream data is written exactly as it appears in the input, decrypted if necessary. If the
// document has encryption parameters (because it was read from an encrypted file or because
// BPDF::setEncryption was called), every string and stream is encrypted with them.
class BPDFWriter
{
  public:
    // Layout of a signature dictionary written with setSignatureDictionary. Offsets are from the
    // beginning of the output. contents_offset is the position of the '<' of the /Contents hex
    // string and contents_length includes both delimiters.
    struct SignatureLayout
    {
        bpdf_offset_t byte_range_offset{0};
        size_t byte_range_length{0};
        bpdf_offset_t contents_offset{0};
        size_t contents_length{0};
    };

    // Passing a null filename or calling setOutputMemory is required before write() if no
    // filename is given here.
    BPDF_DLL
    BPDFWriter(BPDF& pdf);
    BPDF_DLL
    BPDFWriter(BPDF& pdf, char const* filename);
    BPDF_DLL
    ~BPDFWriter();

    BPDF_DLL
    void setOutputFilename(char const* filename);
    // Write to memory. The result is available with getOutputString after write() returns.
    BPDF_DLL
    void setOutputMemory();
    BPDF_DLL
    std::string getOutputString();
    // The pipeline is finished after the file is written.
    BPDF_DLL
    void setOutputPipeline(Pipeline*);

    // Compress streams that have no filters with /FlateDecode. Defaults to true.
    BPDF_DLL
    void setCompressStreams(bool);
    // Decode streams whose filters can be removed at the given level before writing them. With
    // compression on, decoded streams are recompressed with /FlateDecode. The default is
    // bpdf_dl_none, which preserves the original encoding.
    BPDF_DLL
    void setDecodeLevel(bpdf_stream_decode_level_e);
    // Flate compression level for newly compressed streams, -1 for zlib's default
    BPDF_DLL
    void setCompressionLevel(int);

    BPDF_DLL
    void setMinimumPDFVersion(std::string const&);

    // Use a fixed /ID and a fixed initialization vector for AES. For tests only.
    BPDF_DLL
    void setStaticID(bool);
    BPDF_DLL
    void setStaticAesIV(bool);

    // sig must be an indirect signature dictionary of the document. Its /ByteRange is written
    // as a fixed-width placeholder and its /Contents as a zero-filled hex string of
    // contents_bytes bytes, neither of them encrypted. The layout is available after write() so
    // that the signature can be filled in without changing any lengths.
    BPDF_DLL
    void setSignatureDictionary(BPDFObjectHandle sig, size_t contents_bytes);
    BPDF_DLL
    SignatureLayout getSignatureLayout() const;

    BPDF_DLL
    void write();

    // Width of each number in the /ByteRange placeholder
    static size_t const byte_range_digits = 10;

  private:
    BPDFWriter(BPDFWriter const&) = delete;
    BPDFWriter& operator=(BPDFWriter const&) = delete;

    void write(std::string_view);
    bpdf_offset_t getCount() const;
    void generateID();
    int enqueueObject(BPDFObjectHandle object);
    std::string unparseChild(BPDFObjectHandle child, int objid, bool encrypt_strings);
    std::string encrypt(std::string const& data, int objid, bool is_stream);
    void writeObject(BPDFObjectHandle object, int objid);
    void writeStream(BPDFObjectHandle stream, int objid);
    void writeDictionary(BPDFObjectHandle dict, int objid, bool is_signature);
    void writeEncryptionDictionary();
    void writeTrailer();
    void writeXRefTable();
    std::string getFinalVersion();

    class Members;
    std::unique_ptr<Members> m;
};

#endif // BPDFWRITER_HH
