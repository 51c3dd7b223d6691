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

#ifndef BPDF_HH
#define BPDF_HH

#include <bpdf/Constants.h>
#include <bpdf/DLL.h>
#include <bpdf/Types.h>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFObjGen.hh>
#include <bpdf/BPDFObjectHandle.hh>
#include <bpdf/InputSource.hh>

#include <cstdio>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class BPDFLogger;
class BPDFObject;
class BPDFObjTable;
class BPDFParser;
class BPDFSecurityHandler;
class BPDFWriter;
class Pipeline;

// A BPDF object is one PDF document. It is created empty and then populated by one of the
// process methods or by emptyPDF(). A document is not thread-safe; separate documents may be used
// on separate threads.
class BPDF
{
  public:
    BPDF_DLL
    static std::string const& BPDFVersion();

    BPDF_DLL
    BPDF();
    BPDF_DLL
    ~BPDF();

    BPDF_DLL
    static std::shared_ptr<BPDF> create();

    // Associate a file with the object and read its cross-reference data. Objects are read and
    // parsed lazily. An encrypted file is opened with the given password, which may be either the
    // user or the owner password; if it matches neither, BPDFExc with bpdf_e_password is thrown
    // before any object is returned. A missing password is treated as the empty string.
    BPDF_DLL
    void processFile(char const* filename, char const* password = nullptr);
    BPDF_DLL
    void processMemoryFile(
        char const* description, std::string data, char const* password = nullptr);
    BPDF_DLL
    void processInputSource(std::shared_ptr<InputSource>, char const* password = nullptr);

    // Create a document with one empty /Pages tree and no pages.
    BPDF_DLL
    void emptyPDF();

    BPDF_DLL
    std::shared_ptr<BPDFLogger> getLogger();
    BPDF_DLL
    void setLogger(std::shared_ptr<BPDFLogger>);

    // Don't write warnings to the logger. Warnings are still collected.
    BPDF_DLL
    void setSuppressWarnings(bool);

    // By default, a damaged cross-reference table is recovered by scanning the whole file for
    // objects. With attempt_recovery false, the damage is an error instead.
    BPDF_DLL
    void setAttemptRecovery(bool);

    // Ignore the cross-reference data entirely and always locate objects by scanning the file.
    // Must be called before processing the file.
    BPDF_DLL
    void setForceReconstruct(bool);

    // True if objects were located by scanning rather than through cross-reference data
    BPDF_DLL
    bool wasReconstructed() const;

    // Return the warnings issued so far and clear the list.
    BPDF_DLL
    std::vector<BPDFExc> getWarnings();
    BPDF_DLL
    bool anyWarnings() const;
    BPDF_DLL
    size_t numWarnings() const;

    BPDF_DLL
    void warn(BPDFExc const& e);
    // Same as above but creates the BPDFExc object using the arguments passed to warn. The
    // filename is taken from the document.
    BPDF_DLL
    void warn(
        bpdf_error_code_e error_code,
        std::string const& object,
        bpdf_offset_t offset,
        std::string const& message);

    BPDF_DLL
    std::string getFilename() const;
    BPDF_DLL
    std::string getPDFVersion() const;
    // Raise the version to at least the given version.
    BPDF_DLL
    void requirePDFVersion(std::string const& version);
    BPDF_DLL
    BPDFObjectHandle getTrailer();
    BPDF_DLL
    BPDFObjectHandle getRoot();

    // Return the document information dictionary, creating an indirect one if there is none.
    BPDF_DLL
    BPDFObjectHandle getInfo(bool create = false);

    // Object table access

    // Make the given object indirect in this document and return an indirect handle to it. If
    // the object is already indirect in this document, it is returned unchanged.
    BPDF_DLL
    BPDFObjectHandle makeIndirectObject(BPDFObjectHandle);
    BPDF_DLL
    BPDFObjectHandle newStream(std::string const& data = "");
    // Reserve an object number. The object is a placeholder until replaced with replaceObject.
    BPDF_DLL
    BPDFObjectHandle newReserved();
    BPDF_DLL
    BPDFObjectHandle getObject(BPDFObjGen);
    BPDF_DLL
    BPDFObjectHandle getObject(int objid, int generation);
    // Replace the object with the given number and generation. The replacement must be a direct
    // object.
    BPDF_DLL
    void replaceObject(BPDFObjGen og, BPDFObjectHandle);

    // Number of objects in the table, counting those not yet parsed
    BPDF_DLL
    size_t getObjectCount();
    // Resolve and return every object in the document
    BPDF_DLL
    std::vector<BPDFObjectHandle> getAllObjects();

    // Copy an object from another document into this one. All objects reachable from foreign
    // are copied with new object numbers and references are rewritten. A page's /Parent is not
    // followed. Objects copied once from a given document are reused by later calls. foreign
    // must be indirect; direct objects can be copied by copying their indirect container.
    BPDF_DLL
    BPDFObjectHandle copyForeignObject(BPDFObjectHandle foreign);

    // Encryption support. Documents are encrypted with the standard security handler.

    BPDF_DLL
    bool isEncrypted() const;
    BPDF_DLL
    bool isEncrypted(int& R, int& P) const;
    BPDF_DLL
    bool ownerPasswordMatched() const;
    BPDF_DLL
    bool userPasswordMatched() const;

    // Install new encryption. Output written from this document is encrypted with these
    // parameters. R is 3 (RC4, 128 bits), 4 (AES-128) or 6 (AES-256); other values throw
    // std::logic_error. A new /ID is generated if the document has none.
    BPDF_DLL
    void setEncryption(
        std::string const& user_password, std::string const& owner_password, int R, int P);
    // Remove encryption. All data already read stays decrypted and output is written in the
    // clear.
    BPDF_DLL
    void removeEncryption();

    // Page support. The page tree is flattened on first use so that the root /Pages node lists
    // every page directly and inheritable attributes are pushed down to the pages.

    BPDF_DLL
    std::vector<BPDFObjectHandle> const& getAllPages();
    // Throws BPDFExc with bpdf_e_pages if page is not in the document
    BPDF_DLL
    int findPage(BPDFObjectHandle const& page);
    BPDF_DLL
    void updateAllPagesCache();
    BPDF_DLL
    void addPage(BPDFObjectHandle newpage, bool first);
    BPDF_DLL
    void addPageAt(BPDFObjectHandle newpage, bool before, BPDFObjectHandle refpage);
    BPDF_DLL
    void removePage(BPDFObjectHandle page);
    // Replace the page list with pages, which must already belong to this document.
    BPDF_DLL
    void setPages(std::vector<BPDFObjectHandle> const& pages);

    // Stream data access used by BPDFObjectHandle. Return the encoded data of the stream stored
    // in the input at offset, decrypted if necessary.
    std::string readRawStreamData(
        BPDFObjGen og, BPDFObjectHandle stream_dict, bpdf_offset_t offset, size_t length);

  private:
    friend class BPDFObjectHandle;
    friend class BPDFParser;
    friend class BPDFWriter;

    class Members;
    class StringDecrypter;

    BPDF(BPDF const&) = delete;
    BPDF& operator=(BPDF const&) = delete;

    // Resolve an object through the table, parsing it if necessary
    std::shared_ptr<BPDFObject> resolve(BPDFObjGen og);
    std::shared_ptr<BPDFObjTable> getTable() const;
    BPDFObjectHandle newIndirect(BPDFObjGen og, std::shared_ptr<BPDFObject> const& obj);
    BPDFObjGen nextObjGen();

    // Copying foreign objects
    void reserveForeignObjects(
        BPDFObjectHandle foreign,
        std::map<BPDFObjGen, BPDFObjectHandle>& object_map,
        std::vector<BPDFObjectHandle>& to_copy,
        BPDFObjGen::set& visiting,
        bool top);
    BPDFObjectHandle replaceForeignIndirectObjects(
        BPDFObjectHandle foreign, std::map<BPDFObjGen, BPDFObjectHandle>& object_map, bool top);

    // Reading
    void parse(char const* password);
    void checkHeader();
    void setTrailer(BPDFObjectHandle obj);
    void read_xref(bpdf_offset_t xref_offset);
    bool parse_xrefFirst(std::string const& line, int& obj, int& num, int& bytes);
    bool read_xrefEntry(bpdf_offset_t& f1, int& f2, char& type);
    bpdf_offset_t read_xrefTable(bpdf_offset_t offset);
    bpdf_offset_t read_xrefStream(bpdf_offset_t offset);
    bpdf_offset_t processXRefStream(bpdf_offset_t offset, BPDFObjectHandle& xref_stream);
    void insertXrefEntry(int obj, int f0, bpdf_offset_t f1, int f2);
    void insertFreeXrefEntry(BPDFObjGen);
    void reconstruct_xref();
    void registerPendingObjectStreams();
    std::shared_ptr<BPDFObject>
    readObjectAtOffset(bpdf_offset_t offset, std::string const& description, BPDFObjGen exp_og);
    std::shared_ptr<BPDFObject> readObject(std::string const& description, BPDFObjGen og);
    size_t recoverStreamLength(bpdf_offset_t stream_offset, BPDFObjGen og);
    void resolveObjectsInStream(int obj_stream_number);
    BPDFExc damagedPDF(
        std::string const& object, bpdf_offset_t offset, std::string const& message);
    BPDFExc damagedPDF(std::string const& object, std::string const& message);
    BPDFExc damagedPDF(bpdf_offset_t offset, std::string const& message);
    BPDFExc damagedPDF(std::string const& message);

    // Encryption
    // The handler output is encrypted with, or nullptr
    BPDFSecurityHandler const* getSecurityHandler() const;
    void initializeEncryption();
    void decryptString(std::string&, BPDFObjGen og);
    void decryptStream(std::string& data, BPDFObjGen og, BPDFObjectHandle stream_dict);

    // Pages
    void flattenPagesTree();
    void getAllPagesInternal(
        BPDFObjectHandle cur_pages,
        BPDFObjGen::set& visited,
        BPDFObjGen::set& seen,
        std::map<std::string, BPDFObjectHandle> inherited);
    void insertPage(BPDFObjectHandle newpage, int pos);

    std::unique_ptr<Members> m;
};

#endif // BPDF_HH
