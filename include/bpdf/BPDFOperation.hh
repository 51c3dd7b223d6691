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

#ifndef BPDFOPERATION_HH
#define BPDFOPERATION_HH

#include <bpdf/Constants.h>
#include <bpdf/DLL.h>

#include <bpdf/BPDFEngineConfig.hh>

#include <map>
#include <memory>
#include <string>
#include <vector>

class BPDF;

// An operation transforms one or more input documents into output documents and artifacts.
// Operations are created by tag with BPDFOperation::create. Each operation publishes a schema of
// named parameters; validate() checks raw string values against the schema and fills in
// defaults, so parameter errors are reported before any file is read.
class BPDF_DLL_CLASS BPDFOperation
{
  public:
    enum param_type_e {
        pt_string,
        pt_integer,
        pt_number,
        pt_boolean,
        pt_choice,
        // A page range such as "1-3,5,r1"; empty means all pages
        pt_pages,
        pt_path,
        // Comma-separated list of strings
        pt_list,
    };

    struct ParameterSpec
    {
        std::string name;
        param_type_e type{pt_string};
        std::string default_value;
        // Allowed values for pt_choice
        std::vector<std::string> choices;
        bool required{false};
        std::string help;
    };

    // Parameter values that have passed validation. Accessors throw std::logic_error for names
    // that are not in the values; optional parameters with no default are absent unless given.
    class BPDF_DLL_CLASS Parameters
    {
      public:
        BPDF_DLL
        bool has(std::string const& name) const;
        BPDF_DLL
        std::string const& getString(std::string const& name) const;
        BPDF_DLL
        long long getInteger(std::string const& name) const;
        BPDF_DLL
        double getNumber(std::string const& name) const;
        BPDF_DLL
        bool getBoolean(std::string const& name) const;
        BPDF_DLL
        std::vector<std::string> getList(std::string const& name) const;
        BPDF_DLL
        void set(std::string const& name, std::string const& value);
        BPDF_DLL
        std::map<std::string, std::string> const& getAll() const;

      private:
        std::map<std::string, std::string> values;
    };

    struct Input
    {
        std::string filename;
        std::shared_ptr<BPDF> pdf;
        // The bytes the document was read from
        std::string data;
    };

    // A document to write or, when pdf is null, an already serialized file
    struct Output
    {
        std::shared_ptr<BPDF> pdf;
        std::string data;
        bpdf_stream_decode_level_e decode_level{bpdf_dl_none};
        int compression_level{-1};
    };

    // Non-PDF result. suffix is appended to the stem of the job's output path, for example
    // ".txt" or "-3.jpg".
    struct Artifact
    {
        std::string suffix;
        std::string data;
    };

    struct Result
    {
        std::vector<Output> outputs;
        std::vector<Artifact> artifacts;
        std::vector<std::string> warnings;
    };

    BPDF_DLL
    static std::unique_ptr<BPDFOperation> create(bpdf_operation_e, BPDFEngineConfig const&);
    BPDF_DLL
    static char const* getOperationName(bpdf_operation_e);
    BPDF_DLL
    static bool parseOperationName(std::string const& name, bpdf_operation_e& op);
    BPDF_DLL
    static std::vector<bpdf_operation_e> getAllOperations();

    BPDF_DLL
    virtual ~BPDFOperation() = default;

    BPDF_DLL
    bpdf_operation_e getType() const;
    BPDF_DLL
    char const* getName() const;
    BPDF_DLL
    virtual std::string getDescription() const = 0;
    BPDF_DLL
    virtual std::vector<ParameterSpec> getParameterSpecs() const = 0;

    // Number of input documents accepted; a negative maximum means no limit
    BPDF_DLL
    virtual int getMinInputs() const;
    BPDF_DLL
    virtual int getMaxInputs() const;

    // True if running the operation with these parameters calls the OCR recognizer
    BPDF_DLL
    virtual bool usesOCR(Parameters const&) const;
    // Password to open inputs with
    BPDF_DLL
    virtual std::string getInputPassword(Parameters const&) const;
    // Decode input.data into input.pdf. The default opens the data with getInputPassword and
    // the configured logger; errors propagate as BPDFExc.
    BPDF_DLL
    virtual void openInput(Input& input, Parameters const& params) const;

    // Check values against the schema and add defaults. Unknown names, values of the wrong
    // type, choices outside the allowed set and missing required parameters throw BPDFExc with
    // bpdf_e_invalid_parameter.
    BPDF_DLL
    Parameters validate(std::map<std::string, std::string> const& values) const;
    // Throws BPDFExc with bpdf_e_empty_input or bpdf_e_invalid_parameter
    BPDF_DLL
    void checkInputCount(size_t count) const;

    BPDF_DLL
    virtual Result apply(std::vector<Input>& inputs, Parameters const& params) = 0;

    // Serialize an output to a PDF file in memory
    BPDF_DLL
    static std::string writeOutput(Output const&);

  protected:
    BPDF_DLL
    BPDFOperation(bpdf_operation_e type, BPDFEngineConfig const& config);

    BPDFEngineConfig config;

  private:
    BPDFOperation(BPDFOperation const&) = delete;
    BPDFOperation& operator=(BPDFOperation const&) = delete;

    bpdf_operation_e type;
};

#endif // BPDFOPERATION_HH
