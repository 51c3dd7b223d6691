#ifndef BPDFOPERATION_PRIVATE_HH
#define BPDFOPERATION_PRIVATE_HH

#include <bpdf/BPDFOperation.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFMatrix.hh>
#include <bpdf/BPDFPageObjectHelper.hh>

#include <memory>
#include <string>
#include <vector>

// Factories for the operation implementations
std::unique_ptr<BPDFOperation> bpdf_make_merge(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_split(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_rotate(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_reorder(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_compress(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_encrypt(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_decrypt(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_sign(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_verify(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_watermark(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_add_text(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_add_image(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_paginate(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_extract_text(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_extract_images(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_metadata(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_repair(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_ocr(BPDFEngineConfig const&);
std::unique_ptr<BPDFOperation> bpdf_make_info(BPDFEngineConfig const&);

namespace bpdf_op
{
    // Schema shorthands
    BPDFOperation::ParameterSpec param(
        std::string const& name,
        BPDFOperation::param_type_e type,
        std::string const& def,
        std::string const& help);
    BPDFOperation::ParameterSpec choice(
        std::string const& name,
        std::vector<std::string> const& choices,
        std::string const& def,
        std::string const& help);
    BPDFOperation::ParameterSpec
    required(std::string const& name, BPDFOperation::param_type_e type, std::string const& help);

    // Pages selected by the page range parameter called name
    std::vector<BPDFPageObjectHelper>
    selected_pages(BPDF& pdf, BPDFOperation::Parameters const& params, std::string const& name);

    // Throw BPDFExc with the given code for the operation's input
    [[noreturn]] void
    fail(bpdf_error_code_e code, std::string const& filename, std::string const& message);

    // Transformation from the page as displayed, with the origin at the lower left corner of
    // its crop box and /Rotate applied, to default user space. width and height receive the
    // displayed size.
    BPDFMatrix visual_space(BPDFPageObjectHelper const& page, double& width, double& height);

    // Add a standard 14 font with WinAnsiEncoding to the page's resources and return its name
    std::string add_standard_font(BPDFPageObjectHelper& page, std::string const& base_font);
    // Approximate width of text set in Helvetica at font_size
    double text_width(std::string const& text, double font_size);
    // Encode UTF-8 text for a WinAnsiEncoding font as a PDF string literal
    std::string text_operand(std::string const& utf8);
} // namespace bpdf_op

#endif // BPDFOPERATION_PRIVATE_HH
