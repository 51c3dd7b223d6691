#include <bpdf/BPDFOperation_private.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFPageDocumentHelper.hh>
#include <bpdf/BPDFWriter.hh>
#include <bpdf/BUtil.hh>

#include <stdexcept>

namespace
{
    struct OperationEntry
    {
        bpdf_operation_e op;
        char const* name;
        std::unique_ptr<BPDFOperation> (*make)(BPDFEngineConfig const&);
    };

    OperationEntry const operations[] = {
        {bpdf_op_merge, "merge", bpdf_make_merge},
        {bpdf_op_split, "split", bpdf_make_split},
        {bpdf_op_rotate, "rotate", bpdf_make_rotate},
        {bpdf_op_reorder, "reorder", bpdf_make_reorder},
        {bpdf_op_compress, "compress", bpdf_make_compress},
        {bpdf_op_encrypt, "encrypt", bpdf_make_encrypt},
        {bpdf_op_decrypt, "decrypt", bpdf_make_decrypt},
        {bpdf_op_sign, "sign", bpdf_make_sign},
        {bpdf_op_verify, "verify", bpdf_make_verify},
        {bpdf_op_watermark, "watermark", bpdf_make_watermark},
        {bpdf_op_add_text, "add-text", bpdf_make_add_text},
        {bpdf_op_add_image, "add-image", bpdf_make_add_image},
        {bpdf_op_paginate, "paginate", bpdf_make_paginate},
        {bpdf_op_extract_text, "extract-text", bpdf_make_extract_text},
        {bpdf_op_extract_images, "extract-images", bpdf_make_extract_images},
        {bpdf_op_metadata, "metadata", bpdf_make_metadata},
        {bpdf_op_repair, "repair", bpdf_make_repair},
        {bpdf_op_ocr, "ocr", bpdf_make_ocr},
        {bpdf_op_info, "info", bpdf_make_info},
    };

    OperationEntry const&
    find_entry(bpdf_operation_e op)
    {
        for (auto const& entry: operations) {
            if (entry.op == op) {
                return entry;
            }
        }
        throw std::logic_error("unknown operation " + std::to_string(static_cast<int>(op)));
    }

    [[noreturn]] void
    invalid_parameter(std::string const& message)
    {
        throw BPDFExc(bpdf_e_invalid_parameter, "", "", 0, message);
    }

    bool
    parse_boolean(std::string const& value, bool& result)
    {
        if (value == "true" || value == "yes" || value == "y" || value == "1" || value == "on") {
            result = true;
        } else if (
            value == "false" || value == "no" || value == "n" || value == "0" || value == "off") {
            result = false;
        } else {
            return false;
        }
        return true;
    }

    void
    check_value(BPDFOperation::ParameterSpec const& spec, std::string const& value)
    {
        switch (spec.type) {
        case BPDFOperation::pt_integer:
            if (!BUtil::is_long_long(value.c_str())) {
                invalid_parameter(spec.name + ": \"" + value + "\" is not an integer");
            }
            break;

        case BPDFOperation::pt_number:
            if (!BUtil::is_number(value.c_str())) {
                invalid_parameter(spec.name + ": \"" + value + "\" is not a number");
            }
            break;

        case BPDFOperation::pt_boolean:
            {
                bool b = false;
                if (!parse_boolean(value, b)) {
                    invalid_parameter(spec.name + ": \"" + value + "\" is not true or false");
                }
            }
            break;

        case BPDFOperation::pt_choice:
            {
                bool found = false;
                std::string allowed;
                for (auto const& choice: spec.choices) {
                    found = found || (choice == value);
                    allowed += (allowed.empty() ? "" : ", ") + choice;
                }
                if (!found) {
                    invalid_parameter(
                        spec.name + ": \"" + value + "\" is not one of " + allowed);
                }
            }
            break;

        case BPDFOperation::pt_pages:
            if (!value.empty()) {
                try {
                    // max == 0 checks the syntax only
                    BUtil::parse_numrange(value.c_str(), 0);
                } catch (std::runtime_error const& e) {
                    throw BPDFExc(bpdf_e_invalid_range, "", "", 0, spec.name + ": " + e.what());
                }
            }
            break;

        case BPDFOperation::pt_path:
            if (value.empty()) {
                invalid_parameter(spec.name + ": empty path");
            }
            break;

        case BPDFOperation::pt_string:
        case BPDFOperation::pt_list:
            break;
        }
    }
} // namespace

bool
BPDFOperation::Parameters::has(std::string const& name) const
{
    return values.count(name) > 0;
}

std::string const&
BPDFOperation::Parameters::getString(std::string const& name) const
{
    auto it = values.find(name);
    if (it == values.end()) {
        throw std::logic_error("operation parameter " + name + " has no value");
    }
    return it->second;
}

long long
BPDFOperation::Parameters::getInteger(std::string const& name) const
{
    return BUtil::string_to_ll(getString(name).c_str());
}

double
BPDFOperation::Parameters::getNumber(std::string const& name) const
{
    return std::stod(getString(name));
}

bool
BPDFOperation::Parameters::getBoolean(std::string const& name) const
{
    bool result = false;
    if (!parse_boolean(getString(name), result)) {
        throw std::logic_error("operation parameter " + name + " is not a boolean");
    }
    return result;
}

std::vector<std::string>
BPDFOperation::Parameters::getList(std::string const& name) const
{
    std::vector<std::string> result;
    if (!has(name)) {
        return result;
    }
    for (auto const& item: BUtil::split_string(getString(name), ',')) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

void
BPDFOperation::Parameters::set(std::string const& name, std::string const& value)
{
    values[name] = value;
}

std::map<std::string, std::string> const&
BPDFOperation::Parameters::getAll() const
{
    return values;
}

BPDFOperation::BPDFOperation(bpdf_operation_e type, BPDFEngineConfig const& config) :
    config(config),
    type(type)
{
}

std::unique_ptr<BPDFOperation>
BPDFOperation::create(bpdf_operation_e op, BPDFEngineConfig const& config)
{
    return find_entry(op).make(config);
}

char const*
BPDFOperation::getOperationName(bpdf_operation_e op)
{
    return find_entry(op).name;
}

bool
BPDFOperation::parseOperationName(std::string const& name, bpdf_operation_e& op)
{
    for (auto const& entry: operations) {
        if (name == entry.name) {
            op = entry.op;
            return true;
        }
    }
    return false;
}

std::vector<bpdf_operation_e>
BPDFOperation::getAllOperations()
{
    std::vector<bpdf_operation_e> result;
    for (auto const& entry: operations) {
        result.push_back(entry.op);
    }
    return result;
}

bpdf_operation_e
BPDFOperation::getType() const
{
    return type;
}

char const*
BPDFOperation::getName() const
{
    return getOperationName(type);
}

int
BPDFOperation::getMinInputs() const
{
    return 1;
}

int
BPDFOperation::getMaxInputs() const
{
    return 1;
}

bool
BPDFOperation::usesOCR(Parameters const&) const
{
    return false;
}

std::string
BPDFOperation::getInputPassword(Parameters const&) const
{
    return config.password;
}

void
BPDFOperation::openInput(Input& input, Parameters const& params) const
{
    auto pdf = BPDF::create();
    pdf->setLogger(config.getLogger());
    pdf->processMemoryFile(input.filename.c_str(), input.data, getInputPassword(params).c_str());
    input.pdf = pdf;
}

BPDFOperation::Parameters
BPDFOperation::validate(std::map<std::string, std::string> const& values) const
{
    auto specs = getParameterSpecs();
    Parameters result;
    for (auto const& [name, value]: values) {
        ParameterSpec const* spec = nullptr;
        for (auto const& s: specs) {
            if (s.name == name) {
                spec = &s;
                break;
            }
        }
        if (!spec) {
            invalid_parameter(
                std::string("unknown parameter \"") + name + "\" for operation " + getName());
        }
        check_value(*spec, value);
        result.set(name, value);
    }
    for (auto const& spec: specs) {
        if (result.has(spec.name)) {
            continue;
        }
        if (spec.required) {
            invalid_parameter(
                std::string("operation ") + getName() + " requires parameter " + spec.name);
        }
        if (!spec.default_value.empty() || spec.type == pt_pages) {
            result.set(spec.name, spec.default_value);
        }
    }
    return result;
}

void
BPDFOperation::checkInputCount(size_t count) const
{
    if (count == 0) {
        throw BPDFExc(
            bpdf_e_empty_input,
            "",
            "",
            0,
            std::string("operation ") + getName() + " requires at least one input");
    }
    auto min = static_cast<size_t>(getMinInputs());
    int max = getMaxInputs();
    if (count < min || (max >= 0 && count > static_cast<size_t>(max))) {
        invalid_parameter(
            std::string("operation ") + getName() + " was given " + std::to_string(count) +
            " inputs");
    }
}

std::string
BPDFOperation::writeOutput(Output const& output)
{
    if (!output.pdf) {
        return output.data;
    }
    BPDFWriter w(*output.pdf);
    w.setOutputMemory();
    w.setDecodeLevel(output.decode_level);
    w.setCompressionLevel(output.compression_level);
    w.write();
    return w.getOutputString();
}

BPDFOperation::ParameterSpec
bpdf_op::param(
    std::string const& name,
    BPDFOperation::param_type_e type,
    std::string const& def,
    std::string const& help)
{
    BPDFOperation::ParameterSpec spec;
    spec.name = name;
    spec.type = type;
    spec.default_value = def;
    spec.help = help;
    return spec;
}

BPDFOperation::ParameterSpec
bpdf_op::choice(
    std::string const& name,
    std::vector<std::string> const& choices,
    std::string const& def,
    std::string const& help)
{
    auto spec = param(name, BPDFOperation::pt_choice, def, help);
    spec.choices = choices;
    return spec;
}

BPDFOperation::ParameterSpec
bpdf_op::required(
    std::string const& name, BPDFOperation::param_type_e type, std::string const& help)
{
    auto spec = param(name, type, "", help);
    spec.required = true;
    return spec;
}

std::vector<BPDFPageObjectHelper>
bpdf_op::selected_pages(
    BPDF& pdf, BPDFOperation::Parameters const& params, std::string const& name)
{
    BPDFPageDocumentHelper dh(pdf);
    std::string range = params.has(name) ? params.getString(name) : "";
    std::vector<BPDFPageObjectHelper> result;
    for (int i: dh.selectPages(range)) {
        result.push_back(dh.getPage(i));
    }
    return result;
}

void
bpdf_op::fail(bpdf_error_code_e code, std::string const& filename, std::string const& message)
{
    throw BPDFExc(code, filename, "", 0, message);
}

std::string
bpdf_op::add_standard_font(BPDFPageObjectHelper& page, std::string const& base_font)
{
    auto font = BPDFObjectHandle::newDictionary();
    font.replaceKey("Type", BPDFObjectHandle::newName("Font"));
    font.replaceKey("Subtype", BPDFObjectHandle::newName("Type1"));
    font.replaceKey("BaseFont", BPDFObjectHandle::newName(base_font));
    font.replaceKey("Encoding", BPDFObjectHandle::newName("WinAnsiEncoding"));
    return page.addResource("Font", "F", font);
}

double
bpdf_op::text_width(std::string const& text, double font_size)
{
    // Helvetica glyph widths for codes 32 through 126, in 1/1000 em
    static int const widths[] = {
        278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
        556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
        1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
        667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
        333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
        556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584};
    std::string encoded;
    BUtil::utf8_to_pdf_doc(text, encoded);
    long total = 0;
    for (char ch: encoded) {
        auto c = static_cast<unsigned char>(ch);
        total += (c >= 32 && c <= 126) ? widths[c - 32] : 556;
    }
    return static_cast<double>(total) * font_size / 1000.0;
}

std::string
bpdf_op::text_operand(std::string const& utf8)
{
    std::string encoded;
    BUtil::utf8_to_pdf_doc(utf8, encoded);
    return BPDFObjectHandle::newString(encoded).unparse();
}

BPDFMatrix
bpdf_op::visual_space(BPDFPageObjectHelper const& page, double& width, double& height)
{
    auto box = page.getCropBox();
    switch (page.getRotation()) {
    case 90:
        width = box.height();
        height = box.width();
        return {0, 1, -1, 0, box.urx, box.lly};
    case 180:
        width = box.width();
        height = box.height();
        return {-1, 0, 0, -1, box.urx, box.ury};
    case 270:
        width = box.height();
        height = box.width();
        return {0, -1, 1, 0, box.llx, box.ury};
    default:
        width = box.width();
        height = box.height();
        return {1, 0, 0, 1, box.llx, box.lly};
    }
}
