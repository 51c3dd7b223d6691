#include <bpdf/BPDFOperation_private.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFPageDocumentHelper.hh>
#include <bpdf/BUtil.hh>
#include <bpdf/Pl_DCT.hh>

#include <cmath>

using namespace bpdf_op;

namespace
{
    std::string
    num(double value)
    {
        return BUtil::double_to_string(value, 4);
    }

    std::vector<std::string> const stamp_positions = {
        "top-left", "top-center", "top-right", "bottom-left", "bottom-center", "bottom-right"};

    // Operations that add a fragment of content to each selected page. Subclasses produce the
    // fragment, which is drawn in the coordinate system of the page as displayed.
    class StampOperation: public BPDFOperation
    {
      public:
        StampOperation(bpdf_operation_e type, BPDFEngineConfig const& config) :
            BPDFOperation(type, config)
        {
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            prepare(*input.pdf, input.filename, params);
            auto pages = stampPages(*input.pdf, params);
            int index = 0;
            int total = static_cast<int>(pages.size());
            for (auto& page: pages) {
                double width = 0.0;
                double height = 0.0;
                auto m = visual_space(page, width, height);
                std::string content =
                    m.unparse() + " cm\n" + fragment(page, params, width, height, index++, total);
                page.addContentFragment(content, params.getString("position") == "under");
            }
            Result result;
            result.outputs.push_back({input.pdf});
            return result;
        }

      protected:
        virtual void
        prepare(BPDF&, std::string const& filename, Parameters const&)
        {
        }

        virtual std::vector<BPDFPageObjectHelper>
        stampPages(BPDF& pdf, Parameters const& params)
        {
            return selected_pages(pdf, params, "pages");
        }

        virtual std::string fragment(
            BPDFPageObjectHelper& page,
            Parameters const& params,
            double width,
            double height,
            int index,
            int total) = 0;

        std::string
        showText(BPDFPageObjectHelper& page, std::string const& text, double font_size)
        {
            auto font = add_standard_font(page, "Helvetica");
            std::string result = "/" + font + " " + num(font_size) + " Tf\n";
            auto lines = BUtil::split_string(text, '\n');
            result += num(font_size * 1.2) + " TL\n";
            bool first = true;
            for (auto const& line: lines) {
                if (!first) {
                    result += "T*\n";
                }
                first = false;
                result += text_operand(line) + " Tj\n";
            }
            return result;
        }
    };

    class WatermarkOperation: public StampOperation
    {
      public:
        WatermarkOperation(BPDFEngineConfig const& config) :
            StampOperation(bpdf_op_watermark, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "draw translucent text across the middle of pages";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                required("text", pt_string, "watermark text"),
                param("opacity", pt_number, "0.3", "opacity from 0 to 1"),
                param("font-size", pt_number, "50", "font size in points"),
                param("angle", pt_number, "45", "counterclockwise angle of the text"),
                choice(
                    "position",
                    {"under", "over"},
                    "under",
                    "draw beneath or on top of existing content"),
                param("pages", pt_pages, "", "pages to mark; all if empty")};
        }

      protected:
        void
        prepare(BPDF&, std::string const& filename, Parameters const& params) override
        {
            double opacity = params.getNumber("opacity");
            if (opacity < 0.0 || opacity > 1.0) {
                fail(bpdf_e_invalid_parameter, filename, "opacity must be between 0 and 1");
            }
            if (params.getNumber("font-size") <= 0.0) {
                fail(bpdf_e_invalid_parameter, filename, "font-size must be positive");
            }
        }

        std::string
        fragment(
            BPDFPageObjectHelper& page,
            Parameters const& params,
            double width,
            double height,
            int,
            int) override
        {
            auto gs = BPDFObjectHandle::newDictionary();
            gs.replaceKey("Type", BPDFObjectHandle::newName("ExtGState"));
            auto opacity = BPDFObjectHandle::newReal(params.getNumber("opacity"), 3);
            gs.replaceKey("ca", opacity);
            gs.replaceKey("CA", opacity);
            auto gs_name = page.addResource("ExtGState", "GS", gs);

            auto const& text = params.getString("text");
            double font_size = params.getNumber("font-size");
            BPDFMatrix m;
            m.translate(width / 2.0, height / 2.0);
            m.rotate(params.getNumber("angle"));
            return "/" + gs_name + " gs\n0.5 g\n" + m.unparse() + " cm\nBT\n" +
                num(-text_width(text, font_size) / 2.0) + " " + num(-font_size / 3.0) + " Td\n" +
                showText(page, text, font_size) + "ET\n";
        }
    };

    class AddTextOperation: public StampOperation
    {
      public:
        AddTextOperation(BPDFEngineConfig const& config) :
            StampOperation(bpdf_op_add_text, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "draw text at a position on pages";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                required("text", pt_string, "text to add; \\n separates lines"),
                param("x", pt_number, "72", "distance from the left edge in points"),
                param("y", pt_number, "72", "distance from the bottom edge in points"),
                param("font-size", pt_number, "12", "font size in points"),
                param("pages", pt_pages, "", "pages to change; all if empty"),
                choice(
                    "position",
                    {"under", "over"},
                    "over",
                    "draw beneath or on top of existing content")};
        }

      protected:
        void
        prepare(BPDF&, std::string const& filename, Parameters const& params) override
        {
            if (params.getNumber("font-size") <= 0.0) {
                fail(bpdf_e_invalid_parameter, filename, "font-size must be positive");
            }
        }

        std::string
        fragment(
            BPDFPageObjectHelper& page, Parameters const& params, double, double, int, int) override
        {
            return "0 g\nBT\n" + num(params.getNumber("x")) + " " + num(params.getNumber("y")) +
                " Td\n" + showText(page, params.getString("text"), params.getNumber("font-size")) +
                "ET\n";
        }
    };

    class AddImageOperation: public StampOperation
    {
      public:
        AddImageOperation(BPDFEngineConfig const& config) :
            StampOperation(bpdf_op_add_image, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "place a JPEG image on pages";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                required("image", pt_path, "JPEG file to place"),
                param("x", pt_number, "36", "distance from the left edge in points"),
                param("y", pt_number, "36", "distance from the bottom edge in points"),
                param("width", pt_number, "0", "width in points; 0 to derive from height"),
                param("height", pt_number, "0", "height in points; 0 to derive from width"),
                param("pages", pt_pages, "", "pages to change; all if empty"),
                choice(
                    "position",
                    {"under", "over"},
                    "over",
                    "draw beneath or on top of existing content")};
        }

      protected:
        void
        prepare(BPDF& pdf, std::string const& filename, Parameters const& params) override
        {
            auto const& path = params.getString("image");
            auto data = BUtil::read_file_into_string(path.c_str());

            Pl_DCT::Header header;
            try {
                header = Pl_DCT::readHeader(data);
            } catch (std::runtime_error const& e) {
                fail(bpdf_e_unsupported, path, std::string("not a usable JPEG image: ") + e.what());
            }
            image_width = static_cast<double>(header.width);
            image_height = static_cast<double>(header.height);
            char const* color_space = nullptr;
            switch (header.components) {
            case 1:
                color_space = "DeviceGray";
                break;
            case 3:
                color_space = "DeviceRGB";
                break;
            case 4:
                color_space = "DeviceCMYK";
                break;
            default:
                fail(
                    bpdf_e_unsupported,
                    path,
                    "JPEG image has an unsupported number of components");
            }

            image = pdf.newStream();
            image.replaceStreamData(
                data, BPDFObjectHandle::newName("DCTDecode"), BPDFObjectHandle::newNull());
            auto dict = image.getDict();
            dict.replaceKey("Type", BPDFObjectHandle::newName("XObject"));
            dict.replaceKey("Subtype", BPDFObjectHandle::newName("Image"));
            dict.replaceKey("Width", BPDFObjectHandle::newInteger(header.width));
            dict.replaceKey("Height", BPDFObjectHandle::newInteger(header.height));
            dict.replaceKey("ColorSpace", BPDFObjectHandle::newName(color_space));
            dict.replaceKey("BitsPerComponent", BPDFObjectHandle::newInteger(8));

            width = params.getNumber("width");
            height = params.getNumber("height");
            if (width < 0.0 || height < 0.0) {
                fail(bpdf_e_invalid_parameter, filename, "width and height can't be negative");
            }
            if (width == 0.0 && height == 0.0) {
                width = image_width;
                height = image_height;
            } else if (width == 0.0) {
                width = height * image_width / image_height;
            } else if (height == 0.0) {
                height = width * image_height / image_width;
            }
        }

        std::string
        fragment(
            BPDFPageObjectHelper& page, Parameters const& params, double, double, int, int) override
        {
            auto name = page.addResource("XObject", "Im", image);
            BPDFMatrix m(width, 0, 0, height, params.getNumber("x"), params.getNumber("y"));
            return m.unparse() + " cm\n/" + name + " Do\n";
        }

      private:
        BPDFObjectHandle image;
        double image_width{0.0};
        double image_height{0.0};
        double width{0.0};
        double height{0.0};
    };

    class PaginateOperation: public StampOperation
    {
      public:
        PaginateOperation(BPDFEngineConfig const& config) :
            StampOperation(bpdf_op_paginate, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "stamp page numbers";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                choice("position", stamp_positions, "bottom-right", "corner or edge to stamp"),
                param("start", pt_integer, "1", "number of the first page"),
                param("font-size", pt_number, "10", "font size in points"),
                param(
                    "format",
                    pt_string,
                    "{n}",
                    "label text; {n} is the page number and {total} the last number"),
                param("margin", pt_number, "36", "distance from the page edges in points")};
        }

      protected:
        void
        prepare(BPDF&, std::string const& filename, Parameters const& params) override
        {
            if (params.getNumber("font-size") <= 0.0) {
                fail(bpdf_e_invalid_parameter, filename, "font-size must be positive");
            }
        }

        std::vector<BPDFPageObjectHelper>
        stampPages(BPDF& pdf, Parameters const&) override
        {
            return BPDFPageDocumentHelper(pdf).getAllPages();
        }

        std::string
        fragment(
            BPDFPageObjectHelper& page,
            Parameters const& params,
            double width,
            double height,
            int index,
            int total) override
        {
            long long start = params.getInteger("start");
            std::string label = params.getString("format");
            replace_all(label, "{n}", std::to_string(start + index));
            replace_all(label, "{total}", std::to_string(start + total - 1));

            auto const& position = params.getString("position");
            double font_size = params.getNumber("font-size");
            double margin = params.getNumber("margin");
            double label_width = text_width(label, font_size);
            double x = margin;
            if (position.find("center") != std::string::npos) {
                x = (width - label_width) / 2.0;
            } else if (position.find("right") != std::string::npos) {
                x = width - margin - label_width;
            }
            double y = (position.substr(0, 3) == "top") ? height - margin - font_size : margin;
            return "0 g\nBT\n" + num(x) + " " + num(y) + " Td\n" +
                showText(page, label, font_size) + "ET\n";
        }

      private:
        static void
        replace_all(std::string& str, std::string const& from, std::string const& to)
        {
            size_t pos = 0;
            while ((pos = str.find(from, pos)) != std::string::npos) {
                str.replace(pos, from.length(), to);
                pos += to.length();
            }
        }
    };
} // namespace

std::unique_ptr<BPDFOperation>
bpdf_make_watermark(BPDFEngineConfig const& config)
{
    return std::make_unique<WatermarkOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_add_text(BPDFEngineConfig const& config)
{
    return std::make_unique<AddTextOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_add_image(BPDFEngineConfig const& config)
{
    return std::make_unique<AddImageOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_paginate(BPDFEngineConfig const& config)
{
    return std::make_unique<PaginateOperation>(config);
}
