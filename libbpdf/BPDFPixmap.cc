#include <bpdf/BPDFPixmap.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/Pl_DCT.hh>
#include <bpdf/Pl_String.hh>

#include <algorithm>
#include <stdexcept>

namespace
{
    bool
    image_components(BPDFObjectHandle color_space, int& components)
    {
        if (color_space.isNameAndEquals("DeviceGray")) {
            components = 1;
        } else if (color_space.isNameAndEquals("DeviceRGB")) {
            components = 3;
        } else if (
            color_space.isArray() && color_space.getArrayNItems() == 2 &&
            color_space.getArrayItem(0).isNameAndEquals("ICCBased") &&
            color_space.getArrayItem(1).isStream()) {
            auto n = color_space.getArrayItem(1).getDict().getKey("N");
            if (!(n.isInteger() && (n.getIntValue() == 1 || n.getIntValue() == 3))) {
                return false;
            }
            components = n.getIntValueAsInt();
        } else {
            return false;
        }
        return true;
    }

    std::string
    filter_name(BPDFObjectHandle filter)
    {
        if (filter.isArray() && filter.getArrayNItems() == 1) {
            filter = filter.getArrayItem(0);
        }
        if (filter.isNull()) {
            return "";
        }
        if (filter.isName()) {
            return filter.getName();
        }
        return "(multiple filters)";
    }
} // namespace

BPDFPixmap::BPDFPixmap(int width, int height, int components) :
    width(width),
    height(height),
    components(components),
    pixels(
        static_cast<size_t>(width) * static_cast<size_t>(height) *
            static_cast<size_t>(components),
        '\xff')
{
}

BPDFPixmap::BPDFPixmap(int width, int height, int components, std::string pixels) :
    width(width),
    height(height),
    components(components),
    pixels(std::move(pixels))
{
    auto expected = static_cast<size_t>(width) * static_cast<size_t>(height) *
        static_cast<size_t>(components);
    if (this->pixels.size() != expected) {
        throw std::logic_error("BPDFPixmap: pixel data does not match the dimensions");
    }
}

bool
BPDFPixmap::empty() const
{
    return width == 0 || height == 0;
}

bool
BPDFPixmap::fromImage(BPDFObjectHandle image, BPDFPixmap& result, std::string& reason)
{
    if (!image.isImage()) {
        reason = "not an image";
        return false;
    }
    auto dict = image.getDict();
    if (dict.getKey("ImageMask").isBool() && dict.getKey("ImageMask").getBoolValue()) {
        reason = "image is a stencil mask";
        return false;
    }
    if (dict.hasKey("SMask") || dict.hasKey("Mask")) {
        reason = "image has a soft mask or color key mask";
        return false;
    }
    if (!(dict.getKey("BitsPerComponent").isInteger() &&
          dict.getKey("BitsPerComponent").getIntValue() == 8)) {
        reason = "image does not have 8 bits per component";
        return false;
    }
    int components = 0;
    if (!image_components(dict.getKey("ColorSpace"), components)) {
        reason = "image color space is not gray or RGB";
        return false;
    }
    auto w = dict.getKey("Width");
    auto h = dict.getKey("Height");
    if (!(w.isInteger() && h.isInteger() && w.getIntValue() > 0 && h.getIntValue() > 0)) {
        reason = "image has invalid dimensions";
        return false;
    }
    int width = w.getIntValueAsInt();
    int height = h.getIntValueAsInt();

    auto filter = filter_name(dict.getKey("Filter"));
    std::string data;
    if (filter == "DCTDecode") {
        try {
            auto decoded = fromJPEG(image.getRawStreamData());
            if (decoded.width != width || decoded.height != height ||
                decoded.components != components) {
                reason = "JPEG data does not match the image dictionary";
                return false;
            }
            result = decoded;
            return true;
        } catch (std::runtime_error const& e) {
            reason = std::string("unable to decode JPEG data: ") + e.what();
            return false;
        }
    } else if (filter == "FlateDecode" || filter.empty()) {
        auto parms = dict.getKey("DecodeParms");
        if (parms.isArray() && parms.getArrayNItems() == 1) {
            parms = parms.getArrayItem(0);
        }
        auto predictor = parms.getKey("Predictor");
        if (predictor.isInteger() && predictor.getIntValue() > 1) {
            reason = "image data uses a predictor";
            return false;
        }
        try {
            data = image.getStreamData(bpdf_dl_generalized);
        } catch (std::runtime_error const& e) {
            reason = std::string("unable to decode image data: ") + e.what();
            return false;
        }
    } else {
        reason = "image uses unsupported filter " + filter;
        return false;
    }
    size_t expected =
        static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(components);
    if (data.size() < expected) {
        reason = "image data is shorter than its dimensions require";
        return false;
    }
    data.resize(expected);
    result = BPDFPixmap(width, height, components, std::move(data));
    return true;
}

BPDFPixmap
BPDFPixmap::fromJPEG(std::string const& data)
{
    std::string pixels;
    Pl_String out("jpeg pixels", nullptr, pixels);
    Pl_DCT dct("jpeg decode", &out);
    dct.writeString(data);
    dct.finish();
    auto const& header = dct.getHeader();
    if (header.components != 1 && header.components != 3) {
        throw BPDFExc(bpdf_e_unsupported, "", "", 0, "JPEG image is not gray or RGB");
    }
    return {header.width, header.height, header.components, std::move(pixels)};
}

BPDFPixmap
BPDFPixmap::resample(int new_width, int new_height) const
{
    if (new_width < 1 || new_height < 1) {
        throw std::logic_error("BPDFPixmap::resample called with an empty size");
    }
    BPDFPixmap result(new_width, new_height, components);
    auto const* src = reinterpret_cast<unsigned char const*>(pixels.data());
    auto* dst = reinterpret_cast<unsigned char*>(result.pixels.data());
    for (int y = 0; y < new_height; ++y) {
        int y0 = static_cast<int>(static_cast<long long>(y) * height / new_height);
        int y1 = std::max(
            y0 + 1, static_cast<int>(static_cast<long long>(y + 1) * height / new_height));
        for (int x = 0; x < new_width; ++x) {
            int x0 = static_cast<int>(static_cast<long long>(x) * width / new_width);
            int x1 = std::max(
                x0 + 1, static_cast<int>(static_cast<long long>(x + 1) * width / new_width));
            for (int c = 0; c < components; ++c) {
                unsigned long sum = 0;
                for (int sy = y0; sy < y1; ++sy) {
                    for (int sx = x0; sx < x1; ++sx) {
                        sum += src[(static_cast<size_t>(sy) * static_cast<size_t>(width) +
                                    static_cast<size_t>(sx)) *
                                       static_cast<size_t>(components) +
                                   static_cast<size_t>(c)];
                    }
                }
                auto count = static_cast<unsigned long>((y1 - y0) * (x1 - x0));
                dst[(static_cast<size_t>(y) * static_cast<size_t>(new_width) +
                     static_cast<size_t>(x)) *
                        static_cast<size_t>(components) +
                    static_cast<size_t>(c)] = static_cast<unsigned char>(sum / count);
            }
        }
    }
    return result;
}

BPDFPixmap
BPDFPixmap::toGray() const
{
    if (components == 1) {
        return *this;
    }
    BPDFPixmap result(width, height, 1);
    size_t n = static_cast<size_t>(width) * static_cast<size_t>(height);
    auto const* src = reinterpret_cast<unsigned char const*>(pixels.data());
    for (size_t i = 0; i < n; ++i) {
        unsigned int r = src[3 * i];
        unsigned int g = src[3 * i + 1];
        unsigned int b = src[3 * i + 2];
        result.pixels[i] = static_cast<char>((299 * r + 587 * g + 114 * b) / 1000);
    }
    return result;
}

void
BPDFPixmap::paste(BPDFPixmap const& src, int x, int y)
{
    if (src.components != components) {
        if (components == 1) {
            paste(src.toGray(), x, y);
            return;
        }
        // Gray into RGB
        std::string rgb;
        rgb.reserve(src.pixels.size() * 3);
        for (char ch: src.pixels) {
            rgb.append(3, ch);
        }
        paste(BPDFPixmap(src.width, src.height, 3, std::move(rgb)), x, y);
        return;
    }
    auto comps = static_cast<size_t>(components);
    for (int sy = 0; sy < src.height; ++sy) {
        int dy = y + sy;
        if (dy < 0 || dy >= height) {
            continue;
        }
        int sx0 = std::max(0, -x);
        int sx1 = std::min(src.width, width - x);
        if (sx1 <= sx0) {
            continue;
        }
        auto from = (static_cast<size_t>(sy) * static_cast<size_t>(src.width) +
                     static_cast<size_t>(sx0)) *
            comps;
        auto to = (static_cast<size_t>(dy) * static_cast<size_t>(width) +
                   static_cast<size_t>(x + sx0)) *
            comps;
        auto len = static_cast<size_t>(sx1 - sx0) * comps;
        pixels.replace(to, len, src.pixels, from, len);
    }
}

std::string
BPDFPixmap::toJPEG(int quality) const
{
    std::string result;
    Pl_String out("jpeg data", nullptr, result);
    Pl_DCT dct("jpeg encode", &out, width, height, components, quality);
    dct.writeString(pixels);
    dct.finish();
    return result;
}

std::string
BPDFPixmap::toPNM() const
{
    std::string result = (components == 1 ? "P5\n" : "P6\n") + std::to_string(width) + " " +
        std::to_string(height) + "\n255\n";
    result += pixels;
    return result;
}
