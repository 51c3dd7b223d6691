#include <bpdf/assert_test.h>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFPixmap.hh>
#include <bpdf/Pl_DCT.hh>
#include <bpdf/Pl_Discard.hh>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

static BPDFPixmap
gradient(int width, int height)
{
    BPDFPixmap p(width, height, 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            auto i = static_cast<size_t>(3 * (y * width + x));
            p.pixels[i] = static_cast<char>(x * 255 / (width - 1));
            p.pixels[i + 1] = static_cast<char>(y * 255 / (height - 1));
            p.pixels[i + 2] = '\x80';
        }
    }
    return p;
}

static int
sample(BPDFPixmap const& p, int x, int y, int c)
{
    return static_cast<unsigned char>(
        p.pixels.at(static_cast<size_t>((y * p.width + x) * p.components + c)));
}

static void
test_jpeg()
{
    auto p = gradient(64, 48);
    auto jpeg = p.toJPEG(90);
    assert(jpeg.substr(0, 2) == "\xff\xd8");

    auto header = Pl_DCT::readHeader(jpeg);
    assert(header.width == 64 && header.height == 48 && header.components == 3);

    Pl_Discard discard;
    Pl_DCT dct("decode", &discard);
    dct.writeString(jpeg);
    dct.finish();
    assert(dct.getHeader().width == 64);

    bool thrown = false;
    try {
        Pl_DCT::readHeader("not a jpeg");
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    thrown = false;
    try {
        Pl_DCT short_data("encode", &discard, 4, 4, 3, 75);
        short_data.writeString(std::string(10, '\x20'));
        short_data.finish();
    } catch (std::runtime_error& e) {
        thrown = std::string(e.what()).find("expected size = 48") != std::string::npos;
    }
    assert(thrown);

    auto decoded = BPDFPixmap::fromJPEG(jpeg);
    assert(decoded.width == 64 && decoded.height == 48 && decoded.components == 3);
    // Lossy, but close
    for (int y = 4; y < 48; y += 10) {
        for (int x = 4; x < 64; x += 10) {
            for (int c = 0; c < 3; ++c) {
                assert(std::abs(sample(decoded, x, y, c) - sample(p, x, y, c)) < 16);
            }
        }
    }
    assert(p.toJPEG(20).size() < jpeg.size());

    auto gray = p.toGray();
    assert(gray.components == 1);
    auto gray_jpeg = BPDFPixmap::fromJPEG(gray.toJPEG(75));
    assert(gray_jpeg.components == 1);
}

static void
test_pixmap()
{
    BPDFPixmap white(4, 2, 1);
    assert(!white.empty());
    assert(white.pixels == std::string(8, '\xff'));
    assert(BPDFPixmap().empty());
    assert(white.toPNM() == "P5\n4 2\n255\n" + std::string(8, '\xff'));

    // Shrinking averages.
    BPDFPixmap checks(2, 2, 1, std::string("\x00\xff\xff\x00", 4));
    auto one = checks.resample(1, 1);
    assert(one.pixels.size() == 1);
    assert(sample(one, 0, 0, 0) == 127);
    // Growing repeats.
    auto big = checks.resample(4, 4);
    assert(sample(big, 0, 0, 0) == 0 && sample(big, 1, 1, 0) == 0);
    assert(sample(big, 2, 0, 0) == 255 && sample(big, 3, 3, 0) == 0);

    // Pasting clips at the edges and converts components.
    BPDFPixmap rgb(3, 3, 3, std::string(27, '\x00'));
    BPDFPixmap canvas(4, 4, 1);
    canvas.paste(rgb, 2, -1);
    assert(sample(canvas, 1, 0, 0) == 255);
    assert(sample(canvas, 2, 0, 0) == 0 && sample(canvas, 3, 1, 0) == 0);
    assert(sample(canvas, 2, 2, 0) == 255);

    BPDFPixmap rgb_canvas(2, 2, 3);
    rgb_canvas.paste(BPDFPixmap(1, 1, 1, std::string(1, '\x10')), 1, 1);
    assert(sample(rgb_canvas, 1, 1, 0) == 0x10 && sample(rgb_canvas, 1, 1, 2) == 0x10);
    assert(sample(rgb_canvas, 0, 0, 1) == 0xff);
}

static void
test_image_objects()
{
    BPDF pdf;
    pdf.emptyPDF();
    auto image = pdf.newStream(std::string("\x00\x40\x80\xc0\xff\x20", 6));
    auto dict = image.getDict();
    dict.replaceKey("Type", BPDFObjectHandle::newName("XObject"));
    dict.replaceKey("Subtype", BPDFObjectHandle::newName("Image"));
    dict.replaceKey("Width", BPDFObjectHandle::newInteger(3));
    dict.replaceKey("Height", BPDFObjectHandle::newInteger(2));
    dict.replaceKey("ColorSpace", BPDFObjectHandle::newName("DeviceGray"));
    dict.replaceKey("BitsPerComponent", BPDFObjectHandle::newInteger(8));

    BPDFPixmap result;
    std::string reason;
    assert(BPDFPixmap::fromImage(image, result, reason));
    assert(result.width == 3 && result.height == 2 && result.components == 1);
    assert(sample(result, 1, 1, 0) == 0xff);

    dict.replaceKey("BitsPerComponent", BPDFObjectHandle::newInteger(1));
    assert(!BPDFPixmap::fromImage(image, result, reason));
    assert(reason == "image does not have 8 bits per component");

    dict.replaceKey("BitsPerComponent", BPDFObjectHandle::newInteger(8));
    dict.replaceKey("ColorSpace", BPDFObjectHandle::newName("DeviceCMYK"));
    assert(!BPDFPixmap::fromImage(image, result, reason));

    auto jpeg = gradient(8, 8).toJPEG(80);
    image.replaceStreamData(
        jpeg, BPDFObjectHandle::newName("DCTDecode"), BPDFObjectHandle::newNull());
    dict.replaceKey("ColorSpace", BPDFObjectHandle::newName("DeviceRGB"));
    dict.replaceKey("Width", BPDFObjectHandle::newInteger(8));
    dict.replaceKey("Height", BPDFObjectHandle::newInteger(8));
    assert(BPDFPixmap::fromImage(image, result, reason));
    assert(result.components == 3 && result.width == 8);
    dict.replaceKey("Width", BPDFObjectHandle::newInteger(9));
    assert(!BPDFPixmap::fromImage(image, result, reason));
    assert(reason == "JPEG data does not match the image dictionary");
}

int
main()
{
    test_jpeg();
    test_pixmap();
    test_image_objects();
    std::cout << "dct tests done" << std::endl;
    return 0;
}
