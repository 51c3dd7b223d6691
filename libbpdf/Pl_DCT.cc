#include <bpdf/Pl_DCT.hh>

#include <csetjmp>
#include <cstddef>
#include <cstdio>
#include <stdexcept>

// jpeglib.h uses size_t and FILE without declaring them.
#include <jpeglib.h>

#if BITS_IN_JSAMPLE != 8
# error "bpdf requires libjpeg built with 8-bit samples"
#endif

namespace
{
    struct ErrorManager
    {
        jpeg_error_mgr pub;
        jmp_buf jmpbuf;
        std::string msg;
    };

    struct StringDestination
    {
        jpeg_destination_mgr pub;
        std::string* out;
        JOCTET buffer[16384];
    };
} // namespace

static void
error_exit(j_common_ptr cinfo)
{
    auto* err = reinterpret_cast<ErrorManager*>(cinfo->err);
    char buf[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buf);
    err->msg = buf;
    longjmp(err->jmpbuf, 1);
}

// Corrupt data is only a warning to libjpeg. Treat it as an error so damaged images are not
// silently re-encoded.
static void
emit_message(j_common_ptr cinfo, int msg_level)
{
    if (msg_level == -1) {
        auto* err = reinterpret_cast<ErrorManager*>(cinfo->err);
        err->msg = "JPEG data is corrupt";
        longjmp(err->jmpbuf, 1);
    }
}

static void
init_destination(j_compress_ptr cinfo)
{
    auto* dest = reinterpret_cast<StringDestination*>(cinfo->dest);
    dest->pub.next_output_byte = dest->buffer;
    dest->pub.free_in_buffer = sizeof(dest->buffer);
}

static boolean
empty_output_buffer(j_compress_ptr cinfo)
{
    auto* dest = reinterpret_cast<StringDestination*>(cinfo->dest);
    dest->out->append(reinterpret_cast<char const*>(dest->buffer), sizeof(dest->buffer));
    init_destination(cinfo);
    return TRUE;
}

static void
term_destination(j_compress_ptr cinfo)
{
    auto* dest = reinterpret_cast<StringDestination*>(cinfo->dest);
    auto used = sizeof(dest->buffer) - dest->pub.free_in_buffer;
    dest->out->append(reinterpret_cast<char const*>(dest->buffer), used);
}

#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
static void
create_decompress(j_decompress_ptr cinfo)
{
    jpeg_create_decompress(cinfo);
}

static void
create_compress(j_compress_ptr cinfo)
{
    jpeg_create_compress(cinfo);
}
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic pop
#endif

static bool
decode_jpeg(
    std::string const& data,
    bool header_only,
    Pl_DCT::Header& header,
    std::string& samples,
    std::string& error)
{
    jpeg_decompress_struct cinfo;
    ErrorManager err;
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = error_exit;
    err.pub.emit_message = emit_message;
    if (setjmp(err.jmpbuf) != 0) {
        jpeg_destroy_decompress(&cinfo);
        error = err.msg;
        return false;
    }

    create_decompress(&cinfo);
    jpeg_mem_src(
        &cinfo,
        reinterpret_cast<unsigned char const*>(data.data()),
        static_cast<unsigned long>(data.size()));
    (void)jpeg_read_header(&cinfo, TRUE);
    jpeg_calc_output_dimensions(&cinfo);
    header.width = static_cast<int>(cinfo.output_width);
    header.height = static_cast<int>(cinfo.output_height);
    header.components = cinfo.output_components;
    if (!header_only) {
        auto row_size =
            static_cast<size_t>(cinfo.output_width) * static_cast<size_t>(cinfo.output_components);
        samples.assign(row_size * cinfo.output_height, '\0');
        (void)jpeg_start_decompress(&cinfo);
        while (cinfo.output_scanline < cinfo.output_height) {
            JSAMPROW row = reinterpret_cast<JSAMPROW>(&samples[row_size * cinfo.output_scanline]);
            (void)jpeg_read_scanlines(&cinfo, &row, 1);
        }
        (void)jpeg_finish_decompress(&cinfo);
    }
    jpeg_destroy_decompress(&cinfo);
    return true;
}

static bool
encode_jpeg(
    std::string& samples,
    Pl_DCT::Header const& header,
    int quality,
    std::string& result,
    std::string& error)
{
    jpeg_compress_struct cinfo;
    ErrorManager err;
    StringDestination dest;
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = error_exit;
    if (setjmp(err.jmpbuf) != 0) {
        jpeg_destroy_compress(&cinfo);
        error = err.msg;
        return false;
    }

    create_compress(&cinfo);
    dest.pub.init_destination = init_destination;
    dest.pub.empty_output_buffer = empty_output_buffer;
    dest.pub.term_destination = term_destination;
    dest.out = &result;
    cinfo.dest = &dest.pub;

    cinfo.image_width = static_cast<JDIMENSION>(header.width);
    cinfo.image_height = static_cast<JDIMENSION>(header.height);
    cinfo.input_components = header.components;
    cinfo.in_color_space = header.components == 1 ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);
    auto row_size = static_cast<size_t>(header.width) * static_cast<size_t>(header.components);
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = reinterpret_cast<JSAMPROW>(&samples[row_size * cinfo.next_scanline]);
        (void)jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    return true;
}

Pl_DCT::Pl_DCT(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_DCT with nullptr as next");
    }
}

Pl_DCT::Pl_DCT(
    char const* identifier, Pipeline* next, int width, int height, int components, int quality) :
    Pipeline(identifier, next),
    encoding(true),
    quality(quality),
    header{width, height, components}
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_DCT with nullptr as next");
    }
    if (width <= 0 || height <= 0 || !(components == 1 || components == 3)) {
        throw std::logic_error("Pl_DCT: unsupported image layout for JPEG encoding");
    }
    if (quality < 1 || quality > 100) {
        throw std::logic_error("Pl_DCT: JPEG quality must be between 1 and 100");
    }
}

void
Pl_DCT::write(unsigned char const* buf, size_t len)
{
    data.append(reinterpret_cast<char const*>(buf), len);
}

void
Pl_DCT::finish()
{
    if (data.empty()) {
        // Nothing was written, or this is a second call from an exception handler.
        next()->finish();
        return;
    }

    std::string result;
    std::string error;
    bool ok = false;
    if (encoding) {
        auto expected = static_cast<size_t>(header.width) * static_cast<size_t>(header.height) *
            static_cast<size_t>(header.components);
        if (data.size() != expected) {
            auto size = data.size();
            data.clear();
            throw std::runtime_error(
                identifier + ": image buffer size = " + std::to_string(size) +
                "; expected size = " + std::to_string(expected));
        }
        ok = encode_jpeg(data, header, quality, result, error);
    } else {
        ok = decode_jpeg(data, false, header, result, error);
    }
    data.clear();
    if (!ok) {
        throw std::runtime_error(identifier + ": " + error);
    }
    next()->writeString(result);
    next()->finish();
}

Pl_DCT::Header
Pl_DCT::readHeader(std::string const& data)
{
    Header header;
    std::string unused;
    std::string error;
    if (!decode_jpeg(data, true, header, unused, error)) {
        throw std::runtime_error("reading JPEG header: " + error);
    }
    return header;
}
