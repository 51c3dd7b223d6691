#include <bpdf/Pl_Predictor.hh>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

static unsigned char
paeth(int left, int up, int up_left)
{
    int estimate = left + up - up_left;
    int d_left = std::abs(estimate - left);
    int d_up = std::abs(estimate - up);
    int d_up_left = std::abs(estimate - up_left);
    if (d_left <= d_up && d_left <= d_up_left) {
        return static_cast<unsigned char>(left);
    }
    return static_cast<unsigned char>(d_up <= d_up_left ? up : up_left);
}

Pl_Predictor::Pl_Predictor(
    char const* identifier,
    Pipeline* next,
    unsigned int predictor,
    unsigned int columns,
    unsigned int colors,
    unsigned int bits_per_component) :
    Pipeline(identifier, next),
    png(predictor >= 10),
    wide_samples(bits_per_component == 16)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_Predictor with nullptr as next");
    }
    if (!(png || predictor == 2)) {
        throw std::runtime_error(identifier + std::string(": unsupported predictor"));
    }
    auto const& ok_bits = png ? std::vector<unsigned int>{1, 2, 4, 8, 16}
                              : std::vector<unsigned int>{8, 16};
    if (std::find(ok_bits.begin(), ok_bits.end(), bits_per_component) == ok_bits.end()) {
        throw std::runtime_error(identifier + std::string(": unsupported BitsPerComponent"));
    }
    unsigned long long bits_per_pixel = 1ULL * colors * bits_per_component;
    unsigned long long bits_per_row = bits_per_pixel * columns;
    if (colors == 0 || columns == 0 || bits_per_row > (1ULL << 33)) {
        throw std::runtime_error(identifier + std::string(": invalid Columns or Colors"));
    }
    row_bytes = static_cast<size_t>((bits_per_row + 7) / 8);
    pixel_bytes = static_cast<size_t>((bits_per_pixel + 7) / 8);
    prior.assign(row_bytes, 0);
    pending.reserve(row_bytes + 1);
}

void
Pl_Predictor::write(unsigned char const* data, size_t len)
{
    size_t const full = row_bytes + (png ? 1 : 0);
    while (len > 0) {
        size_t n = std::min(len, full - pending.size());
        pending.insert(pending.end(), data, data + n);
        data += n;
        len -= n;
        if (pending.size() == full) {
            emitRow();
        }
    }
}

void
Pl_Predictor::emitRow()
{
    unsigned char* row = pending.data();
    if (png) {
        undoPNG(row[0], row + 1);
        ++row;
        std::copy(row, row + row_bytes, prior.begin());
    } else {
        undoTIFF(row);
    }
    next()->write(row, row_bytes);
    pending.clear();
}

void
Pl_Predictor::undoTIFF(unsigned char* row)
{
    if (!wide_samples) {
        for (size_t i = pixel_bytes; i < row_bytes; ++i) {
            row[i] = static_cast<unsigned char>(row[i] + row[i - pixel_bytes]);
        }
        return;
    }
    for (size_t i = pixel_bytes; i + 1 < row_bytes; i += 2) {
        unsigned int left = (static_cast<unsigned int>(row[i - pixel_bytes]) << 8) |
            row[i - pixel_bytes + 1];
        unsigned int value = ((static_cast<unsigned int>(row[i]) << 8) | row[i + 1]) + left;
        row[i] = static_cast<unsigned char>((value >> 8) & 0xff);
        row[i + 1] = static_cast<unsigned char>(value & 0xff);
    }
}

void
Pl_Predictor::undoPNG(unsigned char type, unsigned char* row)
{
    for (size_t i = 0; i < row_bytes; ++i) {
        int left = i >= pixel_bytes ? row[i - pixel_bytes] : 0;
        int up = prior[i];
        int up_left = i >= pixel_bytes ? prior[i - pixel_bytes] : 0;
        int add = 0;
        switch (type) {
        case 1:
            add = left;
            break;
        case 2:
            add = up;
            break;
        case 3:
            add = (left + up) / 2;
            break;
        case 4:
            add = paeth(left, up, up_left);
            break;
        default:
            // 0 is no filter. Unknown types are passed through unchanged.
            break;
        }
        row[i] = static_cast<unsigned char>(row[i] + add);
    }
}

void
Pl_Predictor::finish()
{
    if (!pending.empty()) {
        // A short last row is decoded as if padded with zeroes.
        pending.resize(row_bytes + (png ? 1 : 0), 0);
        emitRow();
    }
    std::fill(prior.begin(), prior.end(), 0);
    next()->finish();
}
