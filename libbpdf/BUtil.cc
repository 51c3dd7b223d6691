#include <bpdf/BUtil.hh>

#include <bpdf/BPDFCryptoProvider.hh>
#include <bpdf/BPDFExc.hh>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <locale>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <unistd.h>

namespace
{
    class FileCloser
    {
      public:
        FileCloser(FILE* f) :
            f(f)
        {
        }

        ~FileCloser()
        {
            if (f) {
                fclose(f);
            }
        }

        FILE* f;
    };
} // namespace

// PDFDocEncoding differs from Latin-1 in 0x18-0x1f and 0x7f-0xa0. 0x7f, 0x9f and 0xad are
// undefined.
static std::map<unsigned char, unsigned long> const pdf_doc_specials = {
    {0x18, 0x02d8}, {0x19, 0x02c7}, {0x1a, 0x02c6}, {0x1b, 0x02d9}, {0x1c, 0x02dd},
    {0x1d, 0x02db}, {0x1e, 0x02da}, {0x1f, 0x02dc}, {0x7f, 0xfffd}, {0x80, 0x2022},
    {0x81, 0x2020}, {0x82, 0x2021}, {0x83, 0x2026}, {0x84, 0x2014}, {0x85, 0x2013},
    {0x86, 0x0192}, {0x87, 0x2044}, {0x88, 0x2039}, {0x89, 0x203a}, {0x8a, 0x2212},
    {0x8b, 0x2030}, {0x8c, 0x201e}, {0x8d, 0x201c}, {0x8e, 0x201d}, {0x8f, 0x2018},
    {0x90, 0x2019}, {0x91, 0x201a}, {0x92, 0x2122}, {0x93, 0xfb01}, {0x94, 0xfb02},
    {0x95, 0x0141}, {0x96, 0x0152}, {0x97, 0x0160}, {0x98, 0x0178}, {0x99, 0x017d},
    {0x9a, 0x0131}, {0x9b, 0x0142}, {0x9c, 0x0153}, {0x9d, 0x0161}, {0x9e, 0x017e},
    {0x9f, 0xfffd}, {0xa0, 0x20ac}, {0xad, 0xfffd},
};

static unsigned long const replacement_char = 0xfffd;

std::string
BUtil::int_to_string(long long num, int length)
{
    // Positive lengths pad with leading zeroes after the sign; negative lengths pad on the right
    // with spaces.
    auto digits = std::to_string(num);
    auto width = static_cast<size_t>(length < 0 ? -length : length);
    if (digits.size() >= width) {
        return digits;
    }
    auto pad = width - digits.size();
    if (length < 0) {
        return digits + std::string(pad, ' ');
    }
    auto sign = (num < 0) ? 1U : 0U;
    return digits.substr(0, sign) + std::string(pad, '0') + digits.substr(sign);
}

std::string
BUtil::double_to_string(double num, int decimal_places, bool trim_trailing_zeroes)
{
    std::ostringstream buf;
    buf.imbue(std::locale::classic());
    buf << std::fixed << std::setprecision(decimal_places > 0 ? decimal_places : 6) << num;
    auto result = buf.str();
    if (trim_trailing_zeroes && result.find('.') != std::string::npos) {
        result.erase(result.find_last_not_of('0') + 1);
        if (result.back() == '.') {
            result.pop_back();
        }
    }
    if (result == "-0") {
        return "0";
    }
    return result;
}

long long
BUtil::string_to_ll(char const* str)
{
    errno = 0;
    long long result = strtoll(str, nullptr, 10);
    if (errno == ERANGE) {
        throw std::range_error(
            std::string("overflow/underflow converting ") + str + " to 64-bit integer");
    }
    return result;
}

int
BUtil::string_to_int(char const* str)
{
    long long result = string_to_ll(str);
    if (result < INT_MIN || result > INT_MAX) {
        throw std::range_error(std::string("overflow/underflow converting ") + str + " to int");
    }
    return static_cast<int>(result);
}

bool
BUtil::is_long_long(char const* str)
{
    try {
        auto i1 = string_to_ll(str);
        std::string s1 = int_to_string(i1);
        return str == s1;
    } catch (std::range_error&) {
        return false;
    }
}

bool
BUtil::is_number(char const* p)
{
    std::string_view str(p);
    if (!str.empty() && (str.front() == '+' || str.front() == '-')) {
        str.remove_prefix(1);
    }
    auto dot = str.find('.');
    if (dot != std::string_view::npos && str.find('.', dot + 1) != std::string_view::npos) {
        return false;
    }
    bool digits = false;
    for (char c: str) {
        if (is_digit(c)) {
            digits = true;
        } else if (c != '.') {
            return false;
        }
    }
    return digits;
}

void
BUtil::throw_system_error(std::string const& description)
{
    throw BPDFExc(bpdf_e_system, "", "", 0, description + ": " + strerror(errno));
}

int
BUtil::os_wrapper(std::string const& description, int status)
{
    if (status == -1) {
        throw_system_error(description);
    }
    return status;
}

FILE*
BUtil::safe_fopen(char const* filename, char const* mode)
{
    FILE* f = fopen(filename, mode);
    if (f == nullptr) {
        throw_system_error(std::string("open ") + filename);
    }
    return f;
}

bool
BUtil::file_can_be_opened(char const* filename)
{
    FILE* f = fopen(filename, "rb");
    if (f == nullptr) {
        return false;
    }
    fclose(f);
    return true;
}

void
BUtil::remove_file(char const* path)
{
    os_wrapper(std::string("remove ") + path, unlink(path));
}

void
BUtil::rename_file(char const* oldname, char const* newname)
{
    os_wrapper(std::string("rename ") + oldname + " " + newname, rename(oldname, newname));
}

std::string
BUtil::path_basename(std::string const& filename)
{
    auto end = filename.find_last_not_of('/');
    if (end == std::string::npos) {
        return filename.empty() ? filename : "/";
    }
    auto start = filename.find_last_of('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return filename.substr(start, end + 1 - start);
}

std::string
BUtil::path_dirname(std::string const& filename)
{
    auto pos = filename.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return filename.substr(0, pos);
}

std::pair<std::string, std::string>
BUtil::split_extension(std::string const& filename)
{
    auto slash = filename.find_last_of('/');
    auto dot = filename.find_last_of('.');
    if ((dot == std::string::npos) || (dot == 0) ||
        ((slash != std::string::npos) && (dot <= slash + 1))) {
        return {filename, ""};
    }
    return {filename.substr(0, dot), filename.substr(dot)};
}

std::string
BUtil::read_file_into_string(char const* filename)
{
    FILE* f = safe_fopen(filename, "rb");
    FileCloser fc(f);
    std::string result;
    char buf[8192];
    size_t len = 0;
    while ((len = fread(buf, 1, sizeof(buf), f)) > 0) {
        result.append(buf, len);
    }
    if (ferror(f)) {
        throw_system_error(std::string("read ") + filename);
    }
    return result;
}

void
BUtil::write_string_to_file(char const* filename, std::string const& data)
{
    FILE* f = safe_fopen(filename, "wb");
    FileCloser fc(f);
    if (fwrite(data.data(), 1, data.size(), f) != data.size()) {
        throw_system_error(std::string("write ") + filename);
    }
    fc.f = nullptr;
    os_wrapper(std::string("close ") + filename, fclose(f) == 0 ? 0 : -1);
}

std::string
BUtil::hex_encode(std::string const& input)
{
    std::string result;
    result.reserve(2 * input.size());
    for (char c: input) {
        auto byte = static_cast<unsigned char>(c);
        result += "0123456789abcdef"[byte >> 4];
        result += "0123456789abcdef"[byte & 0xf];
    }
    return result;
}

std::string
BUtil::hex_decode(std::string const& input)
{
    std::string nibbles;
    for (char c: input) {
        if (is_hex_digit(c)) {
            nibbles += hex_decode_char(c);
        }
    }
    if (nibbles.size() % 2) {
        nibbles += '\0';
    }
    std::string result;
    result.reserve(nibbles.size() / 2);
    for (size_t i = 0; i < nibbles.size(); i += 2) {
        result += static_cast<char>((nibbles[i] << 4) | nibbles[i + 1]);
    }
    return result;
}

std::string
BUtil::getWhoami(std::string const& argv0)
{
    auto name = path_basename(argv0);
    // libtool wrappers run the real program as lt-<name>
    return name.compare(0, 3, "lt-") == 0 ? name.substr(3) : name;
}

BUtil::BPDFTime
BUtil::get_current_bpdf_time()
{
    auto now = time(nullptr);
    struct tm local = {};
    if (localtime_r(&now, &local) == nullptr) {
        throw_system_error("localtime_r");
    }
    // tm_gmtoff is seconds east of UTC; tz_delta counts minutes west.
    return BPDFTime(
        local.tm_year + 1900,
        local.tm_mon + 1,
        local.tm_mday,
        local.tm_hour,
        local.tm_min,
        local.tm_sec,
        static_cast<int>(-local.tm_gmtoff / 60));
}

std::string
BUtil::bpdf_time_to_pdf_time(BPDFTime const& qtm)
{
    std::string tz_offset;
    int t = qtm.tz_delta;
    if (t == 0) {
        tz_offset = "Z";
    } else {
        if (t < 0) {
            t = -t;
            tz_offset += "+";
        } else {
            tz_offset += "-";
        }
        tz_offset += int_to_string(t / 60, 2) + "'" + int_to_string(t % 60, 2) + "'";
    }
    return (
        "D:" + int_to_string(qtm.year, 4) + int_to_string(qtm.month, 2) +
        int_to_string(qtm.day, 2) + int_to_string(qtm.hour, 2) + int_to_string(qtm.minute, 2) +
        int_to_string(qtm.second, 2) + tz_offset);
}

static void
append_utf8(std::string& out, unsigned long cp)
{
    if (cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
        cp = replacement_char;
    }
    auto byte = [&out](unsigned long v) { out += static_cast<char>(v & 0xff); };
    if (cp < 0x80) {
        byte(cp);
    } else if (cp < 0x800) {
        byte(0xc0 | (cp >> 6));
        byte(0x80 | (cp & 0x3f));
    } else if (cp < 0x10000) {
        byte(0xe0 | (cp >> 12));
        byte(0x80 | ((cp >> 6) & 0x3f));
        byte(0x80 | (cp & 0x3f));
    } else {
        byte(0xf0 | (cp >> 18));
        byte(0x80 | ((cp >> 12) & 0x3f));
        byte(0x80 | ((cp >> 6) & 0x3f));
        byte(0x80 | (cp & 0x3f));
    }
}

static void
append_utf16be(std::string& out, unsigned long cp)
{
    if (cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
        cp = replacement_char;
    }
    auto unit = [&out](unsigned long v) {
        out += static_cast<char>((v >> 8) & 0xff);
        out += static_cast<char>(v & 0xff);
    };
    if (cp < 0x10000) {
        unit(cp);
    } else {
        cp -= 0x10000;
        unit(0xd800 | (cp >> 10));
        unit(0xdc00 | (cp & 0x3ff));
    }
}

// Decode one code point starting at pos and advance pos past it. Malformed sequences consume one
// byte and yield U+FFFD with error set.
static unsigned long
next_utf8(std::string const& in, size_t& pos, bool& error)
{
    auto lead = static_cast<unsigned char>(in.at(pos++));
    error = false;
    if (lead < 0x80) {
        return lead;
    }
    size_t extra = 0;
    unsigned long cp = 0;
    unsigned long min = 0;
    if ((lead & 0xe0) == 0xc0) {
        extra = 1;
        cp = lead & 0x1fU;
        min = 0x80;
    } else if ((lead & 0xf0) == 0xe0) {
        extra = 2;
        cp = lead & 0x0fU;
        min = 0x800;
    } else if ((lead & 0xf8) == 0xf0) {
        extra = 3;
        cp = lead & 0x07U;
        min = 0x10000;
    } else {
        error = true;
        return replacement_char;
    }
    if (pos + extra > in.size()) {
        error = true;
        return replacement_char;
    }
    for (size_t i = 0; i < extra; ++i) {
        auto c = static_cast<unsigned char>(in.at(pos + i));
        if ((c & 0xc0) != 0x80) {
            error = true;
            return replacement_char;
        }
        cp = (cp << 6) | (c & 0x3fU);
    }
    pos += extra;
    if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
        error = true;
        return replacement_char;
    }
    return cp;
}

std::string
BUtil::utf8_to_utf16(std::string const& utf8)
{
    std::string result = "\xfe\xff";
    bool error = false;
    for (size_t pos = 0; pos < utf8.size();) {
        append_utf16be(result, next_utf8(utf8, pos, error));
    }
    return result;
}

bool
BUtil::utf8_to_pdf_doc(std::string const& utf8, std::string& pdfdoc, char unknown_char)
{
    static auto const reverse = [] {
        std::map<unsigned long, char> m;
        for (auto const& [byte, cp]: pdf_doc_specials) {
            if (cp != replacement_char) {
                m[cp] = static_cast<char>(byte);
            }
        }
        return m;
    }();

    bool okay = true;
    pdfdoc.clear();
    bool error = false;
    for (size_t pos = 0; pos < utf8.size();) {
        auto cp = next_utf8(utf8, pos, error);
        bool direct = (cp < 0x100) && !pdf_doc_specials.count(static_cast<unsigned char>(cp)) &&
            (cp >= 0x20 || cp == '\t' || cp == '\n' || cp == '\r');
        if (error) {
            okay = false;
            pdfdoc += unknown_char;
        } else if (direct) {
            pdfdoc += static_cast<char>(cp);
        } else if (auto it = reverse.find(cp); it != reverse.end()) {
            pdfdoc += it->second;
        } else {
            okay = false;
            pdfdoc += unknown_char;
        }
    }
    return okay;
}

bool
BUtil::is_utf16(std::string const& val)
{
    return val.size() >= 2 &&
        ((val[0] == '\xfe' && val[1] == '\xff') || (val[0] == '\xff' && val[1] == '\xfe'));
}

std::string
BUtil::utf16_to_utf8(std::string const& val)
{
    bool little_endian = is_utf16(val) && val[0] == '\xff';
    size_t pos = is_utf16(val) ? 2 : 0;
    auto unit_at = [&val, little_endian](size_t i) {
        auto hi = static_cast<unsigned char>(val[little_endian ? i + 1 : i]);
        auto lo = static_cast<unsigned char>(val[little_endian ? i : i + 1]);
        return (static_cast<unsigned long>(hi) << 8) | lo;
    };

    std::string result;
    // A trailing odd byte is dropped.
    while (pos + 1 < val.size()) {
        auto unit = unit_at(pos);
        pos += 2;
        if (unit >= 0xd800 && unit < 0xdc00 && pos + 1 < val.size()) {
            auto low = unit_at(pos);
            if (low >= 0xdc00 && low < 0xe000) {
                pos += 2;
                append_utf8(result, 0x10000 + ((unit - 0xd800) << 10) + (low - 0xdc00));
                continue;
            }
        }
        append_utf8(result, unit);
    }
    return result;
}

std::string
BUtil::pdf_doc_to_utf8(std::string const& val)
{
    std::string result;
    for (char c: val) {
        auto byte = static_cast<unsigned char>(c);
        auto it = pdf_doc_specials.find(byte);
        append_utf8(result, it == pdf_doc_specials.end() ? byte : it->second);
    }
    return result;
}

namespace
{
    // One end of a range item: digits, "z" for the last page, or "rN" for the Nth page from the
    // end.
    int
    range_endpoint(std::string item, int max)
    {
        auto begin = item.find_first_not_of(' ');
        auto end = item.find_last_not_of(' ');
        if (begin == std::string::npos) {
            throw std::runtime_error("number expected");
        }
        item = item.substr(begin, end - begin + 1);
        if (item == "z") {
            return max;
        }
        bool from_end = item.at(0) == 'r';
        auto digits = from_end ? item.substr(1) : item;
        if (digits.empty() || digits.size() > 9 ||
            digits.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("invalid page number \"" + item + "\"");
        }
        int n = std::atoi(digits.c_str());
        if (from_end) {
            n = (n > max) ? 0 : max + 1 - n;
        }
        // A max of zero only checks the syntax.
        if (max > 0 && (n < 1 || n > max)) {
            throw std::runtime_error("number " + std::to_string(n) + " out of range");
        }
        return n;
    }
} // namespace

std::vector<int>
BUtil::parse_numrange(char const* range, int max)
{
    std::string spec(range);
    std::vector<int> result;
    try {
        size_t first = 0;
        size_t step = 1;
        auto colon = spec.find(':');
        if (colon != std::string::npos) {
            auto parity = spec.substr(colon + 1);
            if (parity == "even") {
                first = 1;
                step = 2;
            } else if (parity == "odd") {
                step = 2;
            } else {
                throw std::runtime_error("unknown modifier \":" + parity + "\"");
            }
            spec.erase(colon);
        }
        for (auto const& item: split_string(spec, ',')) {
            auto dash = item.find('-');
            if (dash == std::string::npos) {
                result.push_back(range_endpoint(item, max));
                continue;
            }
            int low = range_endpoint(item.substr(0, dash), max);
            int high = range_endpoint(item.substr(dash + 1), max);
            for (int i = low;; i += (low <= high) ? 1 : -1) {
                result.push_back(i);
                if (i == high) {
                    break;
                }
            }
        }
        if (step > 1) {
            std::vector<int> selected;
            for (size_t i = first; i < result.size(); i += step) {
                selected.push_back(result.at(i));
            }
            result = selected;
        }
    } catch (std::runtime_error const& e) {
        throw std::runtime_error("error in numeric range " + std::string(range) + ": " + e.what());
    }
    return result;
}

std::vector<std::string>
BUtil::split_string(std::string const& str, char sep)
{
    std::vector<std::string> result;
    size_t start = 0;
    while (true) {
        auto pos = str.find(sep, start);
        if (pos == std::string::npos) {
            result.push_back(str.substr(start));
            break;
        }
        result.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return result;
}

void
BUtil::initializeWithRandomBytes(unsigned char* data, size_t len)
{
    BPDFCryptoProvider::getImpl()->provideRandomData(data, len);
}
