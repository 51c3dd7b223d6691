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

#ifndef BUTIL_HH
#define BUTIL_HH

#include <bpdf/DLL.h>
#include <bpdf/Types.h>

#include <cstdio>
#include <string>
#include <vector>

namespace BUtil
{
    // This is a collection of useful utility functions that don't really go anywhere else.
    BPDF_DLL
    std::string int_to_string(long long, int length = 0);
    // If decimal_places <= 0, it is replaced by 6. Trailing zeroes and a trailing decimal point
    // are removed if trim_trailing_zeroes is true.
    BPDF_DLL
    std::string double_to_string(double, int decimal_places = 0, bool trim_trailing_zeroes = true);

    // These functions convert strings to numeric types and throw an exception on overflow.
    BPDF_DLL
    long long string_to_ll(char const* str);
    BPDF_DLL
    int string_to_int(char const* str);
    // Returns true iff str is the canonical text form of a long long
    BPDF_DLL
    bool is_long_long(char const* str);
    // Returns true iff str is an optionally signed decimal number with an optional fraction
    BPDF_DLL
    bool is_number(char const* str);

    // Throw BPDFExc with bpdf_e_system, including the errno description
    BPDF_DLL
    void throw_system_error(std::string const& description);

    // The status argument is assumed to be the return value of a standard library call that sets
    // errno when it fails. If status is -1, convert the current value of errno to an exception.
    BPDF_DLL
    int os_wrapper(std::string const& description, int status);

    // If the open fails, throws an exception. Otherwise, the FILE* is returned.
    BPDF_DLL
    FILE* safe_fopen(char const* filename, char const* mode);

    // Returns true iff the file exists and can be opened for reading
    BPDF_DLL
    bool file_can_be_opened(char const* filename);

    BPDF_DLL
    void remove_file(char const* path);

    // rename_file replaces newname if it exists. On POSIX systems the replacement is atomic.
    BPDF_DLL
    void rename_file(char const* oldname, char const* newname);

    BPDF_DLL
    std::string path_basename(std::string const& filename);
    // Returns "." if filename has no directory part
    BPDF_DLL
    std::string path_dirname(std::string const& filename);
    // Splits "dir/name.pdf" into "dir/name" and ".pdf". The extension is empty if there is none.
    BPDF_DLL
    std::pair<std::string, std::string> split_extension(std::string const& filename);

    BPDF_DLL
    std::string read_file_into_string(char const* filename);
    BPDF_DLL
    void write_string_to_file(char const* filename, std::string const& data);

    BPDF_DLL
    std::string hex_encode(std::string const&);
    // Ignores non-hex characters; an odd trailing nibble is treated as followed by 0
    BPDF_DLL
    std::string hex_decode(std::string const&);

    // Program name from argv[0] without directories or a libtool "lt-" prefix
    BPDF_DLL
    std::string getWhoami(std::string const& argv0);

    struct BPDFTime
    {
        BPDFTime() = default;
        BPDFTime(
            int year, int month, int day, int hour, int minute, int second, int tz_delta) :
            year(year),
            month(month),
            day(day),
            hour(hour),
            minute(minute),
            second(second),
            tz_delta(tz_delta)
        {
        }
        int year{0};
        int month{0}; // 1-12
        int day{0};
        int hour{0};
        int minute{0};
        int second{0};
        int tz_delta{0}; // minutes before UTC
    };

    BPDF_DLL
    BPDFTime get_current_bpdf_time();

    // Convert a BPDFTime structure to a PDF timestamp string, "D:yyyymmddhhmmss<z>"
    BPDF_DLL
    std::string bpdf_time_to_pdf_time(BPDFTime const&);

    // Text strings in PDF are either PDFDocEncoding or UTF-16 with a byte order mark. Invalid
    // UTF-8 input and unpaired surrogates become U+FFFD.
    // Convert a UTF-8 string to UTF-16 big-endian with a byte order mark
    BPDF_DLL
    std::string utf8_to_utf16(std::string const& utf8);
    // Convert a UTF-8 string to PDFDocEncoding. Returns false if any character could not be
    // represented; such characters are replaced by unknown_char.
    BPDF_DLL
    bool utf8_to_pdf_doc(std::string const& utf8, std::string& pdfdoc, char unknown_char = '?');

    // Test whether this is a UTF-16 string, indicated by a byte order mark
    BPDF_DLL
    bool is_utf16(std::string const&);
    BPDF_DLL
    std::string utf16_to_utf8(std::string const&);
    BPDF_DLL
    std::string pdf_doc_to_utf8(std::string const&);

    // This parses a numeric range such as "1-5,9,12-z,r3" with "z" meaning the last page and
    // "rN" meaning the Nth page from the end. A trailing ":odd" or ":even" selects alternate
    // entries. Throws std::runtime_error for syntax errors or numbers out of range.
    BPDF_DLL
    std::vector<int> parse_numrange(char const* range, int max);

    // Split on a separator character. Empty fields are kept.
    BPDF_DLL
    std::vector<std::string> split_string(std::string const& str, char sep);

    BPDF_DLL
    void initializeWithRandomBytes(unsigned char* data, size_t len);

    inline bool is_hex_digit(char);
    inline bool is_space(char);
    inline bool is_digit(char);
    inline bool is_delimiter(char);
    inline char hex_decode_char(char);
}; // namespace BUtil

inline bool
BUtil::is_hex_digit(char ch)
{
    return hex_decode_char(ch) < '\20';
}

inline bool
BUtil::is_space(char ch)
{
    return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == '\f' || ch == '\v' ||
        ch == '\0';
}

inline bool
BUtil::is_digit(char ch)
{
    return ((ch >= '0') && (ch <= '9'));
}

inline bool
BUtil::is_delimiter(char ch)
{
    return ch == '(' || ch == ')' || ch == '<' || ch == '>' || ch == '[' || ch == ']' ||
        ch == '{' || ch == '}' || ch == '/' || ch == '%';
}

inline char
BUtil::hex_decode_char(char digit)
{
    return digit <= '9' && digit >= '0'
        ? char(digit - '0')
        : (digit >= 'a' ? char(digit - 'a' + 10)
                        : (digit >= 'A' ? char(digit - 'A' + 10) : '\20'));
}

#endif // BUTIL_HH
