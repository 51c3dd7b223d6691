#ifndef BPDFTOKENIZER_HH
#define BPDFTOKENIZER_HH

#include <bpdf/InputSource.hh>

#include <string>

class BPDFTokenizer
{
  public:
    // Token type tt_eof is only returned if allowEOF() is called on the tokenizer.
    // tt_inline_image is only returned after expectInlineImage().
    enum token_type_e {
        tt_bad,
        tt_array_close,
        tt_array_open,
        tt_brace_close,
        tt_brace_open,
        tt_dict_close,
        tt_dict_open,
        tt_integer,
        tt_name,
        tt_real,
        tt_string,
        tt_null,
        tt_bool,
        tt_word,
        tt_eof,
        tt_inline_image,
    };

    class Token
    {
      public:
        Token() = default;
        Token(token_type_e type, std::string value, std::string error_message = "") :
            type(type),
            value(std::move(value)),
            error_message(std::move(error_message))
        {
        }
        token_type_e
        getType() const
        {
            return type;
        }
        // For names, the value has no leading slash and #xx escapes are resolved. For strings,
        // the value is the decoded string.
        std::string const&
        getValue() const
        {
            return value;
        }
        std::string const&
        getErrorMessage() const
        {
            return error_message;
        }
        bool
        operator==(Token const& rhs) const
        {
            // Ignore fields other than type and value
            return type != tt_bad && type == rhs.type && value == rhs.value;
        }
        bool
        isInteger() const
        {
            return type == tt_integer;
        }
        bool
        isWord() const
        {
            return type == tt_word;
        }
        bool
        isWord(std::string const& word) const
        {
            return type == tt_word && value == word;
        }

      private:
        token_type_e type{tt_bad};
        std::string value;
        std::string error_message;
    };

    BPDFTokenizer() = default;

    // Treat EOF as a separate token type instead of an error.
    void allowEOF();

    // Read the next token. After the call, input.getLastOffset() is the offset of the first
    // character of the token. A tt_bad token is returned for syntax errors; the error message
    // describes the problem.
    Token readToken(InputSource& input, std::string const& context);

    // The next call to readToken returns the data of an inline image: everything following the
    // single whitespace character after ID up to the whitespace preceding a delimited EI. The
    // input is left positioned at EI.
    void expectInlineImage();

  private:
    bool skipSpaceAndComments(InputSource& input);
    Token readLiteralString(InputSource& input);
    Token readHexString(InputSource& input);
    Token readName(InputSource& input);
    Token readRegular(InputSource& input, char first);
    Token readInlineImage(InputSource& input);

    bool allow_eof{false};
    bool inline_image_expected{false};
};

#endif // BPDFTOKENIZER_HH
