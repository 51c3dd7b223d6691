#ifndef PL_ASCIIHEXDECODER_HH
#define PL_ASCIIHEXDECODER_HH

#include <bpdf/Pipeline.hh>

// ASCIIHexDecode. Whitespace is skipped and > ends the data. A final odd digit is treated as if
// followed by 0.
class Pl_ASCIIHexDecoder final: public Pipeline
{
  public:
    Pl_ASCIIHexDecoder(char const* identifier, Pipeline* next);

    void write(unsigned char const* buf, size_t len) final;
    void finish() final;

  private:
    void emitPending();

    int high_nibble{-1};
    bool done{false};
};

#endif // PL_ASCIIHEXDECODER_HH
