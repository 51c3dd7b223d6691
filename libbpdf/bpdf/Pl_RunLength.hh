#ifndef PL_RUNLENGTH_HH
#define PL_RUNLENGTH_HH

#include <bpdf/Pipeline.hh>

// RunLengthDecode (ISO 32000-1 7.4.5). A length byte of 0-127 is followed by that many plus one
// literal bytes. 129-255 is followed by one byte to repeat 257 minus the length times. 128 ends
// the data.
class Pl_RunLength final: public Pipeline
{
  public:
    Pl_RunLength(char const* identifier, Pipeline* next);

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

  private:
    // Literal bytes still to copy, or the repeat count while waiting for the byte to repeat
    unsigned int count{0};
    bool repeat{false};
    bool done{false};
};

#endif // PL_RUNLENGTH_HH
