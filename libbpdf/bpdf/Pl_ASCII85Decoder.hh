#ifndef PL_ASCII85DECODER_HH
#define PL_ASCII85DECODER_HH

#include <bpdf/Pipeline.hh>

#include <cstdint>

// ASCII85Decode. Input after the ~> marker is ignored.
class Pl_ASCII85Decoder final: public Pipeline
{
  public:
    Pl_ASCII85Decoder(char const* identifier, Pipeline* next);

    void write(unsigned char const* buf, size_t len) final;
    void finish() final;

  private:
    void emitGroup();

    uint64_t group{0};
    int digits{0};
    bool saw_tilde{false};
    bool done{false};
};

#endif // PL_ASCII85DECODER_HH
