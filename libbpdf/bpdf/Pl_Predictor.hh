#ifndef PL_PREDICTOR_HH
#define PL_PREDICTOR_HH

#include <bpdf/Pipeline.hh>

#include <vector>

// Reverses the /Predictor of a FlateDecode stream. Predictor 2 is TIFF horizontal differencing,
// which supports 8 and 16 bits per component. Predictors 10 and above are PNG filters, where each
// row begins with a byte giving that row's filter type.
class Pl_Predictor final: public Pipeline
{
  public:
    Pl_Predictor(
        char const* identifier,
        Pipeline* next,
        unsigned int predictor,
        unsigned int columns,
        unsigned int colors = 1,
        unsigned int bits_per_component = 8);

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

  private:
    void emitRow();
    void undoTIFF(unsigned char* row);
    void undoPNG(unsigned char type, unsigned char* row);

    bool png;
    bool wide_samples;
    size_t row_bytes;
    size_t pixel_bytes;
    std::vector<unsigned char> pending;
    std::vector<unsigned char> prior;
};

#endif // PL_PREDICTOR_HH
