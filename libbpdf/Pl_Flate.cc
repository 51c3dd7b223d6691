#include <bpdf/Pl_Flate.hh>

#include <algorithm>
#include <climits>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace
{
    unsigned int constexpr out_size = 65536;
} // namespace

struct Pl_Flate::Stream
{
    z_stream z{};
    unsigned char out[out_size];
};

Pl_Flate::Pl_Flate(char const* identifier, Pipeline* next, action_e action, int level) :
    Pipeline(identifier, next),
    stream(std::make_unique<Stream>()),
    action(action),
    level(level)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_Flate with nullptr as next");
    }
}

Pl_Flate::~Pl_Flate()
{
    end();
}

void
Pl_Flate::start()
{
    if (started) {
        return;
    }
    auto& z = stream->z;
    z.next_out = stream->out;
    z.avail_out = out_size;
    int code = Z_OK;
    // deflateInit and inflateInit are macros that use old-style casts.
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    if (action == a_deflate) {
        code = deflateInit(&z, level);
    } else {
        code = inflateInit(&z);
    }
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic pop
#endif
    check("init", code);
    started = true;
}

int
Pl_Flate::end()
{
    if (!started) {
        return Z_OK;
    }
    started = false;
    return action == a_deflate ? deflateEnd(&stream->z) : inflateEnd(&stream->z);
}

void
Pl_Flate::write(unsigned char const* data, size_t len)
{
    if (finished) {
        throw std::logic_error(identifier + ": Pl_Flate: write() called after finish()");
    }
    start();
    auto& z = stream->z;
    while (len > 0) {
        auto piece = std::min(len, static_cast<size_t>(UINT_MAX));
        // zlib doesn't modify next_in but only declares it const when built with ZLIB_CONST.
        z.next_in = const_cast<unsigned char*>(data);
        z.avail_in = static_cast<unsigned int>(piece);
        run(action == a_inflate ? Z_SYNC_FLUSH : Z_NO_FLUSH);
        data += piece;
        len -= piece;
    }
}

void
Pl_Flate::run(int flush)
{
    auto& z = stream->z;
    while (true) {
        int code = action == a_deflate ? deflate(&z, flush) : inflate(&z, flush);
        if (action == a_inflate && code == Z_DATA_ERROR && z.msg &&
            strcmp(z.msg, "incorrect data check") == 0) {
            code = Z_STREAM_END;
        }
        if (code != Z_OK && code != Z_STREAM_END && code != Z_BUF_ERROR) {
            check("data", code);
        }
        unsigned int ready = out_size - z.avail_out;
        if (ready > 0) {
            next()->write(stream->out, ready);
            z.next_out = stream->out;
            z.avail_out = out_size;
        }
        // Z_BUF_ERROR means zlib could make no progress, which is how truncated input ends.
        if (code == Z_STREAM_END || code == Z_BUF_ERROR || (z.avail_in == 0 && ready < out_size)) {
            return;
        }
    }
}

void
Pl_Flate::finish()
{
    if (!finished) {
        finished = true;
        // Deflating nothing still gives a valid, empty zlib stream.
        if (started || action == a_deflate) {
            start();
            stream->z.next_in = nullptr;
            stream->z.avail_in = 0;
            run(Z_FINISH);
            check("end", end());
        }
    }
    next()->finish();
}

void
Pl_Flate::check(char const* where, int code)
{
    if (code == Z_OK) {
        return;
    }
    std::string msg = identifier + ": " + (action == a_deflate ? "deflate " : "inflate ") + where +
        ": " + (stream->z.msg ? stream->z.msg : zError(code));
    throw std::runtime_error(msg);
}
