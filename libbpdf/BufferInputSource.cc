#include <bpdf/BufferInputSource.hh>

#include <algorithm>
#include <cstring>
#include <stdexcept>

BufferInputSource::BufferInputSource(std::string description, std::string contents) :
    description(std::move(description)),
    contents(std::move(contents))
{
}

std::string const&
BufferInputSource::getName() const
{
    return description;
}

bpdf_offset_t
BufferInputSource::tell()
{
    return pos;
}

size_t
BufferInputSource::remaining() const
{
    auto size = static_cast<bpdf_offset_t>(contents.size());
    return pos < size ? static_cast<size_t>(size - pos) : 0;
}

void
BufferInputSource::seek(bpdf_offset_t offset, int whence)
{
    bpdf_offset_t base = 0;
    if (whence == SEEK_CUR) {
        base = pos;
    } else if (whence == SEEK_END) {
        base = static_cast<bpdf_offset_t>(contents.size());
    } else if (whence != SEEK_SET) {
        throw std::logic_error("BufferInputSource::seek: invalid whence");
    }
    if (base + offset < 0) {
        throw std::runtime_error(description + ": seek before beginning of buffer");
    }
    pos = base + offset;
}

size_t
BufferInputSource::read(char* buffer, size_t length)
{
    auto len = std::min(length, remaining());
    last_offset = std::min(pos, static_cast<bpdf_offset_t>(contents.size()));
    if (len > 0) {
        memcpy(buffer, contents.data() + pos, len);
        pos += static_cast<bpdf_offset_t>(len);
    }
    return len;
}

void
BufferInputSource::unreadCh(char)
{
    if (pos > 0) {
        --pos;
    }
}
