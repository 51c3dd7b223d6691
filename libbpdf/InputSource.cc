#include <bpdf/InputSource.hh>

#include <algorithm>

std::string
InputSource::read(size_t count, bpdf_offset_t at)
{
    if (at >= 0) {
        seek(at, SEEK_SET);
    }
    std::string data(count, '\0');
    data.resize(read(data.data(), count));
    return data;
}

bpdf_offset_t
InputSource::skipLine()
{
    char buf[4096];
    while (true) {
        auto start = tell();
        auto len = read(buf, sizeof(buf));
        if (len == 0) {
            return tell();
        }
        auto end = buf + len;
        auto eol = std::find_if(buf, end, [](char c) { return c == '\r' || c == '\n'; });
        if (eol == end) {
            continue;
        }
        auto after = std::find_if(eol, end, [](char c) { return c != '\r' && c != '\n'; });
        if (after == end) {
            // The marker may continue into the next block.
            char ch = '\0';
            while (read(&ch, 1) == 1) {
                if (ch != '\r' && ch != '\n') {
                    unreadCh(ch);
                    break;
                }
            }
        } else {
            seek(start + (after - buf), SEEK_SET);
        }
        return start + (eol - buf);
    }
}

std::string
InputSource::readLine(size_t max_line_length)
{
    auto start = tell();
    auto line = read(max_line_length);
    seek(start, SEEK_SET);
    auto eol = skipLine();
    last_offset = start;
    line.resize(std::min(line.size(), static_cast<size_t>(eol - start)));
    return line;
}

bpdf_offset_t
InputSource::getSize()
{
    auto here = tell();
    seek(0, SEEK_END);
    auto size = tell();
    seek(here, SEEK_SET);
    return size;
}
