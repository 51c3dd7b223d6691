#include <bpdf/FileInputSource.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BUtil.hh>

FileInputSource::FileInputSource(std::string const& filename) :
    filename(filename),
    file(BUtil::safe_fopen(filename.c_str(), "rb"))
{
}

FileInputSource::~FileInputSource()
{
    fclose(file);
}

std::string const&
FileInputSource::getName() const
{
    return filename;
}

bpdf_offset_t
FileInputSource::tell()
{
    return static_cast<bpdf_offset_t>(ftello(file));
}

void
FileInputSource::seek(bpdf_offset_t offset, int whence)
{
    BUtil::os_wrapper(
        filename + ": seek to offset " + std::to_string(offset),
        fseeko(file, static_cast<off_t>(offset), whence));
}

size_t
FileInputSource::read(char* buffer, size_t length)
{
    last_offset = tell();
    auto len = fread(buffer, 1, length, file);
    if (len < length && ferror(file)) {
        throw BPDFExc(
            bpdf_e_system, filename, "", last_offset, "read of " + std::to_string(length) +
            " bytes failed");
    }
    if (len == 0 && length > 0) {
        // At end of file, report errors against the file's size.
        seek(0, SEEK_END);
        last_offset = tell();
    }
    return len;
}

void
FileInputSource::unreadCh(char ch)
{
    if (ungetc(static_cast<unsigned char>(ch), file) == EOF) {
        BUtil::throw_system_error(filename + ": unread character");
    }
}
