// ============================================================================
//  File: src/byte_source.cpp — MemorySource / FileSource (pread)
// ============================================================================

#include "pxld/byte_source.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pxld
{

bool MemorySource::read_at(uint64_t offset, void* dst, size_t n, PxldError* err) const
{
    if(offset > bytes_.size() || n > bytes_.size() - offset)
        return fail(err, FormatError::TruncatedFile,
                    "read past end of buffer at offset " + std::to_string(offset));
    if(n) std::memcpy(dst, bytes_.data() + offset, n);
    return true;
}

FileSource::~FileSource()
{
    close();
}

bool FileSource::open(const std::string& path, PxldError* err)
{
    close();
    int fd = ::open(path.c_str(), O_RDONLY);
    if(fd < 0) return fail(err, FormatError::IoError, path + ": " + std::strerror(errno));
    struct stat st{};
    if(::fstat(fd, &st) != 0)
    {
        int e = errno;
        ::close(fd);
        return fail(err, FormatError::IoError, path + ": " + std::strerror(e));
    }
    fd_ = fd;
    size_ = (uint64_t)st.st_size;
    path_ = path;
    return true;
}

void FileSource::close()
{
    if(fd_ >= 0) ::close(fd_);
    fd_ = -1;
    size_ = 0;
}

bool FileSource::read_at(uint64_t offset, void* dst, size_t n, PxldError* err) const
{
    if(fd_ < 0) return fail(err, FormatError::IoError, "file not open");
    if(offset > size_ || n > size_ - offset)
        return fail(err, FormatError::TruncatedFile,
                    path_ + ": read past EOF at offset " + std::to_string(offset));
    uint8_t* p = (uint8_t*)dst;
    size_t done = 0;
    while(done < n)
    {
        ssize_t r = ::pread(fd_, p + done, n - done, (off_t)(offset + done));
        if(r < 0)
        {
            if(errno == EINTR) continue;
            return fail(err, FormatError::IoError, path_ + ": " + std::strerror(errno));
        }
        if(r == 0)
            return fail(err, FormatError::TruncatedFile, path_ + ": unexpected EOF");
        done += (size_t)r;
    }
    return true;
}

bool read_whole_file(const std::string& path, std::vector<uint8_t>& out, PxldError* err)
{
    FileSource src;
    if(!src.open(path, err)) return false;
    out.resize((size_t)src.size());
    return out.empty() || src.read_at(0, out.data(), out.size(), err);
}

} // namespace pxld
