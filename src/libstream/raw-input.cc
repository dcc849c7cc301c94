#include "diskxfer/stream/raw-input.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/util.hh"

#include <algorithm>
#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace diskxfer {

RawImage::RawImage(const Path & path)
    : path(path)
{
    fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening disk image '%1%'", path);

    struct stat st;
    if (fstat(fd.get(), &st) == -1)
        throw SysError("getting status of '%1%'", path);

    if (S_ISBLK(st.st_mode)) {
        auto end = lseek(fd.get(), 0, SEEK_END);
        if (end == -1)
            throw SysError("getting size of block device '%1%'", path);
        size = end;
    } else if (S_ISREG(st.st_mode))
        size = st.st_size;
    else
        throw UsageError("disk image '%1%' is neither a regular file nor a block device", path);

    if (size % sectorSize)
        throw FramingError("size of disk image '%1%' (%2% bytes) is not a multiple of %3%", path, size, sectorSize);
}

std::string RawImage::readSectors(uint64_t sector, uint64_t count)
{
    std::string buf(count * sectorSize, '\0');
    preadFull(fd.get(), buf.data(), buf.size(), sector * sectorSize);
    return buf;
}

std::vector<Extent> listExtents(Descriptor fd, uint64_t size)
{
    std::vector<Extent> extents;

    auto push = [&](uint64_t offset, uint64_t end, bool data) {
        if (end <= offset)
            return;
        if (!extents.empty() && extents.back().data == data)
            extents.back().length += end - offset;
        else
            extents.push_back({offset, end - offset, data});
    };

    uint64_t pos = 0;
    while (pos < size) {
        auto data = lseek(fd, pos, SEEK_DATA);
        if (data == -1) {
            if (errno == ENXIO) {
                /* Nothing but a hole up to the end. */
                push(pos, size, false);
                break;
            }
            if (errno == EINVAL || errno == ENOTSUP) {
                debug("file system does not report holes, treating all of it as data");
                push(pos, size, true);
                break;
            }
            throw SysError("seeking to data at offset %d", pos);
        }
        uint64_t dataStart = std::min<uint64_t>(data, size);
        push(pos, dataStart, false);

        auto hole = lseek(fd, dataStart, SEEK_HOLE);
        if (hole == -1)
            throw SysError("seeking to hole at offset %d", dataStart);
        uint64_t dataEnd = std::min<uint64_t>(hole, size);
        push(dataStart, dataEnd, true);
        pos = dataEnd;
    }

    return extents;
}

Stream rawImageStream(const Path & path)
{
    auto image = std::make_shared<RawImage>(path);

    std::vector<StreamElement> elements;
    for (auto & e : listExtents(image->fd.get(), image->size)) {
        /* Extents are normally block-aligned. If not, a sector that is
           partly allocated goes to the data side. */
        auto end = e.offset + e.length;
        if (e.data) {
            auto first = e.offset / sectorSize;
            auto last = (end + sectorSize - 1) / sectorSize;
            elements.push_back({CopyRun{image, first, last - first}});
        } else {
            auto first = (e.offset + sectorSize - 1) / sectorSize;
            auto last = end / sectorSize;
            if (last > first)
                elements.push_back({EmptyRun{last - first}});
        }
    }

    auto stream = Stream::fromElements(std::move(elements));
    debug(
        "disk image '%s': %s in total, %s allocated, %s empty",
        path,
        renderSize(stream.size.total),
        renderSize(stream.size.copy),
        renderSize(stream.size.empty));
    return stream;
}

Stream makeStream(const Path & source, std::string_view sourceFormat, std::string_view destinationFormat)
{
    static const StringSet knownFormats{"raw", "vhd", "hybrid"};

    for (auto & f : {sourceFormat, destinationFormat})
        if (!knownFormats.count(std::string(f)))
            throw UsageError("unknown disk format '%s'; known formats are: %s", f, concatStringsSep(", ", knownFormats));

    if (sourceFormat == "raw" && destinationFormat == "raw")
        return rawImageStream(source);

    throw UnsupportedError("converting from '%s' to '%s' is not implemented", sourceFormat, destinationFormat);
}

} // namespace diskxfer
