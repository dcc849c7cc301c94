#include <archive.h>
#include <archive_entry.h>

#include "diskxfer/util/finally.hh"
#include "diskxfer/util/serialise.hh"
#include "diskxfer/util/tarfile.hh"
#include "diskxfer/util/util.hh"

namespace diskxfer {

namespace {

int callback_open(struct archive *, void * self)
{
    return ARCHIVE_OK;
}

ssize_t callback_read(struct archive * archive, void * _self, const void ** buffer)
{
    auto self = (TarArchive *) _self;
    *buffer = self->buffer.data();

    try {
        return self->source->read((char *) self->buffer.data(), self->buffer.size());
    } catch (EndOfFile &) {
        return 0;
    } catch (std::exception & err) {
        archive_set_error(archive, EIO, "Source threw exception: %s", err.what());
        return -1;
    }
}

ssize_t callback_write(struct archive * archive, void * _self, const void * buffer, size_t length)
{
    auto self = (TarArchiveWriter *) _self;

    try {
        (*self->sink)({(const char *) buffer, length});
        return length;
    } catch (std::exception & err) {
        archive_set_error(archive, EIO, "Sink threw exception: %s", err.what());
        return -1;
    }
}

int callback_close(struct archive *, void * self)
{
    return ARCHIVE_OK;
}

const char * errorString(archive * archive)
{
    auto s = archive_error_string(archive);
    return s ? s : "unknown libarchive error";
}

void checkLibArchive(archive * archive, int err, const std::string & reason)
{
    if (err == ARCHIVE_EOF)
        throw EndOfFile("reached end of archive");
    else if (err != ARCHIVE_OK)
        throw SerialisationError(reason, errorString(archive));
}

constexpr auto defaultBufferSize = std::size_t{65536};

} // namespace

void TarArchive::check(int err, const std::string & reason)
{
    checkLibArchive(archive, err, reason);
}

TarArchive::TarArchive(Source & source)
    : archive{archive_read_new()}
    , source{&source}
    , buffer(defaultBufferSize)
{
    archive_read_support_format_tar(archive);
    check(
        archive_read_open(archive, (void *) this, callback_open, callback_read, callback_close),
        "failed to open archive (%s)");
}

struct archive_entry * TarArchive::nextEntry()
{
    struct archive_entry * entry;
    int r = archive_read_next_header(archive, &entry);
    if (r == ARCHIVE_EOF)
        return nullptr;
    if (r == ARCHIVE_WARN)
        warn(errorString(archive));
    else
        check(r, "failed to read archive member header (%s)");
    return entry;
}

size_t TarArchive::readData(char * data, size_t len)
{
    auto n = archive_read_data(archive, data, len);
    if (n < 0)
        throw SerialisationError("failed to read archive member (%s)", errorString(archive));
    return n;
}

void TarArchive::close()
{
    check(archive_read_close(this->archive), "failed to close archive (%s)");
}

TarArchive::~TarArchive()
{
    if (this->archive)
        archive_read_free(this->archive);
}

void TarArchiveWriter::check(int err, const std::string & reason)
{
    checkLibArchive(archive, err, reason);
}

TarArchiveWriter::TarArchiveWriter(Sink & sink)
    : archive{archive_write_new()}
    , sink{&sink}
{
    check(archive_write_set_format_ustar(archive), "failed to select ustar format (%s)");
    /* Hand every block to the sink straight away, and don't pad the
       last one out to a record. */
    check(archive_write_set_bytes_per_block(archive, 0), "failed to disable blocking (%s)");
    check(
        archive_write_open(archive, (void *) this, callback_open, callback_write, callback_close),
        "failed to open archive for writing (%s)");
}

void TarArchiveWriter::beginEntry(const std::string & name, uint64_t size, mode_t perm, time_t mtime)
{
    auto entry = archive_entry_new();
    Finally freeEntry([&]() { archive_entry_free(entry); });

    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, perm);
    archive_entry_set_uid(entry, 0);
    archive_entry_set_gid(entry, 0);
    archive_entry_set_size(entry, size);
    archive_entry_set_mtime(entry, mtime, 0);

    check(archive_write_header(archive, entry), "failed to write header of '" + name + "' (%s)");
}

void TarArchiveWriter::writeData(std::string_view data)
{
    while (!data.empty()) {
        auto n = archive_write_data(archive, data.data(), data.size());
        if (n < 0)
            throw SerialisationError("failed to write archive member (%s)", errorString(archive));
        if (n == 0)
            throw SerialisationError("archive member is larger than its header declares");
        data.remove_prefix(n);
    }
}

void TarArchiveWriter::finishEntry()
{
    check(archive_write_finish_entry(archive), "failed to finish archive member (%s)");
}

void TarArchiveWriter::close()
{
    check(archive_write_close(archive), "failed to close archive (%s)");
}

TarArchiveWriter::~TarArchiveWriter()
{
    if (this->archive)
        archive_write_free(this->archive);
}

} // namespace diskxfer
