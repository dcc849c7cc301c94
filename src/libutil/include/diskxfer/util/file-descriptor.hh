#pragma once
///@file

#include "diskxfer/util/types.hh"
#include "diskxfer/util/error.hh"

#include <unistd.h>

namespace diskxfer {

struct Sink;
struct Source;

/**
 * Operating System capability
 */
using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const Path & path);

/**
 * Wrappers around read()/write() that read/write exactly the
 * requested number of bytes.
 */
void readFull(Descriptor fd, char * buf, size_t count);

void writeFull(Descriptor fd, std::string_view s);

/**
 * Write all of `s` at byte offset `offset`, without moving the file
 * position. Short writes are retried at the advanced offset.
 */
void pwriteFull(Descriptor fd, std::string_view s, uint64_t offset);

/**
 * Read exactly `count` bytes at byte offset `offset`. Hitting the end
 * of the file first throws `EndOfFile`.
 */
void preadFull(Descriptor fd, char * buf, size_t count, uint64_t offset);

/**
 * Read a file descriptor until EOF occurs.
 */
std::string drainFD(Descriptor fd);

[[gnu::always_inline]]
inline Descriptor getStandardOutput()
{
    return STDOUT_FILENO;
}

[[gnu::always_inline]]
inline Descriptor getStandardError()
{
    return STDERR_FILENO;
}

/**
 * Automatic cleanup of resources.
 */
class AutoCloseFD
{
    Descriptor fd;
public:
    AutoCloseFD();
    AutoCloseFD(Descriptor fd);
    AutoCloseFD(const AutoCloseFD & fd) = delete;
    AutoCloseFD(AutoCloseFD && fd) noexcept;
    ~AutoCloseFD();
    AutoCloseFD & operator=(const AutoCloseFD & fd) = delete;
    AutoCloseFD & operator=(AutoCloseFD && fd);
    Descriptor get() const;
    explicit operator bool() const;
    Descriptor release();
    void close();

    /**
     * Perform a blocking fsync operation.
     */
    void fsync() const;
};

MakeError(EndOfFile, TransportError);

} // namespace diskxfer
