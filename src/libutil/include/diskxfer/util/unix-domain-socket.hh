#pragma once
///@file

#include "diskxfer/util/types.hh"
#include "diskxfer/util/file-descriptor.hh"

namespace diskxfer {

/**
 * Create a Unix domain socket.
 */
AutoCloseFD createUnixDomainSocket();

/**
 * Create a Unix domain socket in listen mode.
 */
AutoCloseFD createUnixDomainSocket(const Path & path, mode_t mode, int backlog = 100);

/**
 * Bind a Unix domain socket to a path. An existing file at `path` is
 * removed first.
 */
void bind(Descriptor fd, const Path & path);

/**
 * Connect to a Unix domain socket.
 */
void connect(Descriptor fd, const Path & path);

} // namespace diskxfer
