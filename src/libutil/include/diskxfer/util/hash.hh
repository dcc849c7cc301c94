#pragma once
///@file

#include "diskxfer/util/base-n.hh"
#include "diskxfer/util/types.hh"
#include "diskxfer/util/serialise.hh"

namespace diskxfer {

MakeError(BadHash, Error);

/**
 * Only SHA-1 is needed: it is the digest in `.checksum` members of tar
 * streams.
 */
enum struct HashAlgorithm : char { SHA1 = 42 };

constexpr inline size_t regularHashSize(HashAlgorithm type)
{
    switch (type) {
    case HashAlgorithm::SHA1:
        return 20;
    }
    return 0;
}

struct Hash
{
    /** Opaque handle type for the hash calculation state. */
    union Ctx;

    constexpr static size_t maxHashSize = 20;
    size_t hashSize = 0;
    uint8_t hash[maxHashSize] = {};

    HashAlgorithm algo;

    /**
     * Create a zero-filled hash object.
     */
    explicit Hash(HashAlgorithm algo);

    /**
     * Parse a plain base-16 hash of the given algorithm.
     */
    static Hash parseBase16(std::string_view s, HashAlgorithm algo);

    bool operator==(const Hash & h2) const noexcept;

    /**
     * Return the string representation of the hash, in the given
     * base, without an algorithm prefix.
     */
    std::string to_string(Base base) const;
};

/**
 * Compute the hash of the given string.
 */
Hash hashString(HashAlgorithm ha, std::string_view s);

std::string_view printHashAlgo(HashAlgorithm ha);

/**
 * A sink that hashes everything written to it. The digest can be
 * taken any number of times; `reset()` starts a fresh one.
 */
class HashSink : public BufferedSink
{
private:
    HashAlgorithm ha;
    Hash::Ctx * ctx;
    uint64_t bytes;

public:
    HashSink(HashAlgorithm ha);
    HashSink(HashSink && h);
    HashSink(const HashSink &) = delete;
    HashSink & operator=(const HashSink &) = delete;
    ~HashSink();

    void writeUnbuffered(std::string_view data) override;

    /**
     * The digest of everything written since construction or the
     * last `reset()`, with the byte count.
     */
    std::pair<Hash, uint64_t> finish();

    void reset();
};

} // namespace diskxfer
