#include "diskxfer/util/hash.hh"
#include "diskxfer/util/util.hh"

#include <cassert>
#include <cstring>

#include <openssl/sha.h>

namespace diskxfer {

Hash::Hash(HashAlgorithm algo)
    : algo(algo)
{
    hashSize = regularHashSize(algo);
    assert(hashSize <= maxHashSize);
    memset(hash, 0, maxHashSize);
}

bool Hash::operator==(const Hash & h2) const noexcept
{
    if (hashSize != h2.hashSize)
        return false;
    for (unsigned int i = 0; i < hashSize; i++)
        if (hash[i] != h2.hash[i])
            return false;
    return true;
}

std::string Hash::to_string(Base base) const
{
    auto bytes = std::as_bytes(std::span<const uint8_t>{hash, hashSize});
    switch (base) {
    case Base::Base16:
        return base16::encode(bytes);
    case Base::Base64:
        return base64::encode(bytes);
    }
    unreachable();
}

Hash Hash::parseBase16(std::string_view s, HashAlgorithm algo)
{
    Hash hash(algo);
    if (s.size() != base16::encodedLength(hash.hashSize))
        throw BadHash("hash '%s' has wrong length for hash algorithm '%s'", s, printHashAlgo(algo));
    std::string d;
    try {
        d = base16::decode(s);
    } catch (FormatError & e) {
        e.addTrace("while decoding hash '%s'", s);
        throw;
    }
    memcpy(hash.hash, d.data(), hash.hashSize);
    return hash;
}

union Hash::Ctx
{
    SHA_CTX sha1;
};

static void start(HashAlgorithm ha, Hash::Ctx & ctx)
{
    switch (ha) {
    case HashAlgorithm::SHA1:
        SHA1_Init(&ctx.sha1);
        return;
    }
    unreachable();
}

static void update(HashAlgorithm ha, Hash::Ctx & ctx, std::string_view data)
{
    switch (ha) {
    case HashAlgorithm::SHA1:
        SHA1_Update(&ctx.sha1, data.data(), data.size());
        return;
    }
    unreachable();
}

static void finish(HashAlgorithm ha, Hash::Ctx & ctx, unsigned char * hash)
{
    switch (ha) {
    case HashAlgorithm::SHA1:
        SHA1_Final(hash, &ctx.sha1);
        return;
    }
    unreachable();
}

Hash hashString(HashAlgorithm ha, std::string_view s)
{
    Hash::Ctx ctx;
    Hash hash(ha);
    start(ha, ctx);
    update(ha, ctx, s);
    finish(ha, ctx, hash.hash);
    return hash;
}

HashSink::HashSink(HashAlgorithm ha)
    : ha(ha)
{
    ctx = new Hash::Ctx;
    bytes = 0;
    start(ha, *ctx);
}

HashSink::HashSink(HashSink && h)
    : BufferedSink(std::move(h))
    , ha(h.ha)
    , ctx(h.ctx)
    , bytes(h.bytes)
{
    h.ctx = nullptr;
}

HashSink::~HashSink()
{
    bufPos = 0;
    delete ctx;
}

void HashSink::writeUnbuffered(std::string_view data)
{
    bytes += data.size();
    update(ha, *ctx, data);
}

std::pair<Hash, uint64_t> HashSink::finish()
{
    flush();
    Hash hash(ha);
    Hash::Ctx ctx2 = *ctx;
    diskxfer::finish(ha, ctx2, hash.hash);
    return {hash, bytes};
}

void HashSink::reset()
{
    flush();
    start(ha, *ctx);
    bytes = 0;
}

std::string_view printHashAlgo(HashAlgorithm ha)
{
    switch (ha) {
    case HashAlgorithm::SHA1:
        return "sha1";
    }
    unreachable();
}

} // namespace diskxfer
