#include "output/gzip_codec.hpp"

#include <stdexcept>
#include <vector>

#include <zlib.h>

namespace pkgsnap {

namespace {

constexpr int kGzipWindowBits = 16 + MAX_WBITS;
constexpr std::size_t kChunkSize = 16384;

} // namespace

QByteArray gzipCompress(const QByteArray &data)
{
    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    // 16 + MAX_WBITS makes zlib write a gzip header and trailer.
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib deflate");
    }

    strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.constData()));
    strm.avail_in = static_cast<uInt>(data.size());

    QByteArray out;
    std::vector<char> buffer(kChunkSize);
    int ret = Z_OK;
    do {
        strm.next_out = reinterpret_cast<Bytef *>(buffer.data());
        strm.avail_out = static_cast<uInt>(buffer.size());

        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            throw std::runtime_error("zlib deflate failed");
        }

        const std::size_t produced = buffer.size() - strm.avail_out;
        out.append(buffer.data(), static_cast<qsizetype>(produced));
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
    return out;
}

std::optional<QByteArray> gzipDecompress(const QByteArray &data)
{
    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = 0;
    strm.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm, kGzipWindowBits) != Z_OK) {
        return std::nullopt;
    }

    strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.constData()));
    strm.avail_in = static_cast<uInt>(data.size());

    QByteArray out;
    std::vector<char> buffer(kChunkSize);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = reinterpret_cast<Bytef *>(buffer.data());
        strm.avail_out = static_cast<uInt>(buffer.size());

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            // Z_BUF_ERROR here means the input ended before the trailer.
            inflateEnd(&strm);
            return std::nullopt;
        }

        const std::size_t produced = buffer.size() - strm.avail_out;
        out.append(buffer.data(), static_cast<qsizetype>(produced));
    }

    inflateEnd(&strm);
    return out;
}

} // namespace pkgsnap
