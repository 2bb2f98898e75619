#include "fogmap/core/deflate.h"

#include <zlib.h>

#include <algorithm>
#include <limits>

namespace fogmap {

namespace {

constexpr int kRawWindowBits = -15;
constexpr int kZlibWindowBits = 15;
constexpr size_t kInflateChunk = 64 * 1024;

int WindowBits(DeflateFormat format) {
  return format == DeflateFormat::Raw ? kRawWindowBits : kZlibWindowBits;
}

bool Fail(const std::string& message, std::string* outError) {
  if (outError != nullptr) {
    *outError = message;
  }
  return false;
}

std::string ZlibMessage(const z_stream& stream, int code) {
  if (stream.msg != nullptr) {
    return stream.msg;
  }
  return "zlib error " + std::to_string(code);
}

}  // namespace

bool DeflateBytes(const uint8_t* data, size_t size, DeflateFormat format,
                  std::vector<uint8_t>* outCompressed, std::string* outError) {
  if (outCompressed == nullptr) {
    return Fail("outCompressed must not be null", outError);
  }
  if (size > std::numeric_limits<uInt>::max()) {
    return Fail("input too large to deflate", outError);
  }

  z_stream stream{};
  int result = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, WindowBits(format), 8,
                            Z_DEFAULT_STRATEGY);
  if (result != Z_OK) {
    return Fail("deflateInit2 failed: " + ZlibMessage(stream, result), outError);
  }

  outCompressed->assign(deflateBound(&stream, static_cast<uLong>(size)), 0);
  stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  stream.avail_in = static_cast<uInt>(size);
  stream.next_out = outCompressed->data();
  stream.avail_out = static_cast<uInt>(outCompressed->size());

  result = deflate(&stream, Z_FINISH);
  if (result != Z_STREAM_END) {
    const std::string message = ZlibMessage(stream, result);
    deflateEnd(&stream);
    return Fail("deflate failed: " + message, outError);
  }

  outCompressed->resize(static_cast<size_t>(stream.total_out));
  deflateEnd(&stream);
  return true;
}

bool InflateBytes(const uint8_t* data, size_t size, DeflateFormat format, size_t sizeHint,
                  std::vector<uint8_t>* outRaw, std::string* outError) {
  if (outRaw == nullptr) {
    return Fail("outRaw must not be null", outError);
  }
  if (size > std::numeric_limits<uInt>::max()) {
    return Fail("input too large to inflate", outError);
  }

  z_stream stream{};
  int result = inflateInit2(&stream, WindowBits(format));
  if (result != Z_OK) {
    return Fail("inflateInit2 failed: " + ZlibMessage(stream, result), outError);
  }

  // Never trust a caller-supplied size beyond what `size` bytes can expand to.
  const size_t reachable =
      size > (std::numeric_limits<size_t>::max() - kInflateChunk) / kMaxDeflateRatio
          ? std::numeric_limits<size_t>::max()
          : size * kMaxDeflateRatio + kInflateChunk;
  outRaw->assign(sizeHint > 0 ? std::min(sizeHint, reachable) : kInflateChunk, 0);
  stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  stream.avail_in = static_cast<uInt>(size);

  while (true) {
    if (stream.total_out >= outRaw->size()) {
      outRaw->resize(outRaw->size() + kInflateChunk);
    }
    stream.next_out = outRaw->data() + stream.total_out;
    stream.avail_out = static_cast<uInt>(outRaw->size() - stream.total_out);

    result = inflate(&stream, Z_NO_FLUSH);
    if (result == Z_STREAM_END) {
      break;
    }
    if (result == Z_BUF_ERROR && stream.avail_in == 0) {
      inflateEnd(&stream);
      return Fail("inflate failed: truncated stream", outError);
    }
    if (result != Z_OK && result != Z_BUF_ERROR) {
      const std::string message = ZlibMessage(stream, result);
      inflateEnd(&stream);
      return Fail("inflate failed: " + message, outError);
    }
  }

  outRaw->resize(static_cast<size_t>(stream.total_out));
  inflateEnd(&stream);
  return true;
}

uint32_t Crc32(const uint8_t* data, size_t size) {
  uLong crc = crc32(0L, Z_NULL, 0);
  while (size > 0) {
    const uInt chunk = static_cast<uInt>(std::min<size_t>(size, std::numeric_limits<uInt>::max()));
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), chunk);
    data += chunk;
    size -= chunk;
  }
  return static_cast<uint32_t>(crc);
}

}  // namespace fogmap
