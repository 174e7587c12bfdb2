// ─── Mirrorgate — Content-Encoding decoding implementation ──────────────

#include "decompress.h"
#include "utils.h"

#include <brotli/decode.h>
#include <zlib.h>

#include <cstdint>
#include <vector>

namespace {

bool try_inflate(const std::string &input, int window_bits,
                 std::string &output) {
  z_stream strm{};
  if (inflateInit2(&strm, window_bits) != Z_OK) return false;

  strm.avail_in = static_cast<uInt>(input.size());
  strm.next_in =
      reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));

  std::string result;
  result.reserve(input.size() * 4);
  unsigned char buffer[32768];
  int ret;
  do {
    strm.avail_out = sizeof(buffer);
    strm.next_out = buffer;
    ret = inflate(&strm, Z_NO_FLUSH);
    if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
        ret == Z_NEED_DICT || ret == Z_BUF_ERROR) {
      inflateEnd(&strm);
      return false;
    }
    size_t have = sizeof(buffer) - strm.avail_out;
    result.append(reinterpret_cast<const char *>(buffer), have);
  } while (ret != Z_STREAM_END);

  inflateEnd(&strm);
  output = std::move(result);
  return true;
}

}  // namespace

bool gzip_or_deflate_decode(const std::string &input, std::string &output,
                            std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  // 15 + 32: gzip or zlib-wrapped deflate, auto-detected.
  if (try_inflate(input, 15 + 32, output)) return true;
  // Raw deflate, as sent by some servers under "deflate".
  if (try_inflate(input, -15, output)) return true;
  error = "Failed to inflate response body";
  return false;
}

bool brotli_decode(const std::string &input, std::string &output,
                   std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  BrotliDecoderState *state =
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
  if (!state) {
    error = "Failed to create brotli decoder";
    return false;
  }

  size_t available_in = input.size();
  const uint8_t *next_in = reinterpret_cast<const uint8_t *>(input.data());
  std::string result;
  uint8_t buffer[32768];
  BrotliDecoderResult rc = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;

  while (rc == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
    size_t available_out = sizeof(buffer);
    uint8_t *next_out = buffer;
    rc = BrotliDecoderDecompressStream(state, &available_in, &next_in,
                                       &available_out, &next_out, nullptr);
    result.append(reinterpret_cast<const char *>(buffer),
                  sizeof(buffer) - available_out);
  }

  bool ok = rc == BROTLI_DECODER_RESULT_SUCCESS;
  if (!ok) {
    error = rc == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT
                ? "Truncated brotli stream"
                : std::string("Brotli decode failed: ") +
                      BrotliDecoderErrorString(
                          BrotliDecoderGetErrorCode(state));
  }
  BrotliDecoderDestroyInstance(state);
  if (ok) output = std::move(result);
  return ok;
}

DecodeOutcome decode_content_encoding(const std::string &content_encoding,
                                      std::string &body, std::string &error) {
  std::vector<std::string> codings = split_copy(content_encoding, ',');
  const std::string original = body;
  for (auto it = codings.rbegin(); it != codings.rend(); ++it) {
    std::string coding = to_lower(trim_copy(*it));
    if (coding.empty() || coding == "identity") continue;

    std::string decoded;
    if (coding == "gzip" || coding == "x-gzip" || coding == "deflate") {
      if (!gzip_or_deflate_decode(body, decoded, error)) {
        return DecodeOutcome::Failed;
      }
    } else if (coding == "br") {
      if (!brotli_decode(body, decoded, error)) return DecodeOutcome::Failed;
    } else {
      body = original;
      return DecodeOutcome::PassThrough;
    }
    body = std::move(decoded);
  }
  return DecodeOutcome::Decoded;
}
