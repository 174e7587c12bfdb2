#pragma once
// ─── Mirrorgate — Content-Encoding decoding ─────────────────────────────
// Undoes gzip, deflate and brotli encodings of upstream bodies.

#include <string>

enum class DecodeOutcome {
  Decoded,      // every coding was undone
  PassThrough,  // an unknown coding was met; body returned as received
  Failed,       // a known coding could not be decoded
};

bool gzip_or_deflate_decode(const std::string &input, std::string &output,
                            std::string &error);

bool brotli_decode(const std::string &input, std::string &output,
                   std::string &error);

// Applies the Content-Encoding header value. Codings listed as
// "gzip, br" were applied left to right and are undone right to left.
// "identity" and empty entries are no-ops. On PassThrough the body is
// left exactly as received.
DecodeOutcome decode_content_encoding(const std::string &content_encoding,
                                      std::string &body, std::string &error);
