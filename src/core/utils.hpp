#pragma once

#include <string>
#include <optional>

// Standard base64 (RFC 4648) with '=' padding.
std::string base64_encode(const std::string& input);

// Strict decode. Whitespace is skipped and missing '=' padding is tolerated;
// any other character outside the alphabet makes the whole input invalid.
std::optional<std::string> base64_decode(const std::string& input);

// True if every byte sequence in `s` is well-formed UTF-8.
bool is_valid_utf8(const std::string& s);

// Consume the decodable prefix of `buffer` and return it as text.
// Malformed sequences are dropped. An incomplete multi-byte sequence at the
// very end is left in `buffer` so the next read can complete it.
std::string take_utf8_prefix(std::string& buffer);

// Decode with U+FFFD in place of every malformed sequence.
std::string utf8_replace_invalid(const std::string& s);

// Join a remote directory and a name with '/', normalizing '\' separators.
std::string join_remote_path(const std::string& dir, const std::string& name);

// Last component of a '/' separated remote path.
std::string remote_basename(const std::string& path);
