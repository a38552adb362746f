#include "utils.hpp"
#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:          return "none";
    case ErrorKind::NETWORK:       return "network";
    case ErrorKind::AUTH:          return "auth";
    case ErrorKind::KEY:           return "key";
    case ErrorKind::CREDENTIAL:    return "credential";
    case ErrorKind::NOT_FOUND:     return "not_found";
    case ErrorKind::NOT_OWNER:     return "not_owner";
    case ErrorKind::DUPLICATE:     return "duplicate";
    case ErrorKind::OUT_OF_ORDER:  return "out_of_order";
    case ErrorKind::INVALID_INPUT: return "invalid_input";
    case ErrorKind::TOO_LARGE:     return "too_large";
    case ErrorKind::IO:            return "io";
    case ErrorKind::REMOTE:        return "remote";
    case ErrorKind::UNKNOWN:       return "unknown";
    }
    return "unknown";
}

// ── Base64 ─────────────────────────────────────────────────────

static const char B64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t len = input.size();
    for (size_t i = 0; i < len; i += 3) {
        unsigned val = data[i] << 16;
        if (i + 1 < len) val |= data[i + 1] << 8;
        if (i + 2 < len) val |= data[i + 2];
        out += B64_CHARS[(val >> 18) & 0x3F];
        out += B64_CHARS[(val >> 12) & 0x3F];
        out += (i + 1 < len) ? B64_CHARS[(val >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? B64_CHARS[val & 0x3F] : '=';
    }
    return out;
}

static int b64_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::optional<std::string> base64_decode(const std::string& input) {
    std::string out;
    out.reserve(input.size() * 3 / 4);
    int val = 0, bits = -8;
    size_t symbols = 0;
    bool padding = false;
    for (char c : input) {
        if (c == '\r' || c == '\n' || c == ' ' || c == '\t') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) return std::nullopt;  // data after padding
        int v = b64_val(c);
        if (v < 0) return std::nullopt;
        ++symbols;
        val = (val << 6) | v;
        bits += 6;
        if (bits >= 0) {
            out += static_cast<char>((val >> bits) & 0xFF);
            bits -= 8;
        }
    }
    // A lone trailing symbol cannot encode a byte
    if (symbols % 4 == 1) return std::nullopt;
    return out;
}

// ── UTF-8 ──────────────────────────────────────────────────────

namespace {

enum class Utf8Step { OK, INVALID, INCOMPLETE };

// Inspect the sequence starting at s[i]. `len` receives the sequence length
// on OK, or the number of bytes to discard on INVALID (maximal invalid subpart).
Utf8Step utf8_step(const std::string& s, size_t i, size_t& len) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char b0 = byte(i);

    if (b0 < 0x80) { len = 1; return Utf8Step::OK; }

    size_t need;
    unsigned char lo = 0x80, hi = 0xBF;  // valid range for the second byte
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 3;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 4;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        len = 1;
        return Utf8Step::INVALID;
    }

    for (size_t k = 1; k < need; ++k) {
        if (i + k >= s.size()) {
            len = k;
            return Utf8Step::INCOMPLETE;
        }
        unsigned char b = byte(i + k);
        unsigned char min = (k == 1) ? lo : 0x80;
        unsigned char max = (k == 1) ? hi : 0xBF;
        if (b < min || b > max) {
            len = k;
            return Utf8Step::INVALID;
        }
    }
    len = need;
    return Utf8Step::OK;
}

} // namespace

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t len = 0;
        if (utf8_step(s, i, len) != Utf8Step::OK) return false;
        i += len;
    }
    return true;
}

std::string take_utf8_prefix(std::string& buffer) {
    std::string text;
    text.reserve(buffer.size());
    size_t i = 0;
    while (i < buffer.size()) {
        size_t len = 0;
        auto step = utf8_step(buffer, i, len);
        if (step == Utf8Step::INCOMPLETE) break;
        if (step == Utf8Step::OK) text.append(buffer, i, len);
        i += len;
    }
    buffer.erase(0, i);
    return text;
}

std::string utf8_replace_invalid(const std::string& s) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t len = 0;
        auto step = utf8_step(s, i, len);
        if (step == Utf8Step::OK) {
            out.append(s, i, len);
        } else {
            out += REPLACEMENT;
        }
        i += len;
    }
    return out;
}

// ── Remote paths ───────────────────────────────────────────────

std::string join_remote_path(const std::string& dir, const std::string& name) {
    std::string joined;
    if (dir.empty()) {
        joined = name;
    } else if (dir.back() == '/' || dir.back() == '\\') {
        joined = dir + name;
    } else {
        joined = dir + "/" + name;
    }
    for (auto& c : joined) {
        if (c == '\\') c = '/';
    }
    return joined;
}

std::string remote_basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}
