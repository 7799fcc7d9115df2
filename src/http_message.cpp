#include "rpcwire/http_message.hpp"
#include "rpcwire/version.hpp"
#include <cctype>
#include <cstdint>

namespace rpcwire {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim_blanks(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

// Length of the well-formed UTF-8 sequence starting at `i`, or the length of
// its longest valid prefix negated (at least -1) when ill-formed.
int utf8_sequence_length(std::string_view s, std::size_t i) {
    const auto b0 = static_cast<uint8_t>(s[i]);
    if (b0 < 0x80) return 1;

    int need;
    uint8_t lo = 0x80, hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 2;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 3;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return -1;
    }

    for (int k = 1; k <= need; ++k) {
        if (i + k >= s.size()) return -k;
        const auto b = static_cast<uint8_t>(s[i + k]);
        // Only the second byte has a narrowed range.
        const uint8_t min = (k == 1) ? lo : 0x80;
        const uint8_t max = (k == 1) ? hi : 0xBF;
        if (b < min || b > max) return -k;
    }
    return need + 1;
}

} // anonymous namespace

std::optional<int> HttpReply::status_code() const {
    auto eol = head.find(http::kLineEnd);
    std::string_view line = std::string_view(head).substr(0, eol);
    auto sp = line.find(' ');
    if (sp == std::string_view::npos || sp + 4 > line.size()) return std::nullopt;
    int code = 0;
    for (std::size_t i = sp + 1; i < sp + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) return std::nullopt;
        code = code * 10 + (line[i] - '0');
    }
    return code;
}

std::optional<std::string> HttpReply::header(std::string_view name) const {
    std::string_view rest = head;
    // Skip the status line
    auto eol = rest.find(http::kLineEnd);
    if (eol == std::string_view::npos) return std::nullopt;
    rest.remove_prefix(eol + http::kLineEnd.size());

    while (!rest.empty()) {
        eol = rest.find(http::kLineEnd);
        std::string_view line = rest.substr(0, eol);
        auto colon = line.find(':');
        if (colon != std::string_view::npos && iequals(trim_blanks(line.substr(0, colon)), name)) {
            return std::string(trim_blanks(line.substr(colon + 1)));
        }
        if (eol == std::string_view::npos) break;
        rest.remove_prefix(eol + http::kLineEnd.size());
    }
    return std::nullopt;
}

namespace http {

std::string frame_post(const ServiceAddress& address,
                       std::string_view user_agent,
                       const std::optional<ApiKey>& api_key,
                       std::string_view body) {
    std::string out;
    out.reserve(256 + body.size());

    out += "POST ";
    out += address.request_target();
    out += " HTTP/1.1";
    out += kLineEnd;

    out += "Host: ";
    out += address.host_port();
    out += kLineEnd;

    out += "Content-Type: ";
    out += CONTENT_TYPE_JSON;
    out += kLineEnd;

    out += "User-Agent: ";
    out += user_agent;
    out += kLineEnd;

    out += "Accept: ";
    out += ACCEPT_JSON;
    out += kLineEnd;

    if (api_key) {
        out += api_key->as_header();
        out += kLineEnd;
    }

    // std::string::size() is the byte count, which is what the peer reads.
    out += "Content-Length: ";
    out += std::to_string(body.size());
    out += kLineEnd;

    out += kLineEnd;
    out += body;
    return out;
}

std::string decode_utf8_lossy(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        int len = utf8_sequence_length(bytes, i);
        if (len > 0) {
            out.append(bytes.data() + i, static_cast<std::size_t>(len));
            i += static_cast<std::size_t>(len);
        } else {
            out += kReplacementChar;
            i += static_cast<std::size_t>(-len);
        }
    }
    return out;
}

bool reply_complete(std::string_view raw, std::size_t& scanned) {
    auto pos = raw.find(kSeparator, scanned);
    if (pos == std::string_view::npos) {
        // The separator may straddle the next chunk boundary.
        if (raw.size() >= kSeparator.size()) scanned = raw.size() - (kSeparator.size() - 1);
        return false;
    }
    scanned = pos;

    HttpReply head_only;
    head_only.head = std::string(raw.substr(0, pos));
    auto length = head_only.header("Content-Length");
    if (!length || length->empty()) return false;

    // An unparseable or overflowing length falls back to reading until close.
    std::size_t expected = 0;
    for (char c : *length) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        if (expected > (SIZE_MAX - 9) / 10) return false;
        expected = expected * 10 + static_cast<std::size_t>(c - '0');
    }
    return raw.size() - (pos + kSeparator.size()) >= expected;
}

bool reply_complete(std::string_view raw) {
    std::size_t scanned = 0;
    return reply_complete(raw, scanned);
}

std::optional<HttpReply> split_reply(std::string_view text) {
    auto pos = text.find(kSeparator);
    if (pos == std::string_view::npos) return std::nullopt;
    HttpReply reply;
    reply.head = std::string(text.substr(0, pos));
    reply.body = std::string(text.substr(pos + kSeparator.size()));
    return reply;
}

} // namespace http
} // namespace rpcwire
