/*
 * courier/src/transfer/http_headers.cpp
 *
 * Response header helpers and target file-name resolution.
 * - Header names are case-insensitive; first occurrence wins
 * - Content-Disposition: RFC 6266 filename*= (RFC 5987 ext-value) preferred over filename=
 * - URL fallback: last path segment, percent-decoded, query and fragment removed
 */

#include <courier/transfer/transfer.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <vector>

namespace courier::transfer {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

// Split "a; b=c; d" on ';' outside double quotes.
std::vector<std::string_view> split_params(std::string_view value) {
    std::vector<std::string_view> parts;
    bool quoted = false;
    size_t start = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '"') {
            quoted = !quoted;
        } else if (c == '\\' && quoted && i + 1 < value.size()) {
            ++i;
        } else if (c == ';' && !quoted) {
            parts.push_back(trim(value.substr(start, i - start)));
            start = i + 1;
        }
    }
    parts.push_back(trim(value.substr(start)));
    return parts;
}

std::string unquote_token(std::string_view v) {
    v = trim(v);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        std::string out;
        out.reserve(v.size() - 2);
        for (size_t i = 1; i + 1 < v.size(); ++i) {
            if (v[i] == '\\' && i + 2 < v.size())
                ++i;
            out.push_back(v[i]);
        }
        return out;
    }
    return std::string(v);
}

} // namespace

std::optional<std::string> ResponseHead::header(std::string_view name) const {
    const auto wanted = to_lower(name);
    for (const auto& h : headers) {
        if (to_lower(h.name) == wanted)
            return h.value;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> ResponseHead::contentLength() const {
    auto raw = header("content-length");
    if (!raw)
        return std::nullopt;
    auto sv = trim(*raw);
    std::uint64_t value{0};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (res.ec != std::errc() || res.ptr != sv.data() + sv.size())
        return std::nullopt;
    return value;
}

std::optional<std::string> fileNameFromContentDisposition(std::string_view value) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    for (auto param : split_params(value)) {
        auto eq = param.find('=');
        if (eq == std::string_view::npos)
            continue;
        auto key = to_lower(trim(param.substr(0, eq)));
        auto val = trim(param.substr(eq + 1));

        if (key == "filename*") {
            // charset'language'pct-encoded
            auto first = val.find('\'');
            auto second = first == std::string_view::npos ? first : val.find('\'', first + 1);
            auto encoded = second == std::string_view::npos ? val : val.substr(second + 1);
            auto decoded = percent_decode(unquote_token(encoded));
            if (!decoded.empty())
                extended = std::move(decoded);
        } else if (key == "filename" && !plain) {
            auto name = unquote_token(val);
            if (!name.empty())
                plain = std::move(name);
        }
    }

    if (extended)
        return extended;
    return plain;
}

std::optional<std::string> fileNameFromUrl(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);

    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        auto pathStart = url.find('/', scheme + 3);
        if (pathStart == std::string_view::npos)
            return std::nullopt; // host only
        url = url.substr(pathStart);
    }

    while (!url.empty() && url.back() == '/')
        url.remove_suffix(1);
    auto slash = url.find_last_of('/');
    auto segment = slash == std::string_view::npos ? url : url.substr(slash + 1);
    if (segment.empty())
        return std::nullopt;
    return percent_decode(segment);
}

std::string sanitizeFileName(std::string_view name) {
    // Keep only the last component of anything that looks like a path
    auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos)
        name = name.substr(slash + 1);

    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c < 0x20 || c == 0x7F)
            continue;
        out.push_back(static_cast<char>(c));
    }

    auto trimmed = std::string(trim(out));
    if (trimmed.size() > kMaxFileNameBytes) {
        // Shorten the stem; an extension of reasonable length survives
        std::string ext;
        auto dot = trimmed.find_last_of('.');
        if (dot != std::string::npos && dot > 0 && trimmed.size() - dot <= kMaxExtensionBytes)
            ext = trimmed.substr(dot);
        std::size_t cut = kMaxFileNameBytes - ext.size();
        // Never split a UTF-8 sequence
        while (cut > 0 && (static_cast<unsigned char>(trimmed[cut]) & 0xC0) == 0x80)
            --cut;
        trimmed = std::string(trim(std::string_view(trimmed).substr(0, cut))) + ext;
    }
    if (trimmed.empty() || trimmed == "." || trimmed == "..")
        return "download";
    return trimmed;
}

} // namespace courier::transfer
