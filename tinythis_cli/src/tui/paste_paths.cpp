#include "paste_paths.hpp"

#include <cctype>
#include <optional>

namespace {

    std::optional<int> hex_val(const char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return std::nullopt;
    }

    void push_token(std::vector<std::filesystem::path>& out, std::string& buf, const bool quoted) {
        if (buf.empty() && !quoted) {
            return;
        }
        std::string s = std::move(buf);
        buf.clear();

        constexpr std::string_view kFileScheme = "file://";
        if (std::string_view(s).starts_with(kFileScheme)) {
            std::string_view rest = std::string_view(s).substr(kFileScheme.size());
            // file://localhost/path and file:///path both name /path
            if (rest.starts_with("localhost/")) {
                rest.remove_prefix(std::string_view("localhost").size());
            }
            s = percent_decode(rest);
        }
        if (!s.empty()) {
            out.emplace_back(s);
        }
    }

} // namespace

std::string percent_decode(const std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const auto hi = hex_val(s[i + 1]);
            const auto lo = hex_val(s[i + 2]);
            if (hi && lo) {
                out.push_back(static_cast<char>((*hi << 4) | *lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::vector<std::filesystem::path> parse_paste_paths(const std::string_view text) {
    std::vector<std::filesystem::path> out;
    std::string buf;
    char quote = 0;
    bool quoted = false;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            } else {
                buf.push_back(c);
            }
            continue;
        }
        if (c == '\\' && i + 1 < text.size()) {
            buf.push_back(text[++i]);
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            quoted = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            push_token(out, buf, quoted);
            quoted = false;
            continue;
        }
        buf.push_back(c);
    }
    push_token(out, buf, quoted);
    return out;
}
