#include <relay/util/string.h>
#include <array>
#include <cctype>

namespace relay::util {

namespace {

    constexpr std::string_view kHexDigits = "0123456789ABCDEF";

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
        return -1;
    }

    constexpr std::array<bool, 256> make_path_escape_table() {
        std::array<bool, 256> table{};
        for (int c = 0; c < 0x21; ++c) table[c] = true;
        for (int c = 0x7F; c < 256; ++c) table[c] = true;
        for (unsigned char c : std::string_view("\"#<>?`{}")) table[c] = true;
        return table;
    }

    constexpr auto kPathEscape = make_path_escape_table();

} // namespace

std::string percent_decode(std::string_view str) {
    std::string out;
    out.reserve(str.size());

    size_t pos = 0;
    while (pos < str.size()) {
        const size_t pct = str.find('%', pos);
        if (pct == std::string_view::npos) {
            out.append(str.substr(pos));
            break;
        }
        out.append(str.substr(pos, pct - pos));

        // Needs two more characters after the '%'
        const bool complete = pct + 2 < str.size();
        const int hi = complete ? hex_value(str[pct + 1]) : -1;
        const int lo = hi < 0 ? -1 : hex_value(str[pct + 2]);
        if (lo < 0) {
            out.push_back('%');
            pos = pct + 1;
            continue;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        pos = pct + 3;
    }
    return out;
}

std::string encode_path(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    for (const char c : str) {
        const auto byte = static_cast<unsigned char>(c);
        if (!kPathEscape[byte]) {
            out.push_back(c);
            continue;
        }
        out.push_back('%');
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

std::string media_type(std::string_view content_type) {
    std::string_view type = content_type.substr(0, content_type.find(';'));
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.front()))) type.remove_prefix(1);
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back()))) type.remove_suffix(1);

    std::string out;
    out.reserve(type.size());
    for (const char c : type) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace relay::util
