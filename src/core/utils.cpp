#include "include/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace fs = std::filesystem;

namespace speedwatch {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string format_speed(double mbps) {
    if (mbps >= 1000.0) {
        return std::format("{:.2f} Gbps", mbps / 1000.0);
    }
    return std::format("{:.2f} Mbps", mbps);
}

std::string format_ping(double ms) {
    return std::format("{:.1f} ms", ms);
}

namespace {

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Largest cut <= max_len that lands on a UTF-8 lead byte and outside an HTML
// tag or entity. Falls back to a character boundary, then to max_len.
std::size_t cut_position(std::string_view line, std::size_t max_len) {
    std::size_t cut = max_len;
    while (cut > 0 && is_continuation_byte(line[cut])) --cut;
    if (cut == 0) return max_len;

    const std::string_view head = line.substr(0, cut);
    std::size_t markup = std::string_view::npos;

    auto open_tag = head.rfind('<');
    if (open_tag != std::string_view::npos) {
        auto close_tag = head.rfind('>');
        if (close_tag == std::string_view::npos || close_tag < open_tag) markup = open_tag;
    }
    auto amp = head.rfind('&');
    if (amp != std::string_view::npos && head.find(';', amp) == std::string_view::npos &&
        head.size() - amp < 10) {
        markup = markup == std::string_view::npos ? amp : std::min(markup, amp);
    }

    if (markup != std::string_view::npos && markup > 0) return markup;
    return cut;
}

}  // namespace

std::vector<std::string> split_message(std::string_view text, std::size_t max_len) {
    std::vector<std::string> chunks;
    if (max_len == 0) return chunks;

    std::string current;
    auto flush = [&] {
        if (!current.empty()) {
            chunks.push_back(std::move(current));
            current.clear();
        }
    };

    while (!text.empty()) {
        auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);

        while (line.size() > max_len) {
            flush();
            const std::size_t cut = cut_position(line, max_len);
            chunks.emplace_back(line.substr(0, cut));
            line.remove_prefix(cut);
        }

        const std::size_t needed = current.empty() ? line.size() : current.size() + 1 + line.size();
        if (needed > max_len) {
            flush();
        }
        if (!current.empty()) current += '\n';
        current += line;
    }
    flush();
    return chunks;
}

fs::path get_exe_dir() {
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && exe.has_parent_path()) return exe.parent_path();
    return fs::current_path(ec);
}

}  // namespace speedwatch
