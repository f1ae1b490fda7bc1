#include "plexwatch/utils/title_normalizer.hpp"

#include <algorithm>
#include <cctype>

namespace plexwatch::utils {

namespace {
    constexpr std::string_view ELLIPSIS = "…";

    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    bool is_trim_char(char c) {
        return is_space(c) || c == '-' || c == '.' || c == '_';
    }

    bool is_continuation_byte(char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    // '.' and '_' become spaces; whitespace runs collapse to one space
    std::string collapse_separators(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        bool pending_space = false;

        for (char c : text) {
            if (c == '.' || c == '_' || is_space(c)) {
                pending_space = true;
                continue;
            }
            if (pending_space && !out.empty()) {
                out.push_back(' ');
            }
            pending_space = false;
            out.push_back(c);
        }
        return out;
    }

    std::string to_lower_ascii(std::string text) {
        for (auto& c : text) {
            auto uc = static_cast<unsigned char>(c);
            if (uc < 0x80) {
                c = static_cast<char>(std::tolower(uc));
            }
        }
        return text;
    }

    std::string trim(std::string_view text) {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && is_trim_char(text[begin])) ++begin;
        while (end > begin && is_trim_char(text[end - 1])) --end;
        return std::string(text.substr(begin, end - begin));
    }

    size_t find_keyword_cut(const std::string& text, const std::vector<std::string>& needles) {
        const std::string lower = to_lower_ascii(text);

        for (size_t i = 0; i < lower.size(); ++i) {
            if (i > 0 && lower[i - 1] != ' ' && lower[i - 1] != '-') {
                continue;
            }
            for (const auto& needle : needles) {
                if (lower.compare(i, needle.size(), needle) == 0) {
                    return i;
                }
            }
        }
        return std::string::npos;
    }

    size_t byte_offset_of_code_point(std::string_view text, size_t code_points) {
        size_t seen = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            if (!is_continuation_byte(text[i])) {
                if (seen == code_points) {
                    return i;
                }
                ++seen;
            }
        }
        return text.size();
    }
}

std::size_t utf8_length(std::string_view text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(),
        [](char c) { return !is_continuation_byte(c); }));
}

std::string normalize_title(std::string_view raw,
                            const std::vector<std::string>& keywords,
                            std::size_t max_len) {
    std::string text = collapse_separators(raw);
    if (text.empty()) {
        return text;
    }

    // Keywords go through the same separator folding as the title
    std::vector<std::string> needles;
    needles.reserve(keywords.size());
    for (const auto& keyword : keywords) {
        auto folded = to_lower_ascii(collapse_separators(keyword));
        if (!folded.empty()) {
            needles.push_back(std::move(folded));
        }
    }

    if (auto cut = find_keyword_cut(text, needles); cut != std::string::npos) {
        text.resize(cut);
    }
    text = trim(text);

    if (utf8_length(text) > max_len) {
        text = trim(std::string_view(text).substr(0, byte_offset_of_code_point(text, max_len)));
        text += ELLIPSIS;
    }
    return text;
}

TitleNormalizer::TitleNormalizer(std::vector<std::string> keywords, std::size_t max_len)
    : m_keywords(std::move(keywords)), m_max_len(max_len) {}

std::string TitleNormalizer::normalize(std::string_view raw) const {
    return normalize_title(raw, m_keywords, m_max_len);
}

} // namespace plexwatch::utils
