#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace plexwatch::utils {

/**
 * @brief Cut a release-style title at the first keyword and bound its length
 *
 * Dots and underscores become spaces and whitespace runs collapse. The title
 * is cut before the first case-insensitive keyword match that starts at a
 * token boundary (start of text, or after a space or '-'). Leading and
 * trailing separators are trimmed. A result longer than @p max_len code
 * points is cut to @p max_len and gets a trailing ellipsis.
 *
 * The function is idempotent.
 */
std::string normalize_title(std::string_view raw,
                            const std::vector<std::string>& keywords,
                            std::size_t max_len);

/**
 * @brief Number of UTF-8 code points in @p text
 */
std::size_t utf8_length(std::string_view text);

class TitleNormalizer {
public:
    static constexpr std::size_t DEFAULT_MAX_LENGTH = 40;

    TitleNormalizer() = default;
    TitleNormalizer(std::vector<std::string> keywords, std::size_t max_len);

    [[nodiscard]] std::string normalize(std::string_view raw) const;

    [[nodiscard]] const std::vector<std::string>& keywords() const { return m_keywords; }
    [[nodiscard]] std::size_t max_length() const { return m_max_len; }

private:
    std::vector<std::string> m_keywords;
    std::size_t m_max_len = DEFAULT_MAX_LENGTH;
};

} // namespace plexwatch::utils
