#ifndef TINYTHIS_PASTE_PATHS_HPP
#define TINYTHIS_PASTE_PATHS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Splits pasted or drag-and-dropped text into paths.
 *
 * Tokens are separated by whitespace. Single or double quotes group a
 * token, a backslash escapes the next character, and `file://` URIs are
 * percent-decoded into plain paths.
 */
std::vector<std::filesystem::path> parse_paste_paths(std::string_view text);

/// Decodes `%XX` escapes; malformed escapes are kept verbatim.
std::string percent_decode(std::string_view s);

#endif // TINYTHIS_PASTE_PATHS_HPP
