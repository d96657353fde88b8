#ifndef TOOLGATE_COMMAND_LINE_SPLIT_HPP
#define TOOLGATE_COMMAND_LINE_SPLIT_HPP

// Turns a command string into an argument vector without involving a shell.
//
// Rule: POSIX shell word splitting with quoting but no expansion of any kind.
//   - Unquoted blanks (space, tab, newline) separate words.
//   - '...' keeps every character literally.
//   - "..." keeps every character, except that a backslash escapes ", \, $, `
//     and newline (backslash-newline is dropped).
//   - An unquoted backslash escapes the next character; backslash-newline is dropped.
//   - Adjacent quoted and unquoted pieces form a single word; '' is an empty word.
// If the string has an unterminated quote or ends in an unescaped backslash,
// it is instead split on runs of blanks with no quote processing at all.

#include <string>
#include <vector>

namespace command_line_split {

struct SplitResult {
    std::vector<std::string> words;
    // True when the quoting was malformed and plain blank splitting was used.
    bool used_fallback = false;
};

// Quote-aware split. Returns false (and leaves words partially filled) on malformed quoting.
bool split_shell_words(const std::string &command, std::vector<std::string> &words);

// Split on runs of blanks only.
std::vector<std::string> split_whitespace(const std::string &command);

// Apply the full rule described above.
SplitResult split_command(const std::string &command);

} // namespace command_line_split

#endif // TOOLGATE_COMMAND_LINE_SPLIT_HPP
