#include "utils/command_line_split.hpp"

namespace command_line_split {

static bool is_blank(char character) {
    return character == ' ' || character == '\t' || character == '\n' || character == '\r';
}

bool split_shell_words(const std::string &command, std::vector<std::string> &words) {
    words.clear();

    std::string current_word;
    bool word_started = false;
    size_t index = 0;
    const size_t length = command.size();

    while (index < length) {
        char character = command[index];

        if (is_blank(character)) {
            if (word_started) {
                words.push_back(current_word);
                current_word.clear();
                word_started = false;
            }
            ++index;
            continue;
        }

        word_started = true;

        if (character == '\\') {
            if (index + 1 >= length) {
                return false;
            }
            if (command[index + 1] != '\n') {
                current_word += command[index + 1];
            }
            index += 2;
            continue;
        }

        if (character == '\'') {
            size_t closing = command.find('\'', index + 1);
            if (closing == std::string::npos) {
                return false;
            }
            current_word.append(command, index + 1, closing - index - 1);
            index = closing + 1;
            continue;
        }

        if (character == '"') {
            ++index;
            bool closed = false;
            while (index < length) {
                char inner = command[index];
                if (inner == '"') {
                    closed = true;
                    ++index;
                    break;
                }
                if (inner == '\\' && index + 1 < length) {
                    char escaped = command[index + 1];
                    if (escaped == '"' || escaped == '\\' || escaped == '$' || escaped == '`') {
                        current_word += escaped;
                        index += 2;
                        continue;
                    }
                    if (escaped == '\n') {
                        index += 2;
                        continue;
                    }
                }
                current_word += inner;
                ++index;
            }
            if (!closed) {
                return false;
            }
            continue;
        }

        current_word += character;
        ++index;
    }

    if (word_started) {
        words.push_back(current_word);
    }
    return true;
}

std::vector<std::string> split_whitespace(const std::string &command) {
    std::vector<std::string> words;
    std::string current_word;
    for (char character : command) {
        if (is_blank(character)) {
            if (!current_word.empty()) {
                words.push_back(current_word);
                current_word.clear();
            }
        } else {
            current_word += character;
        }
    }
    if (!current_word.empty()) {
        words.push_back(current_word);
    }
    return words;
}

SplitResult split_command(const std::string &command) {
    SplitResult result;
    if (!split_shell_words(command, result.words)) {
        result.words = split_whitespace(command);
        result.used_fallback = true;
    }
    return result;
}

} // namespace command_line_split
