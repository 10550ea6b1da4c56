#include "security/signature_matcher.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace secplane {

namespace {

constexpr auto npos = std::string_view::npos;

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// First whole-word occurrence of word in text
size_t find_word(std::string_view text, std::string_view word) {
    size_t from = 0;
    size_t pos;
    while ((pos = text.find(word, from)) != npos) {
        const size_t end = pos + word.size();
        const bool starts = pos == 0 || !is_word_char(text[pos - 1]);
        const bool ends = end == text.size() || !is_word_char(text[end]);
        if (starts && ends) return pos;
        from = pos + 1;
    }
    return npos;
}

// "or"/"and", then '=', then a quote, all on one line
bool sql_boolean_injection(std::string_view text) {
    size_t line_start = 0;
    while (line_start <= text.size()) {
        size_t line_end = text.find('\n', line_start);
        if (line_end == npos) line_end = text.size();
        const auto line = text.substr(line_start, line_end - line_start);

        const size_t keyword = std::min(find_word(line, "or"), find_word(line, "and"));
        if (keyword != npos) {
            const size_t eq = line.find('=', keyword);
            if (eq != npos && line.find('\'', eq + 1) != npos) return true;
        }
        line_start = line_end + 1;
    }
    return false;
}

// "<script ...>" closed by "</script>" later on the same line
bool script_injection(std::string_view text) {
    constexpr std::string_view open = "<script";
    constexpr std::string_view close = "</script>";

    size_t pos = text.find(open);
    while (pos != npos) {
        const size_t tag_end = text.find('>', pos + open.size());
        if (tag_end == npos) return false;

        const size_t line_end = text.find('\n', tag_end);
        const size_t closing = text.find(close, tag_end + 1);
        if (closing != npos && (line_end == npos || closing + close.size() <= line_end)) {
            return true;
        }
        // Later openings on this line close no earlier than this one
        if (line_end == npos) return false;
        pos = text.find(open, line_end + 1);
    }
    return false;
}

bool path_traversal(std::string_view text) {
    return text.find("../") != npos;
}

bool code_execution(std::string_view text) {
    return find_word(text, "exec") != npos || find_word(text, "eval") != npos;
}

} // anonymous namespace

SignatureMatcher::SignatureMatcher(size_t max_scan_bytes)
    : signatures_{
          {"sql_injection", &sql_boolean_injection},
          {"script_injection", &script_injection},
          {"path_traversal", &path_traversal},
          {"code_execution", &code_execution},
      },
      max_scan_bytes_(max_scan_bytes) {}

std::optional<std::string> SignatureMatcher::first_match(
    const std::vector<std::string_view>& inputs) const {
    std::vector<std::string> lowered;
    lowered.reserve(inputs.size());
    for (const auto input : inputs) {
        lowered.push_back(utils::to_lower(input.substr(0, max_scan_bytes_)));
    }

    // Order of signatures decides which name is reported
    for (const auto& sig : signatures_) {
        for (const auto& text : lowered) {
            if (!text.empty() && sig.detect(text)) {
                return std::string(sig.name);
            }
        }
    }
    return std::nullopt;
}

} // namespace secplane
