#include "text_diff.hpp"

#include <amstore/error.hpp>

#include "encoding/utf8.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <vector>

namespace amstore::detail {

namespace {

auto diff_error(std::string message) -> Exception {
    return Exception{ErrorKind::invalid_diff, std::move(message)};
}

struct Lines {
    std::vector<std::string_view> lines;
    bool trailing_newline = false;
};

auto split_lines(std::string_view text) -> Lines {
    auto result = Lines{};
    if (text.empty()) return result;
    result.trailing_newline = text.back() == '\n';
    if (result.trailing_newline) text.remove_suffix(1);
    for (;;) {
        auto nl = text.find('\n');
        result.lines.push_back(text.substr(0, nl));
        if (nl == std::string_view::npos) break;
        text.remove_prefix(nl + 1);
    }
    return result;
}

struct HunkRange {
    std::size_t start = 0;
    std::size_t count = 1;
};

auto parse_number(std::string_view& s) -> std::size_t {
    auto value = std::size_t{0};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr == s.data()) throw diff_error("bad number in hunk header");
    s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
    return value;
}

// Parses "-l[,s]" or "+l[,s]".
auto parse_range(std::string_view& s, char sign) -> HunkRange {
    if (s.empty() || s.front() != sign) throw diff_error("malformed hunk header");
    s.remove_prefix(1);
    auto range = HunkRange{};
    range.start = parse_number(s);
    if (!s.empty() && s.front() == ',') {
        s.remove_prefix(1);
        range.count = parse_number(s);
    }
    return range;
}

struct Hunk {
    HunkRange old_range;
    HunkRange new_range;
    std::vector<std::string_view> body;
};

auto parse_hunk_header(std::string_view line) -> Hunk {
    // "@@ -l,s +l,s @@ optional section heading"
    line.remove_prefix(2);
    if (line.empty() || line.front() != ' ') throw diff_error("malformed hunk header");
    line.remove_prefix(1);
    auto hunk = Hunk{};
    hunk.old_range = parse_range(line, '-');
    if (line.empty() || line.front() != ' ') throw diff_error("malformed hunk header");
    line.remove_prefix(1);
    hunk.new_range = parse_range(line, '+');
    if (!line.starts_with(" @@")) throw diff_error("malformed hunk header");
    return hunk;
}

struct ParsedDiff {
    std::vector<Hunk> hunks;
    std::optional<bool> new_trailing_newline;
};

auto parse_diff(std::string_view diff) -> ParsedDiff {
    auto parsed = ParsedDiff{};
    auto lines = split_lines(diff).lines;

    std::size_t i = 0;
    while (i < lines.size()) {
        auto line = lines[i];
        if (line.empty()) {
            ++i;
            continue;
        }
        if (!line.starts_with("@@")) {
            if (!parsed.hunks.empty()) throw diff_error("unexpected line after hunk: '" + std::string{line} + "'");
            ++i;  // file headers ("---", "+++", "diff", "index")
            continue;
        }

        auto hunk = parse_hunk_header(line);
        ++i;
        auto old_left = hunk.old_range.count;
        auto new_left = hunk.new_range.count;
        while (i < lines.size() && (old_left > 0 || new_left > 0)) {
            auto body = lines[i];
            auto tag = body.empty() ? ' ' : body.front();
            switch (tag) {
                case ' ':
                    if (old_left == 0 || new_left == 0) throw diff_error("hunk body longer than its header");
                    --old_left;
                    --new_left;
                    break;
                case '-':
                    if (old_left == 0) throw diff_error("hunk removes more lines than its header");
                    --old_left;
                    break;
                case '+':
                    if (new_left == 0) throw diff_error("hunk adds more lines than its header");
                    --new_left;
                    break;
                case '\\':
                    break;
                default:
                    throw diff_error("unexpected line in hunk: '" + std::string{body} + "'");
            }
            hunk.body.push_back(body);
            ++i;
        }
        if (old_left > 0 || new_left > 0) throw diff_error("hunk is shorter than its header");

        // "\ No newline at end of file" may close the hunk.
        while (i < lines.size() && lines[i].starts_with("\\")) {
            hunk.body.push_back(lines[i]);
            ++i;
        }
        parsed.hunks.push_back(std::move(hunk));
    }

    if (parsed.hunks.empty()) throw diff_error("diff contains no hunks");

    // A marker after a line that exists on the new side means the new
    // text ends without a newline; one after a removed line only means
    // the old text did.
    auto saw_marker = false;
    auto new_side_marker = false;
    for (const auto& hunk : parsed.hunks) {
        for (std::size_t j = 1; j < hunk.body.size(); ++j) {
            if (!hunk.body[j].starts_with("\\")) continue;
            saw_marker = true;
            auto prev = hunk.body[j - 1];
            if (prev.empty() || prev.front() != '-') new_side_marker = true;
        }
    }
    if (saw_marker) parsed.new_trailing_newline = !new_side_marker;
    return parsed;
}

}  // anonymous namespace

auto apply_unified_diff(std::string_view original, std::string_view diff) -> std::string {
    const auto source = split_lines(original);
    const auto parsed = parse_diff(diff);

    auto result = std::vector<std::string_view>{};
    std::size_t cursor = 0;

    for (const auto& hunk : parsed.hunks) {
        auto pos = hunk.old_range.count == 0 ? hunk.old_range.start
                                             : hunk.old_range.start - (hunk.old_range.start > 0 ? 1 : 0);
        if (pos < cursor || pos > source.lines.size()) {
            throw diff_error("hunk at line " + std::to_string(hunk.old_range.start) + " is out of order or out of range");
        }
        result.insert(result.end(), source.lines.begin() + static_cast<std::ptrdiff_t>(cursor),
                      source.lines.begin() + static_cast<std::ptrdiff_t>(pos));
        cursor = pos;

        for (auto body : hunk.body) {
            auto tag = body.empty() ? ' ' : body.front();
            auto text = body.empty() ? body : body.substr(1);
            if (tag == '\\') continue;
            if (tag == '+') {
                result.push_back(text);
                continue;
            }
            if (cursor >= source.lines.size() || source.lines[cursor] != text) {
                throw diff_error("diff does not match the text at line " + std::to_string(cursor + 1));
            }
            if (tag == ' ') result.push_back(text);
            ++cursor;
        }
    }
    result.insert(result.end(), source.lines.begin() + static_cast<std::ptrdiff_t>(cursor),
                  source.lines.end());

    auto out = std::string{};
    for (std::size_t i = 0; i < result.size(); ++i) {
        if (i > 0) out += '\n';
        out += result[i];
    }
    auto trailing = parsed.new_trailing_newline.value_or(
        source.lines.empty() || source.trailing_newline);
    if (trailing && !result.empty()) out += '\n';
    return out;
}

auto minimal_splice(const std::vector<std::string>& before, std::string_view after) -> TextSplice {
    // offsets[k] is the byte offset of piece k; offsets.back() the total.
    auto offsets = std::vector<std::size_t>{0};
    offsets.reserve(before.size() + 1);
    auto joined = std::string{};
    for (const auto& piece : before) {
        joined += piece;
        offsets.push_back(joined.size());
    }

    std::size_t common = 0;
    while (common < joined.size() && common < after.size() && joined[common] == after[common]) {
        ++common;
    }
    auto first = std::size_t{0};
    while (first + 1 < offsets.size() && offsets[first + 1] <= common) ++first;

    const auto room = std::min(joined.size(), after.size()) - offsets[first];
    std::size_t tail = 0;
    while (tail < room && joined[joined.size() - 1 - tail] == after[after.size() - 1 - tail]) ++tail;
    auto last = before.size();
    while (last > first && joined.size() - offsets[last - 1] <= tail) --last;

    const auto kept_tail = joined.size() - offsets[last];
    return TextSplice{
        .pos = first,
        .del = last - first,
        .insert = std::string{after.substr(offsets[first], after.size() - kept_tail - offsets[first])},
    };
}

auto minimal_splice(std::string_view before, std::string_view after) -> TextSplice {
    return minimal_splice(encoding::split_code_points(before), after);
}

}  // namespace amstore::detail
