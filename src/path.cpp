#include <amstore/path.hpp>
#include <amstore/error.hpp>

#include <charconv>

namespace amstore {

namespace {

[[noreturn]] void fail(std::string_view raw, std::string_view why) {
    throw Exception{ErrorKind::parse_error,
                    std::string{why} + " in path '" + std::string{raw} + "'"};
}

auto parse_index(std::string_view raw, std::string_view digits) -> std::size_t {
    if (digits.empty()) fail(raw, "empty index");
    for (auto c : digits) {
        if (c < '0' || c > '9') fail(raw, "non-numeric index '" + std::string{digits} + "'");
    }
    auto value = std::size_t{0};
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || end != digits.data() + digits.size()) {
        fail(raw, "index out of range '" + std::string{digits} + "'");
    }
    return value;
}

}  // anonymous namespace

auto to_string(const Segment& segment) -> std::string {
    if (const auto* key = std::get_if<MapKey>(&segment)) return key->name;
    return "[" + std::to_string(std::get<ArrayIndex>(segment).index) + "]";
}

auto Path::parse(std::string_view raw) -> Path {
    auto rest = raw;
    if (rest.starts_with("$.")) {
        rest.remove_prefix(2);
    } else if (rest == "$") {
        rest = {};
    }
    if (rest.empty()) fail(raw, "empty path");

    auto segments = std::vector<Segment>{};
    auto pos = std::size_t{0};

    while (true) {
        // key
        auto key_end = rest.find_first_of(".[]", pos);
        if (key_end == std::string_view::npos) key_end = rest.size();
        if (key_end == pos) {
            if (pos < rest.size() && rest[pos] == ']') fail(raw, "unexpected ']'");
            if (pos < rest.size() && rest[pos] == '[') fail(raw, "index without a key");
            fail(raw, pos == 0 ? "leading '.'" : (pos == rest.size() ? "trailing '.'" : "empty segment"));
        }
        segments.emplace_back(MapKey{std::string{rest.substr(pos, key_end - pos)}});
        pos = key_end;

        // zero or more [n]
        while (pos < rest.size() && rest[pos] == '[') {
            auto close = rest.find(']', pos + 1);
            if (close == std::string_view::npos) fail(raw, "unterminated '['");
            segments.emplace_back(ArrayIndex{parse_index(raw, rest.substr(pos + 1, close - pos - 1))});
            pos = close + 1;
        }

        if (pos == rest.size()) break;
        if (rest[pos] != '.') fail(raw, std::string{"unexpected '"} + rest[pos] + "'");
        ++pos;
    }

    return Path{std::move(segments)};
}

auto Path::parent() const -> Path {
    return Path{std::vector<Segment>(segments_.begin(), segments_.end() - 1)};
}

auto Path::to_string() const -> std::string {
    auto out = std::string{};
    for (const auto& seg : segments_) {
        if (std::holds_alternative<MapKey>(seg) && !out.empty()) out += '.';
        out += amstore::to_string(seg);
    }
    return out;
}

}  // namespace amstore
