#include <amstore/path.hpp>
#include <amstore/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace amstore;

namespace {

auto key(std::string name) -> Segment { return MapKey{std::move(name)}; }
auto idx(std::size_t i) -> Segment { return ArrayIndex{i}; }

void expect_parse_error(std::string_view raw) {
    try {
        (void)Path::parse(raw);
        ADD_FAILURE() << "expected parse_error for '" << raw << "'";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::parse_error) << raw;
        EXPECT_NE(std::string{e.what()}.find(std::string{raw}), std::string::npos)
            << "message should name the offending path: " << e.what();
    }
}

}  // namespace

// -- Accepted forms -----------------------------------------------------------

TEST(Path, single_bare_key) {
    auto p = Path::parse("name");
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p.segments()[0], key("name"));
}

TEST(Path, mixed_keys_and_indices) {
    auto p = Path::parse("users[0].profile.name");
    EXPECT_EQ(p.segments(),
              (std::vector<Segment>{key("users"), idx(0), key("profile"), key("name")}));
}

TEST(Path, root_marker_is_stripped) {
    const auto expected = Path::parse("users[0].profile.name");
    EXPECT_EQ(Path::parse("$.users[0].profile.name"), expected);
}

TEST(Path, consecutive_indices) {
    auto p = Path::parse("grid[2][13]");
    EXPECT_EQ(p.segments(), (std::vector<Segment>{key("grid"), idx(2), idx(13)}));
}

TEST(Path, key_characters_other_than_separators_are_kept) {
    auto p = Path::parse("$.a-b c$.x_1");
    EXPECT_EQ(p.segments(), (std::vector<Segment>{key("a-b c$"), key("x_1")}));
}

TEST(Path, large_index) {
    auto p = Path::parse("l[18446744073709551615]");
    EXPECT_EQ(p.segments()[1], idx(18446744073709551615ull));
}

// -- Rejected forms -----------------------------------------------------------

TEST(Path, empty_is_rejected) {
    expect_parse_error("");
    expect_parse_error("$");
    expect_parse_error("$.");
}

TEST(Path, misplaced_dots_are_rejected) {
    expect_parse_error(".a");
    expect_parse_error("a.");
    expect_parse_error("a..b");
    expect_parse_error("$..a");
}

TEST(Path, bad_bracket_content_is_rejected) {
    expect_parse_error("a[]");
    expect_parse_error("a[x]");
    expect_parse_error("a[-1]");
    expect_parse_error("a[1.5]");
    expect_parse_error("a[ 1]");
    expect_parse_error("a[99999999999999999999999]");
}

TEST(Path, unterminated_or_stray_brackets_are_rejected) {
    expect_parse_error("a[1");
    expect_parse_error("a]");
    expect_parse_error("[0]");
    expect_parse_error("a.[0]");
    expect_parse_error("a[0]b");
}

// -- Helpers ------------------------------------------------------------------

TEST(Path, parent_drops_terminal) {
    auto p = Path::parse("a.b[3]");
    EXPECT_EQ(p.terminal(), idx(3));
    EXPECT_EQ(p.parent(), Path::parse("a.b"));
    EXPECT_TRUE(Path::parse("a").parent().empty());
}

TEST(Path, to_string_renders_canonical_form) {
    EXPECT_EQ(Path::parse("$.users[0].profile.name").to_string(), "users[0].profile.name");
    EXPECT_EQ(Path::parse("grid[1][2]").to_string(), "grid[1][2]");
    EXPECT_EQ(Path{}.to_string(), "");
}
