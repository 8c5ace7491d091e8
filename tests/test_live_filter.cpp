#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli/live_filter.hpp"
#include "test_support.hpp"

using ht::KeyEvent;
using ht::KeyKind;
using ht::SelectOutcome;
using ht_test::ScriptedKeys;

namespace {

using Names = std::vector<std::string>;
using NameFilter = ht::LiveFilter<std::string>;

NameFilter MakeFilter(Names names, size_t limit = 5) {
  return NameFilter(std::move(names), [](const std::string& s) { return s; }, limit);
}

void TypeInto(NameFilter& f, const std::string& text) {
  for (const auto& c : ht_test::Utf8Chars(text)) f.Feed(KeyEvent::Char(c));
}

const Names kSample = {"Running",   "Reading",    "Meditation", "Exercise",
                       "Journaling", "Morning Run", "Run at Night", "Yoga"};

}  // namespace

TEST(LiveFilterTest, EmptyQueryShowsFirstCandidates) {
  auto f = MakeFilter(kSample);
  EXPECT_EQ(f.query(), "");
  EXPECT_EQ(f.match_labels(),
            (Names{"Running", "Reading", "Meditation", "Exercise", "Journaling"}));
}

TEST(LiveFilterTest, CaseInsensitiveSubstring) {
  auto f = MakeFilter({"Running", "Reading", "Run at Night"});
  TypeInto(f, "run");
  EXPECT_EQ(f.match_labels(), (Names{"Running", "Run at Night"}));

  auto g = MakeFilter(kSample);
  TypeInto(g, "RUN");
  EXPECT_EQ(g.match_labels(), (Names{"Running", "Morning Run", "Run at Night"}));
}

TEST(LiveFilterTest, LimitCapsDisplayedMatches) {
  auto f = MakeFilter(kSample, 2);
  TypeInto(f, "n");
  EXPECT_EQ(f.match_labels(), (Names{"Running", "Reading"}));
  EXPECT_EQ(f.limit(), 2u);
}

TEST(LiveFilterTest, BackspaceWidensAndIsSafeWhenEmpty) {
  auto f = MakeFilter(kSample);
  TypeInto(f, "yo");
  EXPECT_EQ(f.match_labels(), (Names{"Yoga"}));
  f.Feed(KeyEvent::Of(KeyKind::Backspace));
  EXPECT_EQ(f.query(), "y");
  f.Feed(KeyEvent::Of(KeyKind::Backspace));
  f.Feed(KeyEvent::Of(KeyKind::Backspace));
  EXPECT_EQ(f.query(), "");
  EXPECT_EQ(f.matches().size(), 5u);
}

TEST(LiveFilterTest, SelectionWrapsAndResetsOnEdit) {
  auto f = MakeFilter(kSample);
  TypeInto(f, "run");
  f.Feed(KeyEvent::Of(KeyKind::ArrowUp));
  EXPECT_EQ(f.selected_index(), 2u);
  EXPECT_EQ(f.selected(), "Run at Night");
  f.Feed(KeyEvent::Of(KeyKind::ArrowDown));
  EXPECT_EQ(f.selected_index(), 0u);
  f.Feed(KeyEvent::Of(KeyKind::ArrowDown));
  EXPECT_EQ(f.selected(), "Morning Run");

  f.Feed(KeyEvent::Char('n'));
  EXPECT_EQ(f.selected_index(), 0u);
  EXPECT_EQ(f.match_labels(), (Names{"Running"}));
}

TEST(LiveFilterTest, EnterWithoutMatchesKeepsGoing) {
  auto f = MakeFilter(kSample);
  TypeInto(f, "zzz");
  EXPECT_TRUE(f.matches().empty());
  EXPECT_EQ(f.Feed(KeyEvent::Of(KeyKind::ArrowDown)), NameFilter::Step::Continue);
  EXPECT_EQ(f.Feed(KeyEvent::Of(KeyKind::Enter)), NameFilter::Step::Continue);
  EXPECT_EQ(f.Feed(KeyEvent::Of(KeyKind::Escape)), NameFilter::Step::Cancelled);
}

TEST(RunLiveFilterTest, TypeNavigateSelect) {
  auto f = MakeFilter(kSample);
  ScriptedKeys keys;
  keys.Type("run");
  keys.Press(KeyKind::ArrowDown);
  keys.Press(KeyKind::Enter);
  std::vector<std::string> queries;
  auto result = ht::RunLiveFilter(f, keys, [&](const NameFilter& cur) { queries.push_back(cur.query()); });
  EXPECT_EQ(result.outcome, SelectOutcome::Selected);
  ASSERT_TRUE(result.item.has_value());
  EXPECT_EQ(*result.item, "Morning Run");
  EXPECT_EQ(queries, (Names{"", "r", "ru", "run", "run"}));
}

TEST(RunLiveFilterTest, InterruptEndsTheLoop) {
  auto f = MakeFilter(kSample);
  ScriptedKeys keys;
  keys.Type("zz");
  keys.Press(KeyKind::Enter);
  auto result = ht::RunLiveFilter(f, keys, [](const NameFilter&) {});
  EXPECT_EQ(result.outcome, SelectOutcome::Interrupted);
  EXPECT_FALSE(result.item.has_value());
}

TEST(LiveFilterTest, MultibyteCharacters) {
  auto f = MakeFilter({"Caf\xc3\xa9", "Cafeteria", "Th\xc3\xa9 vert"});
  TypeInto(f, "caf\xc3\xa9");
  EXPECT_EQ(f.query(), "caf\xc3\xa9");
  EXPECT_EQ(f.match_labels(), (Names{"Caf\xc3\xa9"}));

  f.Feed(KeyEvent::Of(KeyKind::Backspace));
  EXPECT_EQ(f.query(), "caf");
  EXPECT_EQ(f.match_labels(), (Names{"Caf\xc3\xa9", "Cafeteria"}));

  f.Feed(KeyEvent::Of(KeyKind::Backspace));
  f.Feed(KeyEvent::Of(KeyKind::Backspace));
  f.Feed(KeyEvent::Of(KeyKind::Backspace));
  f.Feed(KeyEvent::Char("\xc3\xa9"));
  EXPECT_EQ(f.match_labels(), (Names{"Caf\xc3\xa9", "Th\xc3\xa9 vert"}));
}

TEST(LiveFilterTest, PopUtf8Char) {
  std::string s = "a\xe2\x82\xac";  // a + euro sign
  ht::pop_utf8_char(s);
  EXPECT_EQ(s, "a");
  ht::pop_utf8_char(s);
  EXPECT_EQ(s, "");
  ht::pop_utf8_char(s);
  EXPECT_EQ(s, "");
}
