#include "line_wrapper.h"
#include "test_support.h"

using namespace testsupport;

int main() {
  MetricsAdapter metrics = MakeMetrics(10.0, 5.0);
  const std::vector<std::string> tokens = {"aa", "bb", "cc"};

  auto wide = WrapTokens(tokens, 40.0, Style::Regular, 10.0, metrics);
  Expect(wide.size() == 1 && wide[0] == "aa bb cc",
         "a line exactly as wide as the limit fits");

  auto narrow = WrapTokens(tokens, 30.0, Style::Regular, 10.0, metrics);
  Expect(narrow.size() == 2 && narrow[0] == "aa bb" && narrow[1] == "cc",
         "greedy wrap fills the first line");

  // Wrapped lines never exceed the width unless a token is alone.
  const std::vector<std::string> mixed = {"a", "abcdefghij", "b", "cd"};
  auto lines = WrapTokens(mixed, 30.0, Style::Regular, 10.0, metrics);
  Expect(lines.size() == 3, "over-wide token gets its own line");
  if (lines.size() == 3) {
    Expect(lines[0] == "a", "text before the long token");
    Expect(lines[1] == "abcdefghij", "long token alone");
    Expect(lines[2] == "b cd", "text after the long token");
  }
  for (const auto &line : lines) {
    bool single = line.find(' ') == std::string::npos;
    Expect(single || metrics.Width(line, Style::Regular, 10.0) <= 30.0,
           "line '" + line + "' fits");
  }

  Expect(WrapTokens({}, 30.0, Style::Regular, 10.0, metrics).empty(),
         "no tokens, no lines");

  // Escapes.
  auto resolved = WrapTokens({"\\<r>", "\\\\x"}, 100.0, Style::Regular, 10.0,
                             metrics);
  Expect(resolved.size() == 1 && resolved[0] == "<r> \\x",
         "exactly one escape is removed per token");
  auto verbatim = WrapTokens({"\\<r>"}, 100.0, Style::Regular, 10.0, metrics,
                             EscapeMode::Verbatim);
  Expect(verbatim.size() == 1 && verbatim[0] == "\\<r>",
         "verbatim mode keeps tokens as they are");
  auto lone = WrapTokens({"\\"}, 100.0, Style::Regular, 10.0, metrics);
  Expect(lone.size() == 1 && lone[0] == "\\", "a lone backslash is text");

  // Resuming on a partially filled line.
  auto resumed = WrapTokens({"aa", "bb"}, 30.0, Style::Regular, 10.0, metrics,
                            EscapeMode::Resolve, 12.0);
  Expect(resumed.size() == 2 && resumed[0] == "aa" && resumed[1] == "bb",
         "first line uses the shorter width");
  auto pushed = WrapTokens({"aa", "bb"}, 30.0, Style::Regular, 10.0, metrics,
                           EscapeMode::Resolve, 8.0);
  Expect(pushed.size() == 2 && pushed[0].empty() && pushed[1] == "aa bb",
         "a first token that does not fit leaves the first line empty");

  auto text = WrapText("  aa\tbb   cc ", 40.0, Style::Regular, 10.0, metrics);
  Expect(text.size() == 1 && text[0] == "aa bb cc",
         "whitespace runs collapse");

  return FailureCount() ? 1 : 0;
}
