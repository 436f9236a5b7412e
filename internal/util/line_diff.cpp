#include "line_diff.hpp"

#include <algorithm>
#include <cstddef>

namespace infragraph::util {

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::string::size_type   start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::vector<std::string> LineDiff(const std::string& before, const std::string& after) {
  const auto a = SplitLines(before);
  const auto b = SplitLines(after);
  const auto n = a.size();
  const auto m = b.size();

  // lcs[i][j]: common subsequence length of a[i..] and b[j..]
  std::vector<std::vector<std::size_t>> lcs(n + 1, std::vector<std::size_t>(m + 1, 0));
  for (std::size_t i = n; i-- > 0;) {
    for (std::size_t j = m; j-- > 0;) {
      lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1 : std::max(lcs[i + 1][j], lcs[i][j + 1]);
    }
  }

  std::vector<std::string> out;
  out.reserve(n + m);
  std::size_t i = 0;
  std::size_t j = 0;
  while (i < n && j < m) {
    if (a[i] == b[j]) {
      out.push_back(" " + a[i]);
      ++i;
      ++j;
    } else if (lcs[i + 1][j] >= lcs[i][j + 1]) {
      out.push_back("-" + a[i++]);
    } else {
      out.push_back("+" + b[j++]);
    }
  }
  for (; i < n; ++i) out.push_back("-" + a[i]);
  for (; j < m; ++j) out.push_back("+" + b[j]);
  return out;
}

} // namespace infragraph::util
