#pragma once

#include <string>
#include <vector>

namespace infragraph::util {

/*
  Line diff of `before` against `after` along their longest common
  subsequence. Kept lines start with ' ', removed lines with '-', added
  lines with '+'. A trailing newline does not produce an empty line.
*/
std::vector<std::string> LineDiff(const std::string& before, const std::string& after);

std::vector<std::string> SplitLines(const std::string& text);

} // namespace infragraph::util
