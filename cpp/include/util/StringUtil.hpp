#pragma once

#include <string>
#include <vector>

namespace util {

/*
 * With an empty separator, splits on runs of whitespace and drops empty tokens:
 *
 * split(" --type=Cycle  --pattern=RRP ") -> {"--type=Cycle", "--pattern=RRP"}
 *
 * With a non-empty separator, splits on each occurrence of it and keeps empty tokens:
 *
 * split("a,,b", ",") -> {"a", "", "b"}
 */
std::vector<std::string> split(const std::string& s, const char* separator = "");

// s without leading and trailing whitespace.
std::string strip(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
