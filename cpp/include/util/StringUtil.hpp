#pragma once

#include <string>
#include <vector>

namespace util {

/*
 * split("a b\tc")    -> {"a", "b", "c"}   (runs of whitespace, no empty tokens)
 * split("4,,8", ",") -> {"4", "", "8"}    (every separator counts)
 */
std::vector<std::string> split(const std::string& s, const char* sep = "");

// Whole-string base-10 parse. Throws util::CleanException on empty input, junk, or overflow.
int atoi_safe(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
