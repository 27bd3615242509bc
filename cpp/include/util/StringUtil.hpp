#pragma once

/*
 * Various string utilities
 */
#include <string>
#include <vector>

namespace util {

/*
 * Parses s as a base-10 int. Raises util::CleanException if s is not entirely an integer (surrounding
 * whitespace is allowed).
 */
int atoi_safe(const std::string& s);

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

/*
 * splitlines(s) behaves just like s.splitlines() in python.
 */
std::vector<std::string> splitlines(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
