/* Copyright 2024 Automated Algo (www.automatedalgo.com)

This file is part of Automated Algo's "Quotegate" project.

Quotegate is free software: you can redistribute it and/or modify it under the
terms of the GNU Lesser General Public License as published by the Free
Software Foundation, either version 3 of the License, or (at your option) any
later version.

Quotegate is distributed in the hope that it will be useful, but WITHOUT ANY
WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License along
with Quotegate. If not, see <https://www.gnu.org/licenses/>.
*/

#pragma once

/* quicktest is a small test framework.  It compiles quickly, and usage
 * follows catch.hpp: TEST_CASE, REQUIRE, REQUIRE_THROWS_AS, INFO and
 * CAPTURE.  Test cases run in declaration order; command line arguments, if
 * any, select the test cases to run by name.
 */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace quicktest
{

inline const char* colour_none(int bold = 0)
{
  return bold ? "\033[1m" : "\033[0m";
}

inline const char* colour_red(int bold = 0)
{
  return bold ? "\033[1;31m" : "\033[0;31m";
}

inline const char* colour_green(int bold = 0)
{
  return bold ? "\033[1;32m" : "\033[0;32m";
}

inline const char* colour_yellow(int bold = 0)
{
  return bold ? "\033[1;33m" : "\033[0;33m";
}

inline const char* colour_cyan(int bold = 0)
{
  return bold ? "\033[1;36m" : "\033[0;36m";
}

/* Thrown by a failed REQUIRE, to abandon the current test case */
class test_failure : public std::exception
{
public:
  const char* what() const noexcept override { return "test failure"; }
};

class test_case;

struct registry {
  std::vector<test_case*> tests;
  std::map<std::string, test_case*> by_name;
  test_case* current = nullptr;

  static registry& instance()
  {
    static registry __instance;
    return __instance;
  }
};

inline void raise_error(const std::string& msg, const char* file, int line);

#define INFO(X) std::cout << X << std::endl

#define CAPTURE(X)                                                             \
  std::cout << quicktest::colour_cyan() << #X << ": " << X                     \
            << quicktest::colour_none() << std::endl

#define REQUIRE(X)                                                             \
  do {                                                                         \
    bool b = static_cast<bool>(X);                                             \
    if (!b) {                                                                  \
      quicktest::raise_error("REQUIRE( " #X " )", __FILE__, __LINE__);         \
      throw quicktest::test_failure();                                         \
    }                                                                          \
  } while (false)

#define REQUIRE_THROWS_AS(EXPR, EXC)                                           \
  do {                                                                         \
    bool caught = false;                                                       \
    try {                                                                      \
      EXPR;                                                                    \
    } catch (const EXC&) {                                                     \
      caught = true;                                                           \
    }                                                                          \
    if (!caught) {                                                             \
      quicktest::raise_error("REQUIRE_THROWS_AS( " #EXPR ", " #EXC " )",       \
                             __FILE__, __LINE__);                              \
      throw quicktest::test_failure();                                         \
    }                                                                          \
  } while (false)

#define REQUIRE_NOTHROW(EXPR)                                                  \
  do {                                                                         \
    try {                                                                      \
      EXPR;                                                                    \
    } catch (const std::exception& e) {                                        \
      quicktest::raise_error(std::string("REQUIRE_NOTHROW( " #EXPR " ): ") +   \
                                 e.what(),                                     \
                             __FILE__, __LINE__);                              \
      throw quicktest::test_failure();                                         \
    }                                                                          \
  } while (false)


class test_case
{
public:
  test_case(std::string label, std::string file, int line)
    : _label(std::move(label)), _file(std::move(file)), _line(line)
  {
    auto& reg = registry::instance();
    if (reg.by_name.count(_label)) {
      std::cout << "error, duplicate test_case '" << _label << "'"
                << std::endl;
      std::exit(1);
    }
    reg.tests.push_back(this);
    reg.by_name.insert({_label, this});
  }

  virtual ~test_case() = default;

  virtual void impl() = 0;

  const std::string& testname() const { return _label; }

  void failed(const std::string& err, const char* file, int line)
  {
    _has_failed = true;
    std::cout << colour_yellow() << err << " (" << file << ":" << line << ")"
              << colour_none() << std::endl;
  }

  /* Returns true on pass */
  bool run()
  {
    _has_failed = false;
    std::cout << std::endl
              << "test_case: " << colour_none(1) << _label << colour_none()
              << std::endl;
    std::cout << "location : " << _file << ":" << _line << std::endl;

    auto start = std::chrono::steady_clock::now();
    try {
      impl();
    } catch (const test_failure&) {
      _has_failed = true;
    } catch (const std::exception& e) {
      _has_failed = true;
      std::cout << colour_yellow() << "exception: " << e.what()
                << colour_none() << std::endl;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::cout << "[" << (_has_failed ? colour_red(1) : colour_green(1))
              << (_has_failed ? "fail" : "pass") << colour_none() << "] "
              << _label << " (" << elapsed.count() << "ms)" << std::endl;
    return !_has_failed;
  }

private:
  std::string _label;
  std::string _file;
  int _line;
  bool _has_failed = false;
};


inline void banner(char c = '=')
{
  std::cout << std::string(60, c) << std::endl;
}


inline int run(int argc, char** argv)
{
  auto& reg = registry::instance();

  std::vector<test_case*> selected;
  if (argc > 1) {
    for (int i = 1; i < argc; ++i) {
      auto it = reg.by_name.find(argv[i]);
      if (it == reg.by_name.end()) {
        std::cout << "error, no test_case named '" << argv[i] << "'"
                  << std::endl;
        return 1;
      }
      selected.push_back(it->second);
    }
  } else
    selected = reg.tests;

  banner();
  std::cout << "QUICK_TEST: " << argv[0] << std::endl;
  banner();

  std::vector<std::pair<std::string, bool>> results;
  for (auto tc : selected) {
    reg.current = tc;
    banner('-');
    results.emplace_back(tc->testname(), tc->run());
  }
  reg.current = nullptr;

  banner();
  std::cout << "Results" << std::endl;
  banner();

  int count_fail = 0;
  for (auto& r : results) {
    std::cout << "[" << (r.second ? colour_green(1) : colour_red(1))
              << (r.second ? "pass" : "fail") << colour_none() << "] "
              << r.first << std::endl;
    count_fail += !r.second;
  }

  std::cout << std::endl
            << "total " << results.size() << ", passes "
            << (results.size() - count_fail) << ", failures " << count_fail
            << std::endl;

  return count_fail;
}


inline void raise_error(const std::string& msg, const char* file, int line)
{
  if (auto tc = registry::instance().current)
    tc->failed(msg, file, line);
}

} // namespace quicktest

#define QUICKTEST_CONCAT2(A, B) A##B
#define QUICKTEST_CONCAT(A, B) QUICKTEST_CONCAT2(A, B)

#define TEST_CASE_IMPL(label, file, line, token)                               \
  static void QUICKTEST_CONCAT(impl_, token)();                                \
  namespace                                                                    \
  {                                                                            \
  class token : public quicktest::test_case                                    \
  {                                                                            \
  public:                                                                      \
    token(std::string l, std::string f, int n) : test_case(l, f, n) {}         \
    void impl() override { QUICKTEST_CONCAT(impl_, token)(); }                 \
  };                                                                           \
  token QUICKTEST_CONCAT(instance_, token)(label, file, line);                 \
  }                                                                            \
  static void QUICKTEST_CONCAT(impl_, token)()

#define TEST_CASE(X)                                                           \
  TEST_CASE_IMPL(X, __FILE__, __LINE__,                                        \
                 QUICKTEST_CONCAT(quicktest__, __LINE__))

/* Define main() in one source of each test executable */
#define QUICKTEST_MAIN()                                                       \
  int main(int argc, char** argv)                                              \
  {                                                                            \
    try {                                                                      \
      int result = quicktest::run(argc, argv);                                 \
      return (result < 0xFF ? result : 0xFF);                                  \
    } catch (std::exception & e) {                                             \
      std::cout << e.what() << std::endl;                                      \
      return 1;                                                                \
    }                                                                          \
  }
