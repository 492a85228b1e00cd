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

#include <quotegate/util/utils.hpp>

#include <map>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>


namespace quotegate
{
class Config;

/* Process-wide log sink.  Each line carries a UTC timestamp and the level;
 * detailed mode adds the thread label and source location. */
class Logger
{
public:
  enum level {
    debug = 1,
    info = 1 << 2,
    note = 1 << 3,
    warn = 1 << 4,
    error = 1 << 5
  };

  static level string_to_level(const std::string&);

  static Logger& instance();

  /* Apply the "level" and "detailed" fields of a logging config section */
  static void configure_from_config(const Config&);

  bool wants_level(level l) const { return (l & _mask) != 0; }

  /* Enable `l` and every level more severe than it */
  void set_level(level l);

  void set_detail(bool want_detail) { _detailed = want_detail; }

  /* Redirect log lines, eg to a string stream; null restores std::cout */
  void set_output(std::ostream*);

  void write(level, const std::string&, const char* file, int line);

  /* Label the calling thread in detailed log lines */
  void register_thread_id(std::string);

private:
  Logger();
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  std::string thread_label(long tid);

  int _mask;
  bool _detailed = false;
  std::ostream* _out;
  std::mutex _mutex;
  std::map<long, std::string> _thread_labels;
};


#define _QUOTEGATE_LOGIMPL_(msg, LEVEL)                                 \
  do {                                                                  \
    quotegate::Logger& logger = quotegate::Logger::instance();          \
    if (logger.wants_level(LEVEL)) {                                    \
      std::ostringstream _s;                                            \
      _s << msg;                                                        \
      logger.write(LEVEL, _s.str(), __FILE__, __LINE__);                \
    }} while (0)


#define LOG_DEBUG(X) _QUOTEGATE_LOGIMPL_(X, quotegate::Logger::level::debug)

#define LOG_INFO(X) _QUOTEGATE_LOGIMPL_(X, quotegate::Logger::level::info)

#define LOG_NOTICE(X) _QUOTEGATE_LOGIMPL_(X, quotegate::Logger::level::note)

#define LOG_WARN(X) _QUOTEGATE_LOGIMPL_(X, quotegate::Logger::level::warn)

#define LOG_ERROR(X) _QUOTEGATE_LOGIMPL_(X, quotegate::Logger::level::error)

#ifndef QUOTE
#define QUOTE(X) "'" << X << "'"
#endif

} // namespace quotegate
