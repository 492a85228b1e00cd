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

#include <quotegate/core/Logger.hpp>
#include <quotegate/util/Config.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

#include <sys/syscall.h>
#include <unistd.h>

namespace quotegate
{

/* Kernel thread id, as reported by top and ps */
static long current_tid() { return ::syscall(SYS_gettid); }


static const char* level_str(Logger::level l)
{
  switch (l) {
    case Logger::level::error:
      return "| ERROR | ";
    case Logger::level::warn:
      return "| WARN  | ";
    case Logger::level::note:
      return "| NOTE  | ";
    case Logger::level::info:
      return "| INFO  | ";
    case Logger::level::debug:
      return "| DEBUG | ";
  }
  return "| ????  | ";
}


/* "2024-05-21 | 07:51:17.000123", in UTC */
static std::string utc_timestamp()
{
  using namespace std::chrono;
  auto since_epoch =
      duration_cast<microseconds>(system_clock::now().time_since_epoch());
  time_t secs = static_cast<time_t>(duration_cast<seconds>(since_epoch).count());
  long usec = static_cast<long>((since_epoch % seconds(1)).count());

  struct tm parts;
  gmtime_r(&secs, &parts);

  char buf[40];
  snprintf(buf, sizeof(buf), "%04d-%02d-%02d | %02d:%02d:%02d.%06ld",
           parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
           parts.tm_hour, parts.tm_min, parts.tm_sec, usec);
  return buf;
}


Logger::Logger() : _out(&std::cout) { set_level(level::info); }


Logger& Logger::instance()
{
  static Logger logger;
  return logger;
}


void Logger::set_level(level l)
{
  int mask = 0;
  for (int bit = l; bit <= level::error; bit <<= 1)
    mask |= bit;
  _mask = mask;
}


void Logger::set_output(std::ostream* os)
{
  std::lock_guard<std::mutex> guard(_mutex);
  _out = os ? os : &std::cout;
}


/* Fixed width, so that messages line up; caller holds the mutex */
std::string Logger::thread_label(long tid)
{
  static const size_t width = 18;

  auto iter = _thread_labels.find(tid);
  std::string label = "| " + std::to_string(tid) + "/" +
                      (iter == _thread_labels.end() ? "????" : iter->second);
  label.resize(width - 1, ' ');
  return label + ' ';
}


void Logger::write(level lvl, const std::string& msg, const char* file,
                   int line)
{
  auto stamp = utc_timestamp();
  auto tid = current_tid();

  std::lock_guard<std::mutex> guard(_mutex);
  std::ostream& os = *_out;
  os << stamp;
  if (_detailed)
    os << " " << thread_label(tid);
  os << " " << level_str(lvl) << msg;
  if (_detailed) {
    auto parts = split(file, '/');
    os << " (" << (parts.empty() ? std::string() : parts.back()) << ":"
       << line << ")";
  }
  os << "\n";
  os.flush();
}


void Logger::register_thread_id(std::string label)
{
  auto tid = current_tid();
  std::lock_guard<std::mutex> guard(_mutex);
  _thread_labels[tid] = std::move(label);
}


Logger::level Logger::string_to_level(const std::string& s)
{
  static const std::map<std::string, level> names = {
      {"debug", level::debug}, {"info", level::info}, {"note", level::note},
      {"warn", level::warn},   {"error", level::error}};

  auto iter = names.find(s);
  if (iter == names.end())
    throw ConfigError("log level not recognised, " + s);
  return iter->second;
}


void Logger::configure_from_config(const Config& config)
{
  auto& logger = Logger::instance();
  logger.set_level(string_to_level(config.get_string("level", "info")));
  logger.set_detail(config.get_bool("detailed", false));
}

} // namespace quotegate
