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

#include <quotegate/util/utils.hpp>
#include <quotegate/core/Logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <memory>

#include <openssl/evp.h>

#include <cxxabi.h>
#include <semaphore.h>
#include <signal.h>

namespace quotegate
{

std::vector<std::string> split(const std::string_view& s, char d)
{
  std::vector<std::string> items;
  if (s.empty())
    return items;

  size_t start = 0;
  for (size_t pos; (pos = s.find(d, start)) != std::string_view::npos;
       start = pos + 1)
    items.emplace_back(s.substr(start, pos - start));
  items.emplace_back(s.substr(start));
  return items;
}


std::string base64_encode(const unsigned char* src, size_t len)
{
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes, plus a terminating null
  std::string out(4 * ((len + 2) / 3) + 1, '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), src,
                          static_cast<int>(len));
  out.resize(n > 0 ? n : 0);
  return out;
}


std::string demangle(const char* name)
{
  int status = -1;
  std::unique_ptr<char, void (*)(void*)> readable{
      abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free};
  return (status == 0 && readable) ? std::string(readable.get()) : name;
}


std::string current_exception_text()
{
  try {
    throw;
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}


void log_exception(const char* site)
{
  LOG_WARN("exception at " << site << ": " << current_exception_text());
}


void log_message_exception(const char* source, const std::string& data)
{
  LOG_WARN("message processing error, from: "
           << source << ", error: " << current_exception_text()
           << ", message: " << data);
}


std::string str_tolower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}


// sem_post is async-signal-safe
static sem_t sigint_sem;

extern "C" void on_sigint(int) { sem_post(&sigint_sem); }


void wait_for_sigint()
{
  sem_init(&sigint_sem, 0, 0);

  struct sigaction action = {};
  action.sa_handler = on_sigint;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);

  while (sem_wait(&sigint_sem) == -1 && errno == EINTR) {
  }
}

} // namespace quotegate
