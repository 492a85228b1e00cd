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

#include <quotegate/infra/CurlTransport.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/util/Error.hpp>

#include <mutex>
#include <sstream>

#include <curl/curl.h>

namespace quotegate
{

static size_t write_callback(char* contents, size_t size, size_t nmemb,
                             void* userp)
{
  static_cast<std::string*>(userp)->append(contents, size * nmemb);
  return size * nmemb;
}


static void curl_global_setup()
{
  static std::once_flag flag;
  std::call_once(flag, []() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK)
      THROW("curl_global_init failed, error '" << curl_easy_strerror(rc) << "'");
  });
}


std::string url_encode(const std::string& s)
{
  curl_global_setup();

  CURL* curl = curl_easy_init();
  if (!curl)
    throw TransportError("curl_easy_init failed");
  char* escaped = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
  scope_guard cleanup([&]() {
    curl_free(escaped);
    curl_easy_cleanup(curl);
  });

  if (!escaped)
    throw TransportError("failed to url-encode value");
  return escaped;
}


/* Request url with the url-encoded query parameters appended */
static std::string build_url(const HttpRequest& request)
{
  std::string url = request.url;
  char sep = (url.find('?') == std::string::npos) ? '?' : '&';

  for (auto& item : request.query) {
    url += sep;
    url += url_encode(item.first);
    url += '=';
    url += url_encode(item.second);
    sep = '&';
  }
  return url;
}


/* The request for logging: parameter and header names only, since either may
 * carry the provider credential. */
static std::string describe(const HttpRequest& request)
{
  std::ostringstream oss;
  oss << to_string(request.method) << " " << request.url;

  const char* sep = " params: ";
  for (auto& item : request.query) {
    oss << sep << item.first;
    sep = ",";
  }
  sep = " headers: ";
  for (auto& item : request.headers) {
    oss << sep << item.first;
    sep = ",";
  }
  return oss.str();
}


CurlTransport::CurlTransport() { curl_global_setup(); }


HttpResponse CurlTransport::perform(const HttpRequest& request)
{
  CURL* curl = curl_easy_init();
  if (!curl)
    throw TransportError("curl_easy_init failed");

  struct curl_slist* list = nullptr;
  scope_guard cleanup([&]() {
    curl_easy_cleanup(curl);
    curl_slist_free_all(list);
  });

  HttpResponse response;
  auto url = build_url(request);
  LOG_DEBUG("http request " << describe(request));

  if (request.connect_timeout.count() > 0)
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connect_timeout.count()));
  if (request.timeout.count() > 0)
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

  if (request.method == HttpMethod::post) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
  }
  else
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

  if (!request.headers.empty()) {
    for (auto& header : request.headers) {
      auto line = header.first + ": " + header.second;
      list = curl_slist_append(list, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
  }

  CURLcode res = curl_easy_perform(curl);

  if (res != CURLE_OK) {
    std::ostringstream oss;
    oss << "http-request failed, error '" << curl_easy_strerror(res) << "'";
    throw TransportError(oss.str());
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

} // namespace quotegate
