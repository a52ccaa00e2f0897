#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Http"
#endif

#include "curl_http_adapter.h"

#include <mutex>

#include <curl/curl.h>

#include "defs.h"

namespace VinFastCloud {

namespace {

std::once_flag curl_init_flag;

size_t curl_write_cb(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *out = static_cast<std::string *>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

const char *method_name(HttpMethod method) { return method == HttpMethod::POST ? "POST" : "GET"; }

}  // namespace

CurlHttpAdapter::CurlHttpAdapter() {
  std::call_once(curl_init_flag, []() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      LOG_ERROR("curl_global_init failed: %s", curl_easy_strerror(rc));
    }
  });
}

HttpResponse CurlHttpAdapter::perform(const HttpRequest &request) {
  HttpResponse response;

  CURL *c = curl_easy_init();
  if (!c) {
    response.error = "curl_easy_init failed";
    LOG_ERROR("%s", response.error.c_str());
    return response;
  }

  struct curl_slist *hdrs = nullptr;
  for (const auto &header : request.headers) {
    std::string line = header.first + ": " + header.second;
    hdrs = curl_slist_append(hdrs, line.c_str());
  }

  curl_easy_setopt(c, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(c, CURLOPT_HTTPHEADER, hdrs);
  if (request.method == HttpMethod::POST) {
    curl_easy_setopt(c, CURLOPT_POST, 1L);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
  }

  curl_easy_setopt(c, CURLOPT_TIMEOUT, request.timeout_seconds);
  curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, curl_write_cb);
  curl_easy_setopt(c, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(c, CURLOPT_USERAGENT, user_agent_.c_str());

  LOG_VERBOSE("%s %s", method_name(request.method), request.url.c_str());
  CURLcode rc = curl_easy_perform(c);
  if (rc != CURLE_OK) {
    response.error = curl_easy_strerror(rc);
    LOG_WARNING("%s %s failed: %s", method_name(request.method), request.url.c_str(), response.error.c_str());
  } else {
    response.transport_ok = true;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &response.status);
    LOG_DEBUG("%s %s -> %ld (%zu bytes)", method_name(request.method), request.url.c_str(), response.status,
              response.body.size());
  }

  curl_slist_free_all(hdrs);
  curl_easy_cleanup(c);
  return response;
}

}  // namespace VinFastCloud
