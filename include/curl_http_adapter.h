#pragma once

#include "adapters.h"

namespace VinFastCloud {

/**
 * @brief HttpAdapter on top of libcurl's easy interface.
 *
 * One easy handle per request, so instances can be shared between threads. Redirects are not
 * followed and signals are disabled for timeouts.
 */
class CurlHttpAdapter : public HttpAdapter {
 public:
  CurlHttpAdapter();

  HttpResponse perform(const HttpRequest &request) override;

  void set_user_agent(const std::string &user_agent) { user_agent_ = user_agent; }

 private:
  std::string user_agent_ = "vinfast-cloud/1.0";
};

}  // namespace VinFastCloud
