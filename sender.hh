#pragma once
#include <memory>
#include <string>
#include <curl/curl.h>
#include "ntfy.hh"

struct HTTPResult
{
  long status = 0;
  std::string body;
};

// libcurl's global state for as long as this lives
class CurlGlobal
{
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

class Sender
{
public:
  virtual ~Sender() = default;
  // throws DeliveryError if no HTTP response came back at all
  virtual HTTPResult send(const std::string& method, const std::string& url,
                          const HeaderSet& headers, const std::string& body) = 0;
  std::string getSenderName() { return d_senderName; }
protected:
  std::string d_senderName;
};

// one easy handle, no redirects followed, no timeouts beyond libcurl's own
class CurlSender : public Sender
{
public:
  CurlSender();
  CurlSender(const CurlSender&) = delete;
  HTTPResult send(const std::string& method, const std::string& url,
                  const HeaderSet& headers, const std::string& body) override;
private:
  struct CurlDeleter
  {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
  };
  std::unique_ptr<CURL, CurlDeleter> d_curl;
  std::string d_agent = "ntfy-cli/" NTFYCLI_VERSION;
};
