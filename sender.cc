#include "sender.hh"
#include <fmt/format.h>

using namespace std;

namespace {
struct SlistDeleter
{
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
}

static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  auto* dest = static_cast<string*>(userdata);
  dest->append(ptr, size * nmemb);
  return size * nmemb;
}

CurlGlobal::CurlGlobal()
{
  if(curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    throw DeliveryError("Could not initialize libcurl", CURLE_FAILED_INIT);
}

CurlGlobal::~CurlGlobal()
{
  curl_global_cleanup();
}

CurlSender::CurlSender() : d_curl(curl_easy_init())
{
  if(!d_curl)
    throw DeliveryError("Could not initialize libcurl", CURLE_FAILED_INIT);
  d_senderName = "curl";
}

HTTPResult CurlSender::send(const std::string& method, const std::string& url,
                            const HeaderSet& headers, const std::string& body)
{
  CURL* c = d_curl.get();
  curl_easy_reset(c);

  HTTPResult ret;
  std::unique_ptr<curl_slist, SlistDeleter> hlist;
  for(const auto& h : headers) {
    curl_slist* tmp = curl_slist_append(hlist.get(), fmt::format("{}: {}", h.first, h.second).c_str());
    if(!tmp)
      throw DeliveryError("Could not build header list", CURLE_OUT_OF_MEMORY);
    hlist.release();
    hlist.reset(tmp);
  }

  curl_easy_setopt(c, CURLOPT_URL, url.c_str());
  curl_easy_setopt(c, CURLOPT_USERAGENT, d_agent.c_str());
  curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(c, CURLOPT_WRITEDATA, &ret.body);
  if(hlist)
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, hlist.get());

  if(method == "POST") {
    curl_easy_setopt(c, CURLOPT_POST, 1L);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
  }
  else
    curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);

  CURLcode res = curl_easy_perform(c);
  if(res != CURLE_OK)
    throw DeliveryError(fmt::format("Could not send to {}: {}", url, curl_easy_strerror(res)), (int)res);

  curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &ret.status);
  return ret;
}
