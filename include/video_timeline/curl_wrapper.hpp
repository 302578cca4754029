#pragma once

#include <atomic>
#include <curl/curl.h>
#include <istream>
#include <string>

namespace video_timeline {

class CurlGlobalManager {
public:
  static CurlGlobalManager &getInstance();
  CurlGlobalManager(const CurlGlobalManager &) = delete;
  CurlGlobalManager &operator=(const CurlGlobalManager &) = delete;

private:
  CurlGlobalManager();
  ~CurlGlobalManager();
};

class CurlEasyHandle {
private:
  CURL *handle;

public:
  CurlEasyHandle();
  ~CurlEasyHandle();
  CURL *get();

  CurlEasyHandle(const CurlEasyHandle &) = delete;
  CurlEasyHandle &operator=(const CurlEasyHandle &) = delete;
};

// One HTTP request. perform() throws std::runtime_error on transport errors
// and HTTP status >= 400, ProcessingCancelled when the cancel flag is raised
// mid-transfer.
class CurlWrapper {
private:
  CurlEasyHandle easyHandle;
  std::string responseBuffer;
  std::string postBuffer;
  struct curl_slist *headers;
  const std::atomic<bool> *cancelFlag;

  static size_t WriteCallback(void *contents, size_t size, size_t nmemb,
                              std::string *s);
  static int ProgressCallback(void *clientp, curl_off_t dltotal,
                              curl_off_t dlnow, curl_off_t ultotal,
                              curl_off_t ulnow);

public:
  CurlWrapper();
  ~CurlWrapper();

  CurlWrapper(const CurlWrapper &) = delete;
  CurlWrapper &operator=(const CurlWrapper &) = delete;

  CurlWrapper &setUrl(const std::string &url);
  CurlWrapper &setPostFields(std::string data);
  // POST body read from the stream in chunks; the stream must outlive
  // perform().
  CurlWrapper &setUploadStream(std::istream &body, curl_off_t size);
  CurlWrapper &setGet();
  CurlWrapper &addHeader(const std::string &header);
  CurlWrapper &setTimeoutSeconds(long seconds);
  CurlWrapper &setCancelFlag(const std::atomic<bool> *flag);
  std::string perform();

  // Public for testing
  static size_t ReadCallback(char *buffer, size_t size, size_t nitems,
                             std::istream *in);
};

} // namespace video_timeline
