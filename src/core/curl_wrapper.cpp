#include "video_timeline/curl_wrapper.hpp"
#include "video_timeline/errors.hpp"
#include <stdexcept>

namespace video_timeline {

// CurlGlobalManager implementation
CurlGlobalManager &CurlGlobalManager::getInstance() {
  static CurlGlobalManager instance;
  return instance;
}

CurlGlobalManager::CurlGlobalManager() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize libcurl");
  }
}

CurlGlobalManager::~CurlGlobalManager() { curl_global_cleanup(); }

// CurlEasyHandle implementation
CurlEasyHandle::CurlEasyHandle() : handle(curl_easy_init()) {
  if (!handle) {
    throw std::runtime_error("Failed to create CURL handle");
  }
}

CurlEasyHandle::~CurlEasyHandle() {
  if (handle) {
    curl_easy_cleanup(handle);
  }
}

CURL *CurlEasyHandle::get() { return handle; }

// CurlWrapper implementation
size_t CurlWrapper::WriteCallback(void *contents, size_t size, size_t nmemb,
                                  std::string *s) {
  size_t newLength = size * nmemb;
  try {
    s->append(static_cast<char *>(contents), newLength);
    return newLength;
  } catch (const std::bad_alloc &) {
    return 0;
  }
}

size_t CurlWrapper::ReadCallback(char *buffer, size_t size, size_t nitems,
                                 std::istream *in) {
  in->read(buffer, static_cast<std::streamsize>(size * nitems));
  if (in->bad()) {
    return CURL_READFUNC_ABORT;
  }
  return static_cast<size_t>(in->gcount());
}

int CurlWrapper::ProgressCallback(void *clientp, curl_off_t, curl_off_t,
                                  curl_off_t, curl_off_t) {
  const auto *flag = static_cast<const std::atomic<bool> *>(clientp);
  // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
  return (flag && flag->load()) ? 1 : 0;
}

CurlWrapper::CurlWrapper() : headers(nullptr), cancelFlag(nullptr) {
  CurlGlobalManager::getInstance(); // Ensure global initialization
  curl_easy_setopt(easyHandle.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(easyHandle.get(), CURLOPT_WRITEDATA, &responseBuffer);
  curl_easy_setopt(easyHandle.get(), CURLOPT_NOSIGNAL, 1L);
}

CurlWrapper::~CurlWrapper() {
  if (headers) {
    curl_slist_free_all(headers);
  }
}

CurlWrapper &CurlWrapper::setUrl(const std::string &url) {
  curl_easy_setopt(easyHandle.get(), CURLOPT_URL, url.c_str());
  return *this;
}

CurlWrapper &CurlWrapper::setPostFields(std::string data) {
  // libcurl does not copy CURLOPT_POSTFIELDS, keep the body alive here.
  postBuffer = std::move(data);
  curl_easy_setopt(easyHandle.get(), CURLOPT_POSTFIELDS, postBuffer.data());
  curl_easy_setopt(easyHandle.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(postBuffer.size()));
  return *this;
}

CurlWrapper &CurlWrapper::setUploadStream(std::istream &body,
                                          curl_off_t size) {
  curl_easy_setopt(easyHandle.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(easyHandle.get(), CURLOPT_READFUNCTION, ReadCallback);
  curl_easy_setopt(easyHandle.get(), CURLOPT_READDATA, &body);
  curl_easy_setopt(easyHandle.get(), CURLOPT_POSTFIELDSIZE_LARGE, size);
  return *this;
}

CurlWrapper &CurlWrapper::setGet() {
  curl_easy_setopt(easyHandle.get(), CURLOPT_HTTPGET, 1L);
  return *this;
}

CurlWrapper &CurlWrapper::addHeader(const std::string &header) {
  headers = curl_slist_append(headers, header.c_str());
  return *this;
}

CurlWrapper &CurlWrapper::setTimeoutSeconds(long seconds) {
  curl_easy_setopt(easyHandle.get(), CURLOPT_TIMEOUT, seconds);
  return *this;
}

CurlWrapper &CurlWrapper::setCancelFlag(const std::atomic<bool> *flag) {
  cancelFlag = flag;
  curl_easy_setopt(easyHandle.get(), CURLOPT_XFERINFOFUNCTION,
                   ProgressCallback);
  curl_easy_setopt(easyHandle.get(), CURLOPT_XFERINFODATA,
                   static_cast<const void *>(cancelFlag));
  curl_easy_setopt(easyHandle.get(), CURLOPT_NOPROGRESS, 0L);
  return *this;
}

std::string CurlWrapper::perform() {
  if (headers) {
    curl_easy_setopt(easyHandle.get(), CURLOPT_HTTPHEADER, headers);
  }

  responseBuffer.clear();
  CURLcode res = curl_easy_perform(easyHandle.get());
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    throw ProcessingCancelled("HTTP request cancelled");
  }
  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("curl_easy_perform() failed: ") +
                             curl_easy_strerror(res));
  }

  long httpCode = 0;
  curl_easy_getinfo(easyHandle.get(), CURLINFO_RESPONSE_CODE, &httpCode);
  if (httpCode >= 400) {
    throw std::runtime_error("HTTP error: " + std::to_string(httpCode) +
                             "\nResponse: " + responseBuffer);
  }

  return responseBuffer;
}

} // namespace video_timeline
