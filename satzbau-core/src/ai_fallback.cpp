#include "ai_fallback.hpp"
#include "text_offsets.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <curl/curl.h>
#include <iostream>
#include <thread>

namespace Satzbau {
namespace fallback {

namespace {

static bool isDebugEnabled() {
  static const bool debug = (std::getenv("SATZBAU_DEBUG") != nullptr);
  return debug;
}

size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t totalSize = size * nmemb;
  std::string *buffer = static_cast<std::string *>(userp);
  buffer->append(static_cast<char *>(contents), totalSize);
  return totalSize;
}

struct CurlRequest {
  CURLM *multi_handle{nullptr};
  CURL *easy_handle{nullptr};
  curl_slist *headers{nullptr};
  std::string response_buffer;

  ~CurlRequest() {
    if (multi_handle && easy_handle)
      curl_multi_remove_handle(multi_handle, easy_handle);
    if (easy_handle)
      curl_easy_cleanup(easy_handle);
    if (multi_handle)
      curl_multi_cleanup(multi_handle);
    if (headers)
      curl_slist_free_all(headers);
  }
};

void ensureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::future<std::vector<DetectionResult>> readyResult(
    std::vector<DetectionResult> results = std::vector<DetectionResult>()) {
  std::promise<std::vector<DetectionResult>> promise;
  auto future = promise.get_future();
  promise.set_value(std::move(results));
  return future;
}

const char *kSystemPrompt =
    "You annotate German sentences for language learners. Return only a JSON "
    "array. Each element has the keys category, level, pattern, explanation, "
    "start, end and confidence. start and end are character offsets (Unicode "
    "code points) into the sentence, end exclusive. level is one of A1, A2, "
    "B1, B2, C1, C2. category is one of: ";

// Outermost JSON array or object in a reply that may be wrapped in prose or
// code fences.
std::string extractJsonPayload(const std::string &content) {
  size_t open = content.find_first_of("[{");
  if (open == std::string::npos)
    return std::string();
  char closeChar = content[open] == '[' ? ']' : '}';
  size_t close = content.rfind(closeChar);
  if (close == std::string::npos || close < open)
    return std::string();
  return content.substr(open, close - open + 1);
}

const GrammarPoint *matchCatalogPoint(const GrammarCatalog &catalog,
                                      GrammarCategory category,
                                      const std::string &pattern) {
  if (pattern.empty())
    return nullptr;
  std::string needle = text::TextUtils::toLower(pattern);
  for (const auto &point : catalog.points()) {
    if (point.category != category)
      continue;
    std::string name = text::TextUtils::toLower(point.name);
    if (name.find(needle) != std::string::npos ||
        needle.find(name) != std::string::npos)
      return &point;
  }
  return nullptr;
}

int readOffset(const json &item, const char *key) {
  if (item.contains(key) && item[key].is_number_integer())
    return item[key].get<int>();
  if (item.contains("position") && item["position"].is_object() &&
      item["position"].contains(key) &&
      item["position"][key].is_number_integer())
    return item["position"][key].get<int>();
  return -1;
}

} // namespace

std::string getErrorMessage(long response_code) {
  switch (response_code) {
  case -1:
    return "Network connection error";
  case 401:
    return "Unauthorized";
  case 403:
    return "Access forbidden";
  case 429:
    return "Rate limited";
  case 500:
    return "Internal server error";
  case 502:
    return "Bad gateway";
  case 503:
    return "Service unavailable";
  case 504:
    return "Gateway timeout";
  default:
    return "HTTP error: " + std::to_string(response_code);
  }
}

FetchResult postJson(const std::string &url, const std::string &body,
                     const std::string &apiKey, long timeoutMs,
                     long connectTimeoutMs) {
  ensureCurlInitialized();
  CurlRequest request;

  request.multi_handle = curl_multi_init();
  if (!request.multi_handle)
    return FetchResult(-1, "Failed to initialize curl multi handle");
  request.easy_handle = curl_easy_init();
  if (!request.easy_handle)
    return FetchResult(-1, "Failed to initialize curl easy handle");

  std::string authorization = "Authorization: Bearer " + apiKey;
  request.headers =
      curl_slist_append(request.headers, "Content-Type: application/json");
  request.headers = curl_slist_append(request.headers, authorization.c_str());

  curl_easy_setopt(request.easy_handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(request.easy_handle, CURLOPT_HTTPHEADER, request.headers);
  curl_easy_setopt(request.easy_handle, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(request.easy_handle, CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(body.size()));
  curl_easy_setopt(request.easy_handle, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(request.easy_handle, CURLOPT_WRITEDATA,
                   &request.response_buffer);
  curl_easy_setopt(request.easy_handle, CURLOPT_TIMEOUT_MS, timeoutMs);
  curl_easy_setopt(request.easy_handle, CURLOPT_CONNECTTIMEOUT_MS,
                   connectTimeoutMs);
  curl_easy_setopt(request.easy_handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(request.easy_handle, CURLOPT_USERAGENT, "satzbau/1.0");

  curl_multi_add_handle(request.multi_handle, request.easy_handle);

  int still_running = 0;
  do {
    CURLMcode mc = curl_multi_perform(request.multi_handle, &still_running);
    if (mc != CURLM_OK)
      return FetchResult(-1, "curl_multi_perform failed");
    if (still_running)
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
  } while (still_running > 0);

  CURLcode transfer = CURLE_OK;
  int queued = 0;
  while (CURLMsg *msg = curl_multi_info_read(request.multi_handle, &queued)) {
    if (msg->msg == CURLMSG_DONE)
      transfer = msg->data.result;
  }
  if (transfer != CURLE_OK)
    return FetchResult(-1, curl_easy_strerror(transfer));

  long response_code = 0;
  curl_easy_getinfo(request.easy_handle, CURLINFO_RESPONSE_CODE,
                    &response_code);
  if (response_code == 0)
    response_code = -1;

  if (response_code != 200)
    return FetchResult(response_code, getErrorMessage(response_code));
  return FetchResult(response_code, request.response_buffer);
}

ResponseCache &ResponseCache::getInstance() {
  static ResponseCache instance;
  return instance;
}

std::optional<std::string>
ResponseCache::getEntry(const std::string &sentence) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  auto it = cache_.find(sentence);
  if (it != cache_.end())
    return it->second;
  return std::nullopt;
}

void ResponseCache::setEntry(const std::string &sentence,
                             const std::string &content) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_[sentence] = content;
}

void ResponseCache::clear() {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_.clear();
}

size_t ResponseCache::size() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return cache_.size();
}

AiFallbackClient::AiFallbackClient(FallbackConfig config,
                                   std::shared_ptr<const GrammarCatalog> catalog)
    : config_(std::move(config)), catalog_(std::move(catalog)) {
  if (!catalog_) {
    throw CatalogError("AI fallback needs a grammar catalog");
  }
}

std::string AiFallbackClient::buildRequestBody(const std::string &model,
                                               const std::string &sentence) {
  std::string prompt = kSystemPrompt;
  const auto &categories = allCategories();
  for (size_t i = 0; i < categories.size(); ++i) {
    if (i > 0)
      prompt += ", ";
    prompt += categoryName(categories[i]);
  }
  prompt += ".";

  json body = {{"model", model},
               {"temperature", 0.1},
               {"messages",
                json::array({{{"role", "system"}, {"content", prompt}},
                             {{"role", "user"}, {"content", sentence}}})}};
  return body.dump();
}

std::optional<std::string>
AiFallbackClient::extractMessageContent(const std::string &responseBody) {
  json response = json::parse(responseBody, nullptr, false);
  if (response.is_discarded() || !response.is_object())
    return std::nullopt;
  if (!response.contains("choices") || !response["choices"].is_array() ||
      response["choices"].empty())
    return std::nullopt;
  const auto &choice = response["choices"][0];
  if (!choice.contains("message") || !choice["message"].is_object())
    return std::nullopt;
  const auto &message = choice["message"];
  if (!message.contains("content") || !message["content"].is_string())
    return std::nullopt;
  return message["content"].get<std::string>();
}

std::vector<DetectionResult>
AiFallbackClient::parseAnnotations(const std::string &content,
                                   const Sentence &sentence,
                                   const GrammarCatalog &catalog,
                                   double maxConfidence) {
  std::vector<DetectionResult> results;
  json payload = json::parse(extractJsonPayload(content), nullptr, false);
  if (payload.is_discarded())
    return results;
  if (payload.is_object() && payload.contains("grammarPoints"))
    payload = payload["grammarPoints"];
  if (!payload.is_array())
    return results;

  const int length = static_cast<int>(text::codePointLength(sentence.text));

  for (const auto &item : payload) {
    if (!item.is_object() || !item.contains("category") ||
        !item["category"].is_string())
      continue;

    GrammarCategory category;
    if (!parseCategory(item["category"].get<std::string>(), category))
      continue;

    int start = readOffset(item, "start");
    int end = readOffset(item, "end");
    if (start < 0 || end <= start || end > length)
      continue;

    CefrLevel level = CefrLevel::B1;
    if (item.contains("level") && item["level"].is_string())
      parseLevel(item["level"].get<std::string>(), level);

    double confidence = 0.7;
    if (item.contains("confidence") && item["confidence"].is_number())
      confidence = item["confidence"].get<double>();
    confidence = std::max(0.0, std::min(confidence, maxConfidence));

    std::string pattern;
    if (item.contains("pattern") && item["pattern"].is_string())
      pattern = item["pattern"].get<std::string>();
    std::string explanation;
    if (item.contains("explanation") && item["explanation"].is_string())
      explanation = item["explanation"].get<std::string>();

    DetectionResult result;
    if (const GrammarPoint *point = matchCatalogPoint(catalog, category, pattern)) {
      result.grammarPointId = point->id;
      result.level = point->level;
      result.name = point->name;
    } else {
      result.grammarPointId = std::string("ai-") + categoryName(category);
      result.level = level;
      result.name = pattern.empty() ? categoryName(category) : pattern;
    }
    result.category = category;
    result.label = pattern.empty() ? result.name : pattern;
    result.positions.push_back(CharRange{start, end});
    result.confidence = confidence;
    result.details = {{"source", "ai"},
                      {"pattern", pattern},
                      {"explanation", explanation}};
    results.push_back(std::move(result));
  }
  return results;
}

std::future<std::vector<DetectionResult>>
AiFallbackClient::annotate(const Sentence &sentence) {
  if (!config_.enabled)
    return readyResult();

  const char *apiKey = std::getenv(config_.apiKeyEnv.c_str());
  if (!apiKey || !*apiKey) {
    static std::once_flag warned;
    std::string env = config_.apiKeyEnv;
    std::call_once(warned, [&env] {
      std::cerr << "[WARN] AI fallback enabled but " << env << " is not set"
                << std::endl;
    });
    return readyResult();
  }

  auto cached = ResponseCache::getInstance().getEntry(sentence.text);
  if (cached) {
    return readyResult(
        parseAnnotations(*cached, sentence, *catalog_, config_.maxConfidence));
  }

  auto promise = std::make_shared<std::promise<std::vector<DetectionResult>>>();
  auto future = promise->get_future();

  // detached so an abandoned future never waits for the transfer
  std::thread([promise, sentence, config = config_, catalog = catalog_,
               key = std::string(apiKey)]() {
    std::vector<DetectionResult> results;
    try {
      FetchResult fetched =
          postJson(config.endpoint, buildRequestBody(config.model, sentence.text),
                   key, config.timeoutMs, config.connectTimeoutMs);
      if (!fetched.success) {
        std::cerr << "[WARN] AI fallback request failed: " << fetched.content
                  << std::endl;
      } else if (auto content = extractMessageContent(fetched.content)) {
        ResponseCache::getInstance().setEntry(sentence.text, *content);
        results = parseAnnotations(*content, sentence, *catalog,
                                   config.maxConfidence);
      } else {
        std::cerr << "[WARN] AI fallback returned an unreadable response"
                  << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "[ERROR] AI fallback failed: " << e.what() << std::endl;
    }

    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] AI fallback produced " << results.size()
                << " grammar points" << std::endl;
    }
    promise->set_value(std::move(results));
  }).detach();

  return future;
}

} // namespace fallback
} // namespace Satzbau
