#pragma once

#include "grammar_catalog.hpp"
#include "sentence.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Satzbau {
namespace fallback {

struct FallbackConfig {
  bool enabled{false};
  std::string endpoint{"https://api.deepseek.com/chat/completions"};
  std::string model{"deepseek-chat"};
  std::string apiKeyEnv{"SATZBAU_AI_API_KEY"};
  long timeoutMs{10000};
  long connectTimeoutMs{3000};
  double maxConfidence{0.8};
};

// Last-resort annotator for sentences the rules found nothing in. The
// returned future must not block on destruction.
class FallbackAnnotator {
public:
  virtual ~FallbackAnnotator() = default;
  virtual std::future<std::vector<DetectionResult>>
  annotate(const Sentence &sentence) = 0;
};

struct FetchResult {
  long response_code;
  std::string content;
  bool success;

  FetchResult(long code, const std::string &data)
      : response_code(code), content(data), success(code == 200) {}
};

// Assistant message content of successful responses, keyed by sentence text.
class ResponseCache {
public:
  static ResponseCache &getInstance();

  std::optional<std::string> getEntry(const std::string &sentence);
  void setEntry(const std::string &sentence, const std::string &content);
  void clear();
  size_t size() const;

private:
  ResponseCache() = default;
  mutable std::mutex cache_mutex_;
  std::unordered_map<std::string, std::string> cache_;
};

class AiFallbackClient : public FallbackAnnotator {
public:
  AiFallbackClient(FallbackConfig config,
                   std::shared_ptr<const GrammarCatalog> catalog);

  std::future<std::vector<DetectionResult>>
  annotate(const Sentence &sentence) override;

  const FallbackConfig &config() const { return config_; }

  static std::string buildRequestBody(const std::string &model,
                                      const std::string &sentence);

  // choices[0].message.content of a chat-completions response.
  static std::optional<std::string>
  extractMessageContent(const std::string &responseBody);

  // Converts the model's JSON answer into results. Entries with unknown
  // categories or positions outside the sentence are dropped.
  static std::vector<DetectionResult>
  parseAnnotations(const std::string &content, const Sentence &sentence,
                   const GrammarCatalog &catalog, double maxConfidence);

private:
  FallbackConfig config_;
  std::shared_ptr<const GrammarCatalog> catalog_;
};

// Blocking POST of a JSON body; runs on the caller's thread.
FetchResult postJson(const std::string &url, const std::string &body,
                     const std::string &apiKey, long timeoutMs,
                     long connectTimeoutMs);

std::string getErrorMessage(long response_code);

} // namespace fallback
} // namespace Satzbau
