#include "safe_cache.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace availability::cache {

namespace {

void ReportFailure(const char* op, CacheNamespace ns, const std::string& key, const std::exception& e) {
  AVAILABILITY_LOG_WARN("cache operation failed; continuing without cache",
                        {observability::StringField("op", op), observability::StringField("namespace", NamespaceName(ns)),
                         observability::StringField("key", key), observability::StringField("error", e.what())});
  observability::Metrics::Instance().RecordCacheEvent(NamespaceName(ns), "error");
}

} // namespace

SafeCache::SafeCache(std::shared_ptr<AvailabilityCache> backend) : backend_(std::move(backend)) {
}

std::optional<std::string> SafeCache::Get(CacheNamespace ns, const std::string& key) const {
  if (!backend_) {
    return std::nullopt;
  }

  try {
    auto value = backend_->Get(ns, key);
    observability::Metrics::Instance().RecordCacheEvent(NamespaceName(ns), value ? "hit" : "miss");
    return value;
  } catch (const std::exception& e) {
    ReportFailure("get", ns, key, e);
    return std::nullopt;
  }
}

void SafeCache::Set(CacheNamespace ns, const std::string& key, std::string value, std::chrono::seconds ttl) const {
  if (!backend_) {
    return;
  }

  try {
    backend_->Set(ns, key, std::move(value), ttl);
  } catch (const std::exception& e) {
    ReportFailure("set", ns, key, e);
  }
}

void SafeCache::Invalidate(CacheNamespace ns, const std::string& key) const {
  if (!backend_) {
    return;
  }

  try {
    backend_->Invalidate(ns, key);
  } catch (const std::exception& e) {
    ReportFailure("invalidate", ns, key, e);
  }
}

} // namespace availability::cache
