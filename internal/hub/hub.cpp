#include "hub.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace forge::hub {

// ------------------------------------------------------------
// Observer
// ------------------------------------------------------------

Observer::Observer(std::uint64_t id, std::size_t capacity) : id_(id), capacity_(capacity == 0 ? 1 : capacity) {
}

bool Observer::Offer(const std::string& payload) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return false;
    }
    if (queue_.size() >= capacity_) {
      dropped_.fetch_add(1);
      return false;
    }
    queue_.push_back(payload);
  }
  cv_.notify_one();
  return true;
}

std::optional<std::string> Observer::Next() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  std::string payload = std::move(queue_.front());
  queue_.pop_front();
  return payload;
}

std::optional<std::string> Observer::NextFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  std::string payload = std::move(queue_.front());
  queue_.pop_front();
  return payload;
}

std::vector<std::string> Observer::Drain() {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> drained(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  return drained;
}

void Observer::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Observer::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

// ------------------------------------------------------------
// Hub
// ------------------------------------------------------------

Hub::Hub(std::size_t observer_capacity) : observer_capacity_(observer_capacity == 0 ? kDefaultObserverQueueCapacity : observer_capacity) {
}

Hub::~Hub() {
  Shutdown();
}

std::shared_ptr<Observer> Hub::Attach() {
  std::size_t count = 0;
  std::shared_ptr<Observer> observer;
  {
    std::unique_lock lock(mutex_);
    observer = std::make_shared<Observer>(next_id_++, observer_capacity_);
    if (shutdown_) {
      observer->Close();
      return observer;
    }
    observers_.emplace(observer->id(), observer);
    count = observers_.size();
  }

  observability::Metrics::Instance().SetAttachedObservers(count);
  FORGE_LOG_DEBUG("hub observer attached", {observability::IntField("observer_id", static_cast<std::int64_t>(observer->id())),
                                            observability::IntField("observers", static_cast<std::int64_t>(count))});
  return observer;
}

void Hub::Detach(std::uint64_t observer_id) {
  std::shared_ptr<Observer> observer;
  std::size_t               count = 0;
  {
    std::unique_lock lock(mutex_);
    auto             it = observers_.find(observer_id);
    if (it == observers_.end()) {
      return;
    }
    observer = std::move(it->second);
    observers_.erase(it);
    count = observers_.size();
  }

  observer->Close();
  observability::Metrics::Instance().SetAttachedObservers(count);
  FORGE_LOG_DEBUG("hub observer detached", {observability::IntField("observer_id", static_cast<std::int64_t>(observer_id)),
                                            observability::IntField("observers", static_cast<std::int64_t>(count))});
}

void Hub::Broadcast(const std::string& payload) {
  std::shared_lock lock(mutex_);
  for (const auto& [id, observer] : observers_) {
    if (!observer->Offer(payload) && !observer->Closed()) {
      observability::Metrics::Instance().RecordDroppedMessage();
      FORGE_LOG_WARN("hub observer queue full, message dropped",
                     {observability::IntField("observer_id", static_cast<std::int64_t>(id)),
                      observability::IntField("dropped", static_cast<std::int64_t>(observer->Dropped()))});
    }
  }
}

std::size_t Hub::ObserverCount() const {
  std::shared_lock lock(mutex_);
  return observers_.size();
}

void Hub::Shutdown() {
  std::unordered_map<std::uint64_t, std::shared_ptr<Observer>> observers;
  {
    std::unique_lock lock(mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
    observers.swap(observers_);
  }

  for (auto& [id, observer] : observers) {
    observer->Close();
  }
  observability::Metrics::Instance().SetAttachedObservers(0);
}

} // namespace forge::hub
