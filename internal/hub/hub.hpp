#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace forge::hub {

inline constexpr std::size_t kDefaultObserverQueueCapacity = 256;

/*
  Sink for serialized lifecycle envelopes. The engine and the hub-backed
  signaler only depend on this.
*/
class Broadcaster {
 public:
  virtual ~Broadcaster() = default;

  virtual void Broadcast(const std::string& payload) = 0;
};

/*
  One attached consumer. Bounded outbound queue; a full queue drops the new
  message and counts it.
*/
class Observer {
 public:
  Observer(std::uint64_t id, std::size_t capacity);

  std::uint64_t id() const {
    return id_;
  }

  // Never blocks. Returns false if the message was dropped.
  bool Offer(const std::string& payload);

  // Blocks until a message is available or the observer is closed.
  std::optional<std::string> Next();
  std::optional<std::string> NextFor(std::chrono::milliseconds timeout);

  std::vector<std::string> Drain();

  void Close();
  bool Closed() const;

  std::uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  const std::uint64_t id_;
  const std::size_t   capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool                    closed_ = false;

  std::atomic<std::uint64_t> dropped_{0};
};

/*
  Best-effort fan-out to the observers attached at broadcast time.

  Attach/Detach take the registry lock exclusively; Broadcast iterates under a
  shared lock and never waits on an observer.
*/
class Hub final : public Broadcaster {
 public:
  explicit Hub(std::size_t observer_capacity = kDefaultObserverQueueCapacity);
  ~Hub() override;

  std::shared_ptr<Observer> Attach();
  void                      Detach(std::uint64_t observer_id);

  void Broadcast(const std::string& payload) override;

  std::size_t ObserverCount() const;

  // Closes and detaches every observer. Later Attach calls return closed
  // observers.
  void Shutdown();

 private:
  const std::size_t observer_capacity_;

  mutable std::shared_mutex                                     mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<Observer>> observers_;
  std::uint64_t                                                 next_id_  = 1;
  bool                                                          shutdown_ = false;
};

} // namespace forge::hub
