#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "agentflow/core/message.hpp"
#include "agentflow/core/types.hpp"

namespace agentflow {

// Counters exposed by MessageBroker::stats()
struct BrokerStats {
  uint64_t published = 0;            // Accepted into the queue
  uint64_t delivered = 0;            // Successful handler invocations
  uint64_t rejected = 0;             // Saturated or stopped
  uint64_t subscriber_failures = 0;  // Handler threw
  uint64_t worker_restarts = 0;
};

// In-process topic-based pub/sub hub.
//
// One background worker drains a bounded FIFO queue and calls the subscribers of
// each message's topic in subscription order. publish() never runs a handler; it
// fails fast when the queue is full. Handler exceptions are logged and counted.
class MessageBroker {
 public:
  using SubscriptionId = uint64_t;
  using Handler = std::function<void(const Message&)>;
  using FatalHandler = std::function<void(const std::string& reason)>;

  explicit MessageBroker(size_t queue_capacity = 1000);

  // Stops and joins the worker. Must not run inside a handler of this broker;
  // a handler may call stop() instead.
  ~MessageBroker();

  MessageBroker(const MessageBroker&) = delete;
  MessageBroker& operator=(const MessageBroker&) = delete;

  // Subscribe a handler to a topic. Subscribing the same callable twice gives
  // two independent registrations.
  SubscriptionId subscribe(const Topic& topic, Handler handler);

  // Remove one registration. Once this returns the handler is not running and
  // will not be called again. Returns false if the id is unknown.
  bool unsubscribe(SubscriptionId id);

  // Enqueue for delivery. Returns the message sequence number, or
  // BrokerSaturated / BrokerStopped.
  Result<uint64_t> publish(const Topic& topic, Message message);

  // Convenience: wraps `data` in a Message whose type is the topic
  Result<uint64_t> publish(const Topic& topic, json data);

  // Start the delivery worker. No-op when already running.
  void start();

  // Deliver everything already queued, then stop the worker and refuse new
  // publishes. No-op when not running. Called from a handler, it returns at
  // once and the worker exits after draining.
  void stop();

  bool running() const;

  size_t pending() const;

  size_t capacity() const {
    return capacity_;
  }

  size_t subscriber_count(const Topic& topic) const;

  BrokerStats stats() const;

  // Called when the worker loop itself fails and is restarted
  void on_fatal(FatalHandler handler);

 private:
  struct Subscription {
    SubscriptionId id = 0;
    Topic topic;
    Handler handler;

    // Held for the duration of one invocation; recursive so a handler can
    // unsubscribe itself.
    std::recursive_mutex call_mutex;
    bool active = true;
  };

  struct Envelope {
    uint64_t seq = 0;
    Topic topic;
    Message message;
  };

  void worker_main();

  void run_loop();

  void deliver(const Envelope& envelope);

  std::vector<std::shared_ptr<Subscription>> snapshot(const Topic& topic) const;

  const size_t capacity_;

  // Subscriber lists
  mutable std::mutex subs_mutex_;
  SubscriptionId next_id_ = 1;
  std::map<Topic, std::vector<std::shared_ptr<Subscription>>> subscriptions_;

  // Queue and worker state
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<Envelope> queue_;
  uint64_t next_seq_ = 1;
  bool running_ = false;
  bool stopping_ = false;
  std::thread worker_;

  // Serialises start()/stop()
  std::mutex lifecycle_mutex_;

  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> subscriber_failures_{0};
  std::atomic<uint64_t> worker_restarts_{0};

  std::mutex fatal_mutex_;
  FatalHandler fatal_handler_;
};

}  // namespace agentflow
