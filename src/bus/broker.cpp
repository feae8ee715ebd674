#include "agentflow/bus/broker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentflow {

MessageBroker::MessageBroker(size_t queue_capacity) : capacity_(std::max<size_t>(queue_capacity, 1)) {}

MessageBroker::~MessageBroker() {
  stop();

  if (worker_.joinable()) {
    if (worker_.get_id() == std::this_thread::get_id()) {
      // Destroyed from inside one of its own handlers: the worker is still on
      // this stack and keeps using the broker after the handler returns
      spdlog::critical("[Broker] Destroyed from its own subscriber; the worker outlives the broker");
      worker_.detach();
    } else {
      worker_.join();
    }
  }
}

MessageBroker::SubscriptionId MessageBroker::subscribe(const Topic &topic, Handler handler) {
  std::lock_guard<std::mutex> lock(subs_mutex_);

  auto sub = std::make_shared<Subscription>();
  sub->id = next_id_++;
  sub->topic = topic;
  sub->handler = std::move(handler);
  subscriptions_[topic].push_back(sub);

  spdlog::debug("[Broker] Subscription {} added for topic '{}'", sub->id, topic);
  return sub->id;
}

bool MessageBroker::unsubscribe(SubscriptionId id) {
  std::shared_ptr<Subscription> removed;

  {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    for (auto it = subscriptions_.begin(); it != subscriptions_.end() && !removed; ++it) {
      auto &subs = it->second;
      auto pos = std::find_if(subs.begin(), subs.end(), [id](const auto &sub) { return sub->id == id; });
      if (pos != subs.end()) {
        removed = *pos;
        subs.erase(pos);
        if (subs.empty()) {
          subscriptions_.erase(it);
        }
      }
    }
  }

  if (!removed) {
    return false;
  }

  // Wait out an in-flight invocation; none starts once active is false
  std::lock_guard<std::recursive_mutex> call_lock(removed->call_mutex);
  removed->active = false;

  spdlog::debug("[Broker] Subscription {} removed from topic '{}'", id, removed->topic);
  return true;
}

Result<uint64_t> MessageBroker::publish(const Topic &topic, Message message) {
  std::lock_guard<std::mutex> lock(queue_mutex_);

  if (!running_ || stopping_) {
    ++rejected_;
    spdlog::warn("[Broker] Rejected publish on '{}': broker is not running", topic);
    return Result<uint64_t>::failure(ErrorCode::BrokerStopped, "Broker is not running");
  }

  if (queue_.size() >= capacity_) {
    ++rejected_;
    spdlog::warn("[Broker] Rejected publish on '{}': queue full ({} messages)", topic, capacity_);
    return Result<uint64_t>::failure(ErrorCode::BrokerSaturated, "Broker queue is full (capacity " + std::to_string(capacity_) + ")");
  }

  uint64_t seq = next_seq_++;
  queue_.push_back(Envelope{seq, topic, std::move(message)});
  ++published_;
  queue_cv_.notify_one();

  spdlog::debug("[Broker] Message #{} published on '{}'", seq, topic);
  return Result<uint64_t>::success(seq);
}

Result<uint64_t> MessageBroker::publish(const Topic &topic, json data) {
  return publish(topic, Message::create(topic, std::move(data)));
}

void MessageBroker::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (running_ && !stopping_) {
      return;
    }
  }

  if (worker_.get_id() == std::this_thread::get_id()) {
    spdlog::warn("[Broker] start() requested by a subscriber while stopping; ignored");
    return;
  }

  // A worker told to stop from inside one of its own handlers exits on its own
  if (worker_.joinable()) {
    worker_.join();
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
    running_ = true;
    stopping_ = false;
  }

  worker_ = std::thread(&MessageBroker::worker_main, this);
  spdlog::info("[Broker] Started (queue capacity {})", capacity_);
}

void MessageBroker::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_ || stopping_) {
      return;
    }
    stopping_ = true;
  }
  queue_cv_.notify_all();

  if (worker_.get_id() == std::this_thread::get_id()) {
    spdlog::warn("[Broker] stop() requested by a subscriber; worker exits once the queue is drained");
    return;
  }

  if (worker_.joinable()) {
    worker_.join();
  }
  spdlog::info("[Broker] Stopped (published {}, delivered {})", published_.load(), delivered_.load());
}

bool MessageBroker::running() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return running_ && !stopping_;
}

size_t MessageBroker::pending() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

size_t MessageBroker::subscriber_count(const Topic &topic) const {
  std::lock_guard<std::mutex> lock(subs_mutex_);
  auto it = subscriptions_.find(topic);
  return it == subscriptions_.end() ? 0 : it->second.size();
}

BrokerStats MessageBroker::stats() const {
  BrokerStats s;
  s.published = published_.load();
  s.delivered = delivered_.load();
  s.rejected = rejected_.load();
  s.subscriber_failures = subscriber_failures_.load();
  s.worker_restarts = worker_restarts_.load();
  return s;
}

void MessageBroker::on_fatal(FatalHandler handler) {
  std::lock_guard<std::mutex> lock(fatal_mutex_);
  fatal_handler_ = std::move(handler);
}

void MessageBroker::worker_main() {
  while (true) {
    try {
      run_loop();
      break;
    } catch (const std::exception &e) {
      ++worker_restarts_;
      spdlog::critical("[Broker] Worker loop failed, restarting: {}", e.what());

      FatalHandler handler;
      {
        std::lock_guard<std::mutex> lock(fatal_mutex_);
        handler = fatal_handler_;
      }
      if (handler) {
        handler(e.what());
      }
    }
  }

  std::lock_guard<std::mutex> lock(queue_mutex_);
  running_ = false;
  stopping_ = false;
}

void MessageBroker::run_loop() {
  while (true) {
    Envelope envelope;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });

      // Stopping and drained
      if (queue_.empty()) {
        return;
      }

      envelope = std::move(queue_.front());
      queue_.pop_front();
    }

    deliver(envelope);
  }
}

void MessageBroker::deliver(const Envelope &envelope) {
  for (const auto &sub : snapshot(envelope.topic)) {
    std::lock_guard<std::recursive_mutex> call_lock(sub->call_mutex);
    if (!sub->active) {
      continue;
    }

    try {
      sub->handler(envelope.message);
      ++delivered_;
    } catch (const std::exception &e) {
      ++subscriber_failures_;
      spdlog::error("[Broker] Subscriber {} failed on message #{} ('{}'): {}", sub->id, envelope.seq, envelope.topic, e.what());
    } catch (...) {
      ++subscriber_failures_;
      spdlog::error("[Broker] Subscriber {} failed on message #{} ('{}'): non-standard exception", sub->id, envelope.seq,
                    envelope.topic);
    }
  }
}

std::vector<std::shared_ptr<MessageBroker::Subscription>> MessageBroker::snapshot(const Topic &topic) const {
  std::lock_guard<std::mutex> lock(subs_mutex_);
  auto it = subscriptions_.find(topic);
  if (it == subscriptions_.end()) {
    return {};
  }
  return it->second;
}

}  // namespace agentflow
