#pragma once

// sextant/memory_transport.hpp — In-process broker for deterministic tests.
//
// Messages are stored encoded, so everything sent through this transport
// passes the same wire codec as a real one. Registered as type "testing".

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "sextant/transport.hpp"

namespace sextant {

class InMemoryBroker {
 public:
  void publish(Endpoint endpoint, std::string frame);
  // Puts a frame back at the head of the queue (redelivery).
  void requeue(Endpoint endpoint, std::string frame);

  // Pops one frame, waiting up to timeout. nullopt on timeout or after close().
  std::optional<std::string> take(Endpoint endpoint, std::chrono::milliseconds timeout);

  // Test helper: decoded next message or TransportError on timeout.
  Message expect_message(Endpoint endpoint,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));
  // Test helper: removes and returns everything currently queued.
  std::vector<Message> drain(Endpoint endpoint);

  size_t pending(Endpoint endpoint) const;
  uint64_t published_count(Endpoint endpoint) const;

  // Wakes all waiting receivers; subsequent take() calls return immediately.
  void close();

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<Endpoint, std::deque<std::string>> queues_;
  std::map<Endpoint, uint64_t> published_;
  bool closed_{false};
};

class InMemorySender : public MessageSender {
 public:
  InMemorySender(std::shared_ptr<InMemoryBroker> broker, Endpoint endpoint)
      : broker_(std::move(broker)), endpoint_(endpoint) {}

  void send(const Message& message) override;

 private:
  std::shared_ptr<InMemoryBroker> broker_;
  Endpoint endpoint_;
};

class InMemoryReceiver : public MessageReceiver {
 public:
  InMemoryReceiver(std::shared_ptr<InMemoryBroker> broker, Endpoint endpoint)
      : broker_(std::move(broker)), endpoint_(endpoint) {}

  bool receive_one(const MessageHandler& handler, std::chrono::milliseconds timeout) override;

 private:
  std::shared_ptr<InMemoryBroker> broker_;
  Endpoint endpoint_;
};

}  // namespace sextant
