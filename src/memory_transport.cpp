#include "sextant/memory_transport.hpp"

#include "sextant/errors.hpp"
#include "sextant/log.hpp"

namespace sextant {

void InMemoryBroker::publish(Endpoint endpoint, std::string frame) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    queues_[endpoint].push_back(std::move(frame));
    ++published_[endpoint];
  }
  cv_.notify_all();
}

void InMemoryBroker::requeue(Endpoint endpoint, std::string frame) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    queues_[endpoint].push_front(std::move(frame));
  }
  cv_.notify_all();
}

std::optional<std::string> InMemoryBroker::take(Endpoint endpoint, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  auto& q = queues_[endpoint];
  cv_.wait_for(lk, timeout, [&] { return closed_ || !q.empty(); });
  if (q.empty()) return std::nullopt;
  std::string frame = std::move(q.front());
  q.pop_front();
  return frame;
}

Message InMemoryBroker::expect_message(Endpoint endpoint, std::chrono::milliseconds timeout) {
  auto frame = take(endpoint, timeout);
  if (!frame) {
    throw TransportError("no message on endpoint '" + to_string(endpoint) + "' within " +
                         std::to_string(timeout.count()) + "ms");
  }
  return decode(*frame);
}

std::vector<Message> InMemoryBroker::drain(Endpoint endpoint) {
  std::deque<std::string> frames;
  {
    std::lock_guard<std::mutex> lk(mu_);
    frames.swap(queues_[endpoint]);
  }
  std::vector<Message> out;
  for (const auto& f : frames) out.push_back(decode(f));
  return out;
}

size_t InMemoryBroker::pending(Endpoint endpoint) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = queues_.find(endpoint);
  return it == queues_.end() ? 0 : it->second.size();
}

uint64_t InMemoryBroker::published_count(Endpoint endpoint) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = published_.find(endpoint);
  return it == published_.end() ? 0 : it->second;
}

void InMemoryBroker::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

void InMemorySender::send(const Message& message) {
  broker_->publish(endpoint_, encode(message));
}

bool InMemoryReceiver::receive_one(const MessageHandler& handler, std::chrono::milliseconds timeout) {
  auto frame = broker_->take(endpoint_, timeout);
  if (!frame) return false;

  Message message;
  try {
    message = decode(*frame);
  } catch (const TransportError& e) {
    // Undecodable frames are dropped; redelivery would fail the same way.
    log_error("transport.memory", e.what(), {{"endpoint", to_string(endpoint_)}});
    return true;
  }

  try {
    handler(message);
  } catch (const std::exception&) {
    broker_->requeue(endpoint_, std::move(*frame));
    throw;
  }
  return true;
}

}  // namespace sextant
