#pragma once

// sextant/transport.hpp — Pluggable message transport addressed by logical endpoints.
//
// DESIGN:
//   MessageSender / MessageReceiver are the only types callers see. Concrete
//   transports are selected per endpoint from process environment:
//
//     <PREFIX>_SENDER_TRANSPORT_TYPE     e.g. ANALYZER_SENDER_TRANSPORT_TYPE=spool
//     <PREFIX>_RECEIVER_TRANSPORT_TYPE
//     <PREFIX>_TRANSPORT_SERVER_URI
//     <PREFIX>_TRANSPORT_QUEUE_NAME      (default: endpoint name)
//     <PREFIX>_TRANSPORT_USERNAME
//     <PREFIX>_TRANSPORT_PASSWORD
//
//   and instantiated through a TransportRegistry, an immutable table of
//   factories keyed by type name built once at process start.
//
// DELIVERY CONTRACT:
//   - Competing consumers: one message is handed to exactly one receiver among
//     all receivers of the same endpoint for each delivery.
//   - At-least-once: a message is acknowledged only after the handler returns.
//     If the handler throws, the message is returned to the queue and the
//     exception propagates to the caller.

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sextant/message.hpp"

namespace sextant {

class MessageSender {
 public:
  virtual ~MessageSender() = default;
  virtual void send(const Message& message) = 0;
};

using MessageHandler = std::function<void(const Message&)>;

class MessageReceiver {
 public:
  virtual ~MessageReceiver() = default;

  // Waits up to timeout for one message and hands it to handler.
  // Returns false if nothing arrived in time.
  virtual bool receive_one(const MessageHandler& handler, std::chrono::milliseconds timeout) = 0;
};

struct TransportConfig {
  std::string sender_type;
  std::string receiver_type;
  std::string server_uri;
  std::string queue_name;
  std::string username;
  std::string password;
};

// Reads the per-endpoint variables listed above. Types default to
// SEXTANT_TRANSPORT_TYPE, then "spool".
TransportConfig transport_config_from_env(Endpoint endpoint);

struct TransportFactory {
  std::function<std::unique_ptr<MessageSender>(Endpoint, const TransportConfig&)> make_sender;
  std::function<std::unique_ptr<MessageReceiver>(Endpoint, const TransportConfig&)> make_receiver;
};

class TransportRegistry {
 public:
  TransportRegistry() = default;
  explicit TransportRegistry(std::map<std::string, TransportFactory> factories);

  // Throws TransportError if the configured type is not registered.
  std::unique_ptr<MessageSender> create_sender(Endpoint endpoint, const TransportConfig& config) const;
  std::unique_ptr<MessageReceiver> create_receiver(Endpoint endpoint, const TransportConfig& config) const;

  bool contains(const std::string& type) const { return factories_.contains(type); }
  std::vector<std::string> types() const;

 private:
  const TransportFactory& lookup(const std::string& type) const;

  std::map<std::string, TransportFactory> factories_;
};

class InMemoryBroker;

// Built-in table: "spool" always, "testing" when a broker is supplied.
TransportRegistry builtin_transport_registry(std::shared_ptr<InMemoryBroker> broker = nullptr);

}  // namespace sextant
