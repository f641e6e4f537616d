#include "sextant/transport.hpp"

#include "sextant/config.hpp"
#include "sextant/errors.hpp"
#include "sextant/memory_transport.hpp"
#include "sextant/spool_transport.hpp"

namespace sextant {

TransportConfig transport_config_from_env(Endpoint endpoint) {
  const std::string prefix = config_prefix(endpoint);
  const std::string default_type = env_or("SEXTANT_TRANSPORT_TYPE", "spool");

  TransportConfig c;
  c.sender_type = env_or(prefix + "_SENDER_TRANSPORT_TYPE", default_type);
  c.receiver_type = env_or(prefix + "_RECEIVER_TRANSPORT_TYPE", default_type);
  c.server_uri = env_or(prefix + "_TRANSPORT_SERVER_URI", env_or("SEXTANT_TRANSPORT_SERVER_URI", ""));
  c.queue_name = env_or(prefix + "_TRANSPORT_QUEUE_NAME", to_string(endpoint));
  c.username = env_or(prefix + "_TRANSPORT_USERNAME", "");
  c.password = env_or(prefix + "_TRANSPORT_PASSWORD", "");
  return c;
}

TransportRegistry::TransportRegistry(std::map<std::string, TransportFactory> factories)
    : factories_(std::move(factories)) {}

const TransportFactory& TransportRegistry::lookup(const std::string& type) const {
  auto it = factories_.find(type);
  if (it == factories_.end()) {
    throw TransportError("unknown transport type '" + type + "'");
  }
  return it->second;
}

std::unique_ptr<MessageSender> TransportRegistry::create_sender(Endpoint endpoint,
                                                                const TransportConfig& config) const {
  return lookup(config.sender_type).make_sender(endpoint, config);
}

std::unique_ptr<MessageReceiver> TransportRegistry::create_receiver(Endpoint endpoint,
                                                                    const TransportConfig& config) const {
  return lookup(config.receiver_type).make_receiver(endpoint, config);
}

std::vector<std::string> TransportRegistry::types() const {
  std::vector<std::string> out;
  for (const auto& [k, _] : factories_) out.push_back(k);
  return out;
}

TransportRegistry builtin_transport_registry(std::shared_ptr<InMemoryBroker> broker) {
  std::map<std::string, TransportFactory> table;

  table["spool"] = TransportFactory{
      [](Endpoint, const TransportConfig& c) -> std::unique_ptr<MessageSender> {
        return std::make_unique<SpoolSender>(SpoolOptions::from_config(c));
      },
      [](Endpoint, const TransportConfig& c) -> std::unique_ptr<MessageReceiver> {
        return std::make_unique<SpoolReceiver>(SpoolOptions::from_config(c));
      },
  };

  if (broker) {
    table["testing"] = TransportFactory{
        [broker](Endpoint e, const TransportConfig&) -> std::unique_ptr<MessageSender> {
          return std::make_unique<InMemorySender>(broker, e);
        },
        [broker](Endpoint e, const TransportConfig&) -> std::unique_ptr<MessageReceiver> {
          return std::make_unique<InMemoryReceiver>(broker, e);
        },
    };
  }
  return TransportRegistry(std::move(table));
}

}  // namespace sextant
