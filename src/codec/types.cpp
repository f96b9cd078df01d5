#include "mqtt/codec/types.hpp"

namespace mqtt::codec {

const char* to_string(MessageType type) noexcept {
  switch (type) {
    case MessageType::connect:
      return "CONNECT";
    case MessageType::connack:
      return "CONNACK";
    case MessageType::publish:
      return "PUBLISH";
    case MessageType::puback:
      return "PUBACK";
    case MessageType::pubrec:
      return "PUBREC";
    case MessageType::pubrel:
      return "PUBREL";
    case MessageType::pubcomp:
      return "PUBCOMP";
    case MessageType::subscribe:
      return "SUBSCRIBE";
    case MessageType::suback:
      return "SUBACK";
    case MessageType::unsubscribe:
      return "UNSUBSCRIBE";
    case MessageType::unsuback:
      return "UNSUBACK";
    case MessageType::pingreq:
      return "PINGREQ";
    case MessageType::pingresp:
      return "PINGRESP";
    case MessageType::disconnect:
      return "DISCONNECT";
  }
  return "unknown";
}

const char* to_string(QosLevel qos) noexcept {
  switch (qos) {
    case QosLevel::at_most_once:
      return "at-most-once";
    case QosLevel::at_least_once:
      return "at-least-once";
    case QosLevel::exactly_once:
      return "exactly-once";
  }
  return "reserved";
}

const char* to_string(ReturnCode code) noexcept {
  switch (code) {
    case ReturnCode::accepted:
      return "accepted";
    case ReturnCode::unacceptable_protocol_version:
      return "unacceptable protocol version";
    case ReturnCode::identifier_rejected:
      return "identifier rejected";
    case ReturnCode::server_unavailable:
      return "server unavailable";
    case ReturnCode::bad_username_or_password:
      return "bad username or password";
    case ReturnCode::not_authorized:
      return "not authorized";
  }
  return "unknown";
}

}  // namespace mqtt::codec
