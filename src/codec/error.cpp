#include "mqtt/codec/error.hpp"

#include <string>

namespace mqtt::codec {
namespace {

class codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "mqtt.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::bad_qos:
        return "invalid qos level";
      case errc::bad_msg_type:
        return "invalid message type";
      case errc::bad_will_qos:
        return "invalid will qos level";
      case errc::bad_return_code:
        return "invalid connack return code";
      case errc::malformed_length:
        return "malformed remaining length";
      case errc::truncated:
        return "truncated input";
      case errc::remaining_length_exceeded:
        return "field exceeds remaining length";
      case errc::remaining_length_mismatch:
        return "unconsumed bytes in remaining length";
      case errc::field_too_long:
        return "string field too long";
      case errc::payload_too_large:
        return "payload exceeds maximum remaining length";
      case errc::packet_too_large:
        return "remaining length exceeds decode limit";
      default:
        return "unknown mqtt.codec error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace mqtt::codec
