#pragma once

#include "sesh/store/result.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/*
    A codec turns a typed value into the opaque bytes a store persists and
    back. Any type providing

        static store::result_c<std::string> encode(const T &value);
        template <typename T>
        static store::result_c<T> decode(const std::string &bytes);

    can be handed to the session and session map accessors. Stores never look
    inside the bytes.

    The default codec is MessagePack through nlohmann_json. It is compact but
    not self describing enough to decode a mixed record into one static type,
    so decoding always happens per field against a caller supplied type. Any
    type with nlohmann to_json / from_json overloads works.
*/

namespace sesh::codec {

class msgpack_codec_c {
public:
  template <typename T>
  static store::result_c<std::string> encode(const T &value) {
    try {
      nlohmann::json document = value;
      std::vector<std::uint8_t> packed = nlohmann::json::to_msgpack(document);
      return std::string(packed.begin(), packed.end());
    } catch (const nlohmann::json::exception &e) {
      return store::error_s{store::error_e::ENCODING, e.what()};
    }
  }

  template <typename T>
  static store::result_c<T> decode(const std::string &bytes) {
    try {
      auto document = nlohmann::json::from_msgpack(bytes);
      return document.template get<T>();
    } catch (const nlohmann::json::exception &e) {
      return store::error_s{store::error_e::ENCODING, e.what()};
    }
  }
};

} // namespace sesh::codec
