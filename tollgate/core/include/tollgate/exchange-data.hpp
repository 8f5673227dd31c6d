#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tollgate/attachment-key.hpp"

namespace tollgate {

// Request view attached by the transport layer before the exchange enters the handler chain.
struct RequestData {
  [[nodiscard]] std::string_view headerValue(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers) {
      if (key == name) {
        return value;
      }
    }
    return {};
  }

  std::string method;
  std::string path;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

// Response content produced by the chain. The transport serializes it together with the exchange response code.
struct ResponseData {
  std::string contentType;
  std::string body;
};

inline const AttachmentKey<RequestData> kRequestDataKey{"request-data"};
inline const AttachmentKey<ResponseData> kResponseDataKey{"response-data"};

// Present and false when the handler serving the exchange cannot continue its processing asynchronously.
inline const AttachmentKey<bool> kAsyncSupportedKey{"async-supported"};

}  // namespace tollgate
