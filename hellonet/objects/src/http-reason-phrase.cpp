#include "hellonet/http-reason-phrase.hpp"

#include <string_view>

#include "hellonet/http-status-code.hpp"
#include "hellonet/log.hpp"

namespace hellonet::http {

std::string_view ReasonPhrase(StatusCode status) {
  std::string_view reason = ReasonPhraseFor(status);
  if (reason.empty()) {
    log::warn("No reason phrase for status code {}, using '{}'", status, ReasonUnknownStatus);
    reason = ReasonUnknownStatus;
  }
  return reason;
}

}  // namespace hellonet::http
