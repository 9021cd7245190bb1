#pragma once

#include <stdexcept>
#include <string>

#include "hellonet/http-response.hpp"

namespace hellonet::test {

// ResponseSink keeping the serialized response in memory.
class RecordingResponseSink : public ResponseSink {
 public:
  [[nodiscard]] int commitCount() const noexcept { return _commitCount; }

  // Wire bytes of the committed response, empty before finalization.
  [[nodiscard]] const std::string& wire() const noexcept { return _wire; }

 protected:
  void commit(const HttpResponse& response) override {
    ++_commitCount;
    _wire = response.serialize();
  }

 private:
  int _commitCount{0};
  std::string _wire;
};

// ResponseSink whose transport always fails.
class FailingResponseSink : public ResponseSink {
 protected:
  void commit(const HttpResponse&) override { throw std::runtime_error("transport failure"); }
};

}  // namespace hellonet::test
