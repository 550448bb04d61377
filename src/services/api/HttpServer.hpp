#pragma once
#include <string>

namespace hbl {
  class SpecimenService;

  // Start a blocking HTTP server over the service.
  // apiKey: if empty, auth is disabled (local review tooling).
  void run_http_server(SpecimenService& service,
                       int port,
                       const std::string& apiKey);
}
