#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "core/errors/Errors.hpp"
#include "core/model/Json.hpp"
#include "core/util/Ids.hpp"
#include "services/SpecimenService.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static size_t size_param(const httplib::Request& req, const char* k, size_t def) {
  const std::string s = param_or(req, k);
  if (s.empty()) return def;
  size_t used = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(s, &used);
  } catch (const std::exception&) {
    throw hbl::ConfigurationError(std::string(k) + " must be a non-negative integer");
  }
  if (used != s.size()) throw hbl::ConfigurationError(std::string(k) + " must be a non-negative integer");
  return static_cast<size_t>(v);
}

static void send_json(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, int status, const std::string& msg) {
  send_json(res, json{{"error", msg}}, status);
}

static json parse_body(const httplib::Request& req) {
  if (req.body.empty()) return json::object();
  json j = json::parse(req.body, nullptr, false);
  if (j.is_discarded()) throw hbl::ConfigurationError("invalid JSON body");
  return j;
}

static hbl::SpecimenFilter filter_from(const httplib::Request& req, size_t defLimit) {
  hbl::SpecimenFilter f;
  f.after = param_or(req, "after");
  f.limit = size_param(req, "limit", defLimit);
  if (req.has_param("flag"))    f.flag_kind = req.get_param_value("flag");
  if (req.has_param("review"))  f.review_status = req.get_param_value("review");
  if (req.has_param("catalog")) f.catalog_number = req.get_param_value("catalog");
  return f;
}

// Runs a handler, mapping the error classes onto status codes.
static void guarded(const char* route, httplib::Response& res, const std::function<void()>& fn) {
  try {
    fn();
  } catch (const hbl::ConfigurationError& e) {
    send_error(res, 400, e.what());
  } catch (const hbl::IntegrityViolation& e) {
    send_error(res, 409, e.what());
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", route, e.what());
    send_error(res, 500, "internal error");
  }
}

static json summary_page(const hbl::SpecimenPage& page) {
  json items = json::array();
  for (const auto& s : page.items) items.push_back(hbl::toJson(s));
  json out = {{"items", items}};
  out["next"] = page.next_cursor.empty() ? json(nullptr) : json(page.next_cursor);
  return out;
}

// -------- server --------

namespace hbl {

void run_http_server(SpecimenService& service,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /specimens
  // Body: raw image bytes. Source reference: X-HBL-Source header or ?source=
  svr.Post("/specimens", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("POST /specimens", res, [&] {
      std::string source = req.get_header_value("X-HBL-Source");
      if (source.empty()) source = param_or(req, "source");
      const IngestResult r = service.ingest(req.body, source);
      send_json(res, json{
        {"identity", r.identity},
        {"image_hash", r.image_hash},
        {"created", r.created},
        {"stored_at", r.stored_at}
      }, r.created ? 201 : 200);
    });
  });

  // GET /specimens?limit=&after=&flag=&review=&catalog=
  svr.Get("/specimens", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("GET /specimens", res, [&] {
      send_json(res, summary_page(service.listSpecimens(filter_from(req, 50))));
    });
  });

  svr.Get(R"(/specimens/([0-9a-f]{64})/record)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("GET /specimens/:id/record", res, [&] {
      auto got = service.getAggregatedRecord(req.matches[1].str());
      if (!got) { send_error(res, 404, "unknown specimen"); return; }
      json flags = json::array();
      for (const auto& f : got->second) flags.push_back(toJson(f));
      send_json(res, json{{"record", toJson(got->first)}, {"flags", flags}});
    });
  });

  svr.Get(R"(/specimens/([0-9a-f]{64})/lineage)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("GET /specimens/:id/lineage", res, [&] {
      auto chain = service.lineage(req.matches[1].str());
      if (!chain) { send_error(res, 404, "unknown specimen"); return; }
      send_json(res, toJson(*chain));
    });
  });

  // POST /specimens/{id}/attempts
  // Body: {"params": {...}, "fields": {...}, "errors": [...], "failed": false, "force": false}
  svr.Post(R"(/specimens/([0-9a-f]{64})/attempts)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("POST /specimens/:id/attempts", res, [&] {
      const std::string identity = req.matches[1].str();
      if (!service.index().specimen(identity)) { send_error(res, 404, "unknown specimen"); return; }
      const AttemptSubmission in = attemptSubmissionFromJson(parse_body(req));
      const DedupOutcome out = service.submit(identity, in.params, in.result, in.failed, in.force);
      json j = {
        {"outcome", toString(out.kind)},
        {"params_hash", out.params_hash},
        {"errors", out.errors}
      };
      j["attempt_id"] = out.attempt_id.empty() ? json(nullptr) : json(out.attempt_id);
      j["canonical_attempt"] = out.canonical_attempt ? json(*out.canonical_attempt) : json(nullptr);
      send_json(res, j, out.kind == DedupKind::Skipped ? 200 : 201);
    });
  });

  // POST /specimens/{id}/review
  // Body: {"decision_ref": "...", "status": "approved"}
  svr.Post(R"(/specimens/([0-9a-f]{64})/review)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("POST /specimens/:id/review", res, [&] {
      const std::string identity = req.matches[1].str();
      if (!service.index().specimen(identity)) { send_error(res, 404, "unknown specimen"); return; }
      const json body = parse_body(req);
      if (!body.is_object() || !body.contains("decision_ref") || !body["decision_ref"].is_string() ||
          !body.contains("status") || !body["status"].is_string()) {
        throw ConfigurationError("decision_ref and status are required strings");
      }
      ReviewReference ref{identity, body["decision_ref"].get<std::string>(),
                          body["status"].get<std::string>(), nowMillis()};
      service.attachReview(ref);
      send_json(res, toJson(ref));
    });
  });

  // POST /specimens/{id}/transformations
  // Body: {"image_hash": "...", "operation": "crop_label", "derived_from": "...", "params": {...}}
  // Later uploads of the derived bytes resolve to this specimen.
  svr.Post(R"(/specimens/([0-9a-f]{64})/transformations)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("POST /specimens/:id/transformations", res, [&] {
      const std::string identity = req.matches[1].str();
      if (!service.index().specimen(identity)) { send_error(res, 404, "unknown specimen"); return; }
      Transformation t = transformationFromJson(identity, parse_body(req));
      t.created_at = nowMillis();
      service.registerTransformation(t);
      send_json(res, toJson(t), 201);
    });
  });

  svr.Post(R"(/flags/(\d+)/resolve)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("POST /flags/:id/resolve", res, [&] {
      const int64_t id = parseRowId(req.matches[1].str());
      if (!service.resolveFlag(id)) { send_error(res, 404, "unknown flag"); return; }
      send_json(res, json{{"id", id}, {"resolved", true}});
    });
  });

  svr.Get(R"(/catalog/([^/]+)/lineage)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("GET /catalog/:number/lineage", res, [&] {
      json chains = json::array();
      for (const auto& c : service.lineageByCatalogNumber(req.matches[1].str())) chains.push_back(toJson(c));
      send_json(res, json{{"catalog_number", req.matches[1].str()}, {"chains", chains}});
    });
  });

  // GET /export?after=&review=&flag=&limit=
  // One lineage chain per line. limit=0 streams everything; a client
  // resumes with after=<last identity it stored>.
  svr.Get("/export", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("GET /export", res, [&] {
      SpecimenFilter filter = filter_from(req, 0);
      const size_t maxChains = filter.limit;
      filter.limit = 200;
      auto cursor = std::make_shared<ExportCursor>(service.exportRecords(filter));
      res.set_chunked_content_provider("application/x-ndjson",
        [cursor, maxChains](size_t, httplib::DataSink& sink) {
          if (maxChains && cursor->delivered() >= maxChains) {
            sink.done();
            return true;
          }
          std::optional<LineageChain> chain;
          try {
            chain = cursor->next();
          } catch (const std::exception& e) {
            spdlog::error("export aborted after {}: {}", cursor->resumeToken(), e.what());
            return false;
          }
          if (!chain) {
            sink.done();
            return true;
          }
          const std::string line = toJson(*chain).dump() + "\n";
          return sink.write(line.data(), line.size());
        });
    });
  });

  svr.Get("/stats", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded("GET /stats", res, [&] { send_json(res, toJson(service.stats())); });
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace hbl
