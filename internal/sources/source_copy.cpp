#include "source_copy.hpp"

#include <cstdint>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace pointzilla::sources {

SourceCopySpec SourceCopySpec::Parse(std::string_view text) {
  text = util::Trim(text);

  SourceCopySpec spec;
  if (!text.empty() && text.front() == '[') {
    const auto close = text.find(']');
    if (close == std::string_view::npos) {
      throw util::ConfigurationError("Source time-series '" + std::string(text) + "' is missing a closing ']'");
    }

    const auto server_part = text.substr(1, close - 1);
    text.remove_prefix(close + 1);

    // "host:port" keeps its colon; three or more parts end with username and password.
    const auto parts = util::Split(server_part, ":");
    if (parts.size() >= 3) {
      const auto host_parts = parts.size() - 2;
      std::string server;
      for (std::size_t i = 0; i < host_parts; ++i) {
        if (i > 0) server += ":";
        server += parts[i];
      }
      spec.server   = server;
      spec.username = parts[parts.size() - 2];
      spec.password = parts[parts.size() - 1];
    } else {
      spec.server = std::string(server_part);
    }

    if (spec.server->empty()) {
      throw util::ConfigurationError("Source time-series '[" + std::string(server_part) + "]' names no server");
    }
  }

  spec.identifier = std::string(util::Trim(text));
  if (spec.identifier.empty()) {
    throw util::ConfigurationError("Source time-series identifier can't be empty");
  }

  return spec;
}

SourceCopyExtractor::SourceCopyExtractor(store::StoreFactory factory, std::optional<store::ServerEndpoint> primary)
    : factory_(std::move(factory)), primary_(std::move(primary)) {
}

store::ServerEndpoint SourceCopyExtractor::ResolveEndpoint(const SourceCopySpec& spec) const {
  if (!spec.server) {
    if (!primary_ || primary_->address.empty()) {
      throw util::ConfigurationError("A server is required to load the source time-series");
    }
    return *primary_;
  }

  store::ServerEndpoint endpoint;
  if (primary_) {
    endpoint = *primary_;
  }
  if (endpoint.address != *spec.server) {
    endpoint.session_token.clear();
  }
  endpoint.address = *spec.server;
  if (spec.username) {
    endpoint.username      = *spec.username;
    endpoint.password      = spec.password.value_or("");
    endpoint.session_token.clear();
  }
  return endpoint;
}

std::vector<model::Point> SourceCopyExtractor::Extract(const SourceCopySpec& spec) const {
  const auto endpoint = ResolveEndpoint(spec);
  auto       store    = factory_(endpoint);

  const auto series = store->ResolveSeries(spec.identifier);
  auto       points = store->GetSeriesPoints(series.unique_id, spec.query_from, spec.query_to);

  POINTZILLA_LOG_INFO("source points loaded",
                      {observability::StringField("server", endpoint.address),
                       observability::StringField("time_series", series.identifier),
                       observability::IntField("points", static_cast<std::int64_t>(points.size()))});
  return points;
}

} // namespace pointzilla::sources
