#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/point.hpp"
#include "internal/store/timeseries_store.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::sources {

/*
  Source series to copy points from.

    Identifier                          primary server
    [server]Identifier                  other server, primary credentials
    [server:username:password]Identifier
*/
struct SourceCopySpec {
  std::string                    identifier;
  std::optional<std::string>     server;
  std::optional<std::string>     username;
  std::optional<std::string>     password;
  std::optional<util::TimePoint> query_from;
  std::optional<util::TimePoint> query_to;

  // Throws util::ConfigurationError on a malformed specifier.
  static SourceCopySpec Parse(std::string_view text);
};

class SourceCopyExtractor {
 public:
  SourceCopyExtractor(store::StoreFactory factory, std::optional<store::ServerEndpoint> primary);

  // The endpoint a source specifier resolves to. Missing credentials come from the primary.
  store::ServerEndpoint ResolveEndpoint(const SourceCopySpec& spec) const;

  // Throws util::NotFound or util::RemoteError.
  std::vector<model::Point> Extract(const SourceCopySpec& spec) const;

 private:
  store::StoreFactory                  factory_;
  std::optional<store::ServerEndpoint> primary_;
};

} // namespace pointzilla::sources
