#include "grpc_timeseries_store.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/store/point_codec.hpp"
#include "internal/util/errors.hpp"

namespace pointzilla::store {

namespace {

namespace v1 = pointzilla::timeseries::v1;

// KeyError is what the client reports for NOT_FOUND.
template <typename T>
T UnwrapRemote(arrow::Result<T> result) {
  if (result.ok()) {
    return std::move(result).ValueOrDie();
  }
  if (result.status().IsKeyError()) {
    throw util::NotFound(result.status().message());
  }
  throw util::RemoteError(result.status().message());
}

v1::AppendMode ToProto(AppendMode mode) {
  switch (mode) {
    case AppendMode::kOverwrite:
      return v1::APPEND_MODE_OVERWRITE;
    case AppendMode::kReflected:
      return v1::APPEND_MODE_REFLECTED;
    case AppendMode::kAppend:
    default:
      return v1::APPEND_MODE_APPEND;
  }
}

v1::TimeSeriesType ToProto(SeriesType type) {
  switch (type) {
    case SeriesType::kReflected:
      return v1::TIME_SERIES_TYPE_REFLECTED;
    case SeriesType::kCalculated:
      return v1::TIME_SERIES_TYPE_CALCULATED;
    case SeriesType::kBasic:
    default:
      return v1::TIME_SERIES_TYPE_BASIC;
  }
}

v1::InterpolationType ToProto(InterpolationType type) {
  switch (type) {
    case InterpolationType::kPrecedingConstant:
      return v1::INTERPOLATION_TYPE_PRECEDING_CONSTANT;
    case InterpolationType::kPrecedingTotals:
      return v1::INTERPOLATION_TYPE_PRECEDING_TOTALS;
    case InterpolationType::kInstantaneousTotals:
      return v1::INTERPOLATION_TYPE_INSTANTANEOUS_TOTALS;
    case InterpolationType::kDiscreteValues:
      return v1::INTERPOLATION_TYPE_DISCRETE_VALUES;
    case InterpolationType::kSucceedingConstant:
      return v1::INTERPOLATION_TYPE_SUCCEEDING_CONSTANT;
    case InterpolationType::kInstantaneousValues:
    default:
      return v1::INTERPOLATION_TYPE_INSTANTANEOUS_VALUES;
  }
}

SeriesType FromProto(v1::TimeSeriesType type) {
  switch (type) {
    case v1::TIME_SERIES_TYPE_REFLECTED:
      return SeriesType::kReflected;
    case v1::TIME_SERIES_TYPE_CALCULATED:
      return SeriesType::kCalculated;
    default:
      return SeriesType::kBasic;
  }
}

AppendState FromProto(v1::AppendState state) {
  switch (state) {
    case v1::APPEND_STATE_COMPLETED:
      return AppendState::kCompleted;
    case v1::APPEND_STATE_FAILED:
      return AppendState::kFailed;
    default:
      return AppendState::kPending;
  }
}

} // namespace

GrpcTimeSeriesStore::GrpcTimeSeriesStore(std::shared_ptr<timeseries::client::TimeSeriesClient> client) : client_(std::move(client)) {
}

SeriesDescriptor GrpcTimeSeriesStore::ResolveSeries(const std::string& identifier_or_unique_id) {
  const auto response = UnwrapRemote(client_->ResolveTimeSeries(identifier_or_unique_id));

  SeriesDescriptor descriptor;
  descriptor.unique_id  = response.unique_id();
  descriptor.identifier = response.identifier().empty() ? identifier_or_unique_id : response.identifier();
  descriptor.type       = FromProto(response.type());
  return descriptor;
}

SeriesDescriptor GrpcTimeSeriesStore::CreateSeries(const std::string& identifier, const SeriesCreation& creation) {
  v1::CreateTimeSeriesRequest request;
  request.set_identifier(identifier);
  request.set_type(ToProto(creation.type));
  request.set_unit(creation.unit);
  request.set_interpolation_type(ToProto(creation.interpolation_type));
  *request.mutable_utc_offset() = util::ToProto(creation.utc_offset);
  if (creation.gap_tolerance) *request.mutable_gap_tolerance() = util::ToProto(*creation.gap_tolerance);
  request.set_publish(creation.publish);
  request.set_description(creation.description);
  request.set_comment(creation.comment);
  request.set_method(creation.method);
  request.set_computation_identifier(creation.computation_identifier);
  request.set_computation_period_identifier(creation.computation_period_identifier);
  request.set_sub_location_identifier(creation.sub_location_identifier);
  for (const auto& [key, value] : creation.extended_attributes) {
    (*request.mutable_extended_attributes())[key] = value;
  }

  const auto response = UnwrapRemote(client_->CreateTimeSeries(request));

  SeriesDescriptor descriptor;
  descriptor.unique_id  = response.unique_id();
  descriptor.identifier = response.identifier().empty() ? identifier : response.identifier();
  descriptor.type       = FromProto(response.type());
  return descriptor;
}

std::string GrpcTimeSeriesStore::AppendPoints(const std::string& unique_id, const std::vector<model::Point>& points, AppendMode mode,
                                              const std::optional<util::TimeRange>& overwrite_range) {
  v1::AppendPointsRequest request;
  request.set_unique_id(unique_id);
  request.set_mode(ToProto(mode));
  request.mutable_points()->Reserve(static_cast<int>(points.size()));
  for (const auto& point : points) {
    store::ToProto(point, request.add_points());
  }
  if (overwrite_range) {
    store::ToProto(*overwrite_range, request.mutable_overwrite_range());
  }

  const auto response = UnwrapRemote(client_->AppendPoints(request));
  return response.append_request_id();
}

AppendStatus GrpcTimeSeriesStore::GetAppendStatus(const std::string& append_request_id) {
  const auto response = UnwrapRemote(client_->GetAppendStatus(append_request_id));

  AppendStatus status;
  status.state           = FromProto(response.state());
  status.points_appended = static_cast<std::size_t>(response.number_of_points_appended());
  status.points_deleted  = static_cast<std::size_t>(response.number_of_points_deleted());
  status.message         = response.message();
  return status;
}

std::vector<model::Point> GrpcTimeSeriesStore::GetSeriesPoints(const std::string& unique_id, const std::optional<util::TimePoint>& from,
                                                               const std::optional<util::TimePoint>& to) {
  v1::GetTimeSeriesPointsRequest request;
  request.set_unique_id(unique_id);
  if (from) *request.mutable_query_from() = util::ToProto(*from);
  if (to) *request.mutable_query_to() = util::ToProto(*to);

  const auto response = UnwrapRemote(client_->GetTimeSeriesPoints(request));
  return PointsFromProto(response.points());
}

StoreFactory MakeGrpcStoreFactory() {
  return [](const ServerEndpoint& endpoint) -> std::shared_ptr<TimeSeriesStore> {
    POINTZILLA_LOG_DEBUG("connecting", {observability::StringField("address", endpoint.address),
                                        observability::BoolField("tls", endpoint.use_tls)});

    timeseries::client::CallCredentials credentials;
    credentials.username      = endpoint.username;
    credentials.password      = endpoint.password;
    credentials.session_token = endpoint.session_token;

    auto channel = timeseries::client::TimeSeriesClient::Connect(endpoint.address, endpoint.use_tls);
    auto client  = std::make_shared<timeseries::client::TimeSeriesClient>(
        std::move(channel), std::move(credentials), std::chrono::duration_cast<std::chrono::milliseconds>(endpoint.rpc_timeout));
    return std::make_shared<GrpcTimeSeriesStore>(std::move(client));
  };
}

} // namespace pointzilla::store
