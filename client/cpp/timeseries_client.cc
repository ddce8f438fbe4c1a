#include "client/cpp/timeseries_client.h"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <string>
#include <utility>

namespace pointzilla::timeseries::client {

namespace {

const char* CodeName(grpc::StatusCode code) {
  switch (code) {
    case grpc::StatusCode::OK:
      return "OK";
    case grpc::StatusCode::CANCELLED:
      return "CANCELLED";
    case grpc::StatusCode::UNKNOWN:
      return "UNKNOWN";
    case grpc::StatusCode::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return "DEADLINE_EXCEEDED";
    case grpc::StatusCode::NOT_FOUND:
      return "NOT_FOUND";
    case grpc::StatusCode::ALREADY_EXISTS:
      return "ALREADY_EXISTS";
    case grpc::StatusCode::PERMISSION_DENIED:
      return "PERMISSION_DENIED";
    case grpc::StatusCode::UNAUTHENTICATED:
      return "UNAUTHENTICATED";
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return "RESOURCE_EXHAUSTED";
    case grpc::StatusCode::FAILED_PRECONDITION:
      return "FAILED_PRECONDITION";
    case grpc::StatusCode::ABORTED:
      return "ABORTED";
    case grpc::StatusCode::OUT_OF_RANGE:
      return "OUT_OF_RANGE";
    case grpc::StatusCode::UNIMPLEMENTED:
      return "UNIMPLEMENTED";
    case grpc::StatusCode::INTERNAL:
      return "INTERNAL";
    case grpc::StatusCode::UNAVAILABLE:
      return "UNAVAILABLE";
    case grpc::StatusCode::DATA_LOSS:
      return "DATA_LOSS";
    default:
      return "UNKNOWN";
  }
}

} // namespace

arrow::Status GrpcToArrow(const grpc::Status& status, const std::string& action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }

  const std::string detail = std::string(CodeName(status.error_code())) + ": " + status.error_message();
  switch (status.error_code()) {
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(action, " failed: ", detail);
    case grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(action, " failed: ", detail);
    default:
      return arrow::Status::IOError(action, " failed: ", detail);
  }
}

// ------------------------------------------------------------
// TimeSeriesClient
// ------------------------------------------------------------

TimeSeriesClient::TimeSeriesClient(std::shared_ptr<grpc::Channel> channel, CallCredentials credentials,
                                   std::chrono::milliseconds rpc_timeout)
    : stub_(pointzilla::timeseries::v1::TimeSeriesService::NewStub(std::move(channel))),
      credentials_(std::move(credentials)),
      rpc_timeout_(rpc_timeout) {
}

std::shared_ptr<grpc::Channel> TimeSeriesClient::Connect(const std::string& address, bool use_tls) {
  auto channel_credentials = use_tls ? grpc::SslCredentials(grpc::SslCredentialsOptions{}) : grpc::InsecureChannelCredentials();
  return grpc::CreateChannel(address, channel_credentials);
}

void TimeSeriesClient::PrepareContext(grpc::ClientContext* ctx) const {
  if (!credentials_.session_token.empty()) {
    ctx->AddMetadata("x-session-token", credentials_.session_token);
  } else if (!credentials_.username.empty()) {
    ctx->AddMetadata("x-username", credentials_.username);
    ctx->AddMetadata("x-password", credentials_.password);
  }

  if (rpc_timeout_.count() > 0) {
    ctx->set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
  }
}

arrow::Result<pointzilla::timeseries::v1::ResolveTimeSeriesResponse> TimeSeriesClient::ResolveTimeSeries(
    const std::string& identifier) const {
  pointzilla::timeseries::v1::ResolveTimeSeriesRequest request;
  request.set_identifier(identifier);

  pointzilla::timeseries::v1::ResolveTimeSeriesResponse response;
  grpc::ClientContext                                   ctx;
  PrepareContext(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ResolveTimeSeries(&ctx, request, &response), "ResolveTimeSeries"));
  return response;
}

arrow::Result<pointzilla::timeseries::v1::CreateTimeSeriesResponse> TimeSeriesClient::CreateTimeSeries(
    const pointzilla::timeseries::v1::CreateTimeSeriesRequest& request) const {
  pointzilla::timeseries::v1::CreateTimeSeriesResponse response;
  grpc::ClientContext                                  ctx;
  PrepareContext(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->CreateTimeSeries(&ctx, request, &response), "CreateTimeSeries"));
  if (response.unique_id().empty()) {
    return arrow::Status::IOError("CreateTimeSeries failed: server returned no unique id");
  }
  return response;
}

arrow::Result<pointzilla::timeseries::v1::AppendPointsResponse> TimeSeriesClient::AppendPoints(
    const pointzilla::timeseries::v1::AppendPointsRequest& request) const {
  pointzilla::timeseries::v1::AppendPointsResponse response;
  grpc::ClientContext                              ctx;
  PrepareContext(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->AppendPoints(&ctx, request, &response), "AppendPoints"));
  if (response.append_request_id().empty()) {
    return arrow::Status::IOError("AppendPoints failed: server returned no append request id");
  }
  return response;
}

arrow::Result<pointzilla::timeseries::v1::GetAppendStatusResponse> TimeSeriesClient::GetAppendStatus(
    const std::string& append_request_id) const {
  pointzilla::timeseries::v1::GetAppendStatusRequest request;
  request.set_append_request_id(append_request_id);

  pointzilla::timeseries::v1::GetAppendStatusResponse response;
  grpc::ClientContext                                 ctx;
  PrepareContext(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetAppendStatus(&ctx, request, &response), "GetAppendStatus"));
  return response;
}

arrow::Result<pointzilla::timeseries::v1::GetTimeSeriesPointsResponse> TimeSeriesClient::GetTimeSeriesPoints(
    const pointzilla::timeseries::v1::GetTimeSeriesPointsRequest& request) const {
  pointzilla::timeseries::v1::GetTimeSeriesPointsResponse response;
  grpc::ClientContext                                     ctx;
  PrepareContext(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetTimeSeriesPoints(&ctx, request, &response), "GetTimeSeriesPoints"));
  return response;
}

} // namespace pointzilla::timeseries::client
