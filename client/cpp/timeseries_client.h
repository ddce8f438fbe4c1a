#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <chrono>
#include <memory>
#include <string>

#include "pointzilla/timeseries/v1.hpp"

namespace pointzilla::timeseries::client {

/*
  Credentials attached to every call as metadata.

  A session token wins over username/password.
*/
struct CallCredentials {
  std::string username;
  std::string password;
  std::string session_token;
};

class TimeSeriesClient {
 public:
  TimeSeriesClient(std::shared_ptr<grpc::Channel> channel, CallCredentials credentials,
                   std::chrono::milliseconds rpc_timeout = std::chrono::seconds(60));

  arrow::Result<pointzilla::timeseries::v1::ResolveTimeSeriesResponse> ResolveTimeSeries(const std::string& identifier) const;

  arrow::Result<pointzilla::timeseries::v1::CreateTimeSeriesResponse> CreateTimeSeries(
      const pointzilla::timeseries::v1::CreateTimeSeriesRequest& request) const;

  arrow::Result<pointzilla::timeseries::v1::AppendPointsResponse> AppendPoints(
      const pointzilla::timeseries::v1::AppendPointsRequest& request) const;

  arrow::Result<pointzilla::timeseries::v1::GetAppendStatusResponse> GetAppendStatus(const std::string& append_request_id) const;

  arrow::Result<pointzilla::timeseries::v1::GetTimeSeriesPointsResponse> GetTimeSeriesPoints(
      const pointzilla::timeseries::v1::GetTimeSeriesPointsRequest& request) const;

  // Channel helper: insecure or default TLS credentials.
  static std::shared_ptr<grpc::Channel> Connect(const std::string& address, bool use_tls);

 private:
  void PrepareContext(grpc::ClientContext* ctx) const;

  std::unique_ptr<pointzilla::timeseries::v1::TimeSeriesService::Stub> stub_;
  CallCredentials                                                      credentials_;
  std::chrono::milliseconds                                            rpc_timeout_;
};

// gRPC status -> arrow::Status. NOT_FOUND maps to KeyError, INVALID_ARGUMENT
// to Invalid, everything else to IOError. The gRPC code name is kept in the message.
arrow::Status GrpcToArrow(const grpc::Status& status, const std::string& action);

} // namespace pointzilla::timeseries::client
