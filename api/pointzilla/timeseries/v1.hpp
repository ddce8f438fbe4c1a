#pragma once

#include "pointzilla/timeseries/v1/point.pb.h"
#include "pointzilla/timeseries/v1/timeseries_service.pb.h"

#include "pointzilla/timeseries/v1/timeseries_service.grpc.pb.h"
