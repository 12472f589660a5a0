#pragma once

#include "aggregator/v1.hpp"

#include "aggregator/v1/aggregator_service.grpc.pb.h"
#include "aggregator/v1/oracle_callback_service.grpc.pb.h"
#include "aggregator/v1/admin_service.grpc.pb.h"
