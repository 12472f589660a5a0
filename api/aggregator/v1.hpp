#pragma once

#include "aggregator/v1/types.pb.h"
#include "aggregator/v1/events.pb.h"

#include "aggregator/v1/aggregator_service.pb.h"
#include "aggregator/v1/oracle_callback_service.pb.h"
#include "aggregator/v1/admin_service.pb.h"
