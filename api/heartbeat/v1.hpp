#pragma once

#include "heartbeat/v1/types.pb.h"

#include "heartbeat/v1/heartbeat_service.pb.h"
#include "heartbeat/v1/admin_service.pb.h"
#include "heartbeat/v1/facts_service.pb.h"

#include "heartbeat/v1/heartbeat_service.grpc.pb.h"
#include "heartbeat/v1/admin_service.grpc.pb.h"
#include "heartbeat/v1/facts_service.grpc.pb.h"
