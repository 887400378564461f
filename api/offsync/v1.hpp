#pragma once

#include "offsync/v1/types.pb.h"

#include "offsync/v1/remote_mutation_service.pb.h"
#include "offsync/v1/sync_control_service.pb.h"

#include "offsync/v1/remote_mutation_service.grpc.pb.h"
#include "offsync/v1/sync_control_service.grpc.pb.h"
