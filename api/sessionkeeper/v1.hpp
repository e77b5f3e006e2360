#pragma once

#include "sessionkeeper/v1/session.pb.h"

#include "sessionkeeper/v1/admin_service.pb.h"
#include "sessionkeeper/v1/driver_service.pb.h"
#include "sessionkeeper/v1/session_service.pb.h"

#include "sessionkeeper/v1/admin_service.grpc.pb.h"
#include "sessionkeeper/v1/driver_service.grpc.pb.h"
#include "sessionkeeper/v1/session_service.grpc.pb.h"
