#pragma once

#include "availability/engine/v1/types.pb.h"

#include "availability/engine/v1/admission_service.pb.h"
#include "availability/engine/v1/schedule_service.pb.h"

#include "availability/engine/v1/admission_service.grpc.pb.h"
#include "availability/engine/v1/schedule_service.grpc.pb.h"
