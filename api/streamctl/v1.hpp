#pragma once

#include "streamctl/v1/stream_supervisor_service.pb.h"
#include "streamctl/v1/stream_types.pb.h"
