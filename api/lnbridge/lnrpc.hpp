#pragma once

#include "lightning.pb.h"
#include "lightning.grpc.pb.h"

#include "routerrpc/router.pb.h"
#include "routerrpc/router.grpc.pb.h"
