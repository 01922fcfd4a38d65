#pragma once

// Generated wire schema shared by nodeagentd and its clients.
#include "nodeagent/v1/agent.pb.h"
#include "nodeagent/v1/agent.grpc.pb.h"
