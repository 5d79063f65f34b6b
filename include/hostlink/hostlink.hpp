#pragma once

/// hostlink: drive a single-threaded host's live entity graph over a
/// loopback line-delimited JSON protocol.

#include "assets.hpp"
#include "autowire.hpp"
#include "client.hpp"
#include "codec.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "host_loop.hpp"
#include "log.hpp"
#include "params.hpp"
#include "property_bridge.hpp"
#include "registry.hpp"
#include "scene.hpp"
#include "server.hpp"
#include "standard_components.hpp"
#include "transport.hpp"
#include "types.hpp"
#include "workflows.hpp"
