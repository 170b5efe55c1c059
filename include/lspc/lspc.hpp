#pragma once

/// Umbrella header for the lspc language server client library.

#include "version.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "session.hpp"
#include "notification_queue.hpp"
#include "process.hpp"
#include "client.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
