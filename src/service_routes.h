#pragma once

#include "http_server.h"
#include <string>

namespace liverun {

class ChannelHub;
class ExecutionEngine;
class SubmissionDispatcher;

// WebSocket path prefix; the remainder of the path is the channel id
constexpr const char* CHANNEL_PATH_PREFIX = "/channel/";

// Register the liverun endpoints on a server:
//   GET  /               service info
//   GET  /health         liveness and active execution count
//   POST /run_code       start a run, or feed input to one
//   POST /provide_input  feed one input line
//   WS   /channel/{id}   live events; text frames are submissions
// Every referenced object must outlive the server.
void install_routes(HttpServer& server, ChannelHub& hub, ExecutionEngine& engine,
                    SubmissionDispatcher& dispatcher);

} // namespace liverun
