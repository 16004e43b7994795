#pragma once

#include "analysis_engine.h"
#include "http_server.h"

namespace malsand {

// Engine operations over HTTP:
//   POST /submit                 raw body, X-Filename (and optional X-Language)
//   GET  /status/{id}            progress and output text
//   GET  /result/{id}            finished-analysis record
//   GET  /outputs/{id}           result files
//   GET  /download/{id}/{file}
//   POST /cancel/{id}
//   GET  /vm/status, POST /vm/start|stop|restart
void register_api_routes(HttpServer& server, AnalysisEngine& engine);

} // namespace malsand
