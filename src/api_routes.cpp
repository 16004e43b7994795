#include "api_routes.h"
#include "analysis_report.h"
#include "file_utils.h"
#include "language_detector.h"

#include <stdexcept>
#include <string>

namespace malsand {

namespace {

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = AnalysisReport::to_string(body);
    return resp;
}

HttpResponse json_error(int status, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    return json_response(status, body);
}

// "/status/<id>" -> "<id>"
std::string path_tail(const HttpRequest& req, const std::string& prefix) {
    return req.path.substr(prefix.size());
}

} // namespace

void register_api_routes(HttpServer& server, AnalysisEngine& engine) {
    // GET / - Service description
    server.route("GET", "/", [&engine](const HttpRequest&) {
        Json::Value info;
        info["service"] = "malsand";
        info["description"] = "VM-isolated dynamic analysis of untrusted files";
        info["vm"] = AnalysisReport::vm_status(engine.vm_status(), engine.controller().handle());
        info["queue_depth"] = static_cast<Json::UInt64>(engine.queue_depth());
        Json::Value extensions(Json::arrayValue);
        for (const auto& ext : LanguageDetector::supported_extensions()) {
            extensions.append(ext);
        }
        info["supported_extensions"] = extensions;
        return json_response(200, info);
    });

    // POST /submit - Raw artifact body, name in X-Filename
    server.route("POST", "/submit", [&engine](const HttpRequest& req) {
        std::string filename = req.header("X-Filename");
        if (filename.empty()) {
            return json_error(400, "X-Filename header is required");
        }
        if (req.body.size() > engine.config().max_artifact_size) {
            return json_error(413, "Artifact exceeds " +
                              FileUtils::format_file_size(engine.config().max_artifact_size));
        }
        try {
            std::string job_id = engine.submit(filename, req.body, req.header("X-Language"));
            Json::Value body = AnalysisReport::status(*engine.status(job_id));
            return json_response(202, body);
        } catch (const std::invalid_argument& e) {
            return json_error(400, e.what());
        }
    });

    // GET /status/{job_id} - Progress and output text
    server.route("GET", "/status/", [&engine](const HttpRequest& req) {
        auto snapshot = engine.status(path_tail(req, "/status/"));
        if (!snapshot) return json_error(404, "Job not found");
        return json_response(200, AnalysisReport::status(*snapshot));
    });

    // GET /result/{job_id} - Finished-analysis record
    server.route("GET", "/result/", [&engine](const HttpRequest& req) {
        std::string job_id = path_tail(req, "/result/");
        auto snapshot = engine.status(job_id);
        if (!snapshot) return json_error(404, "Job not found");
        if (snapshot->status == JobStatus::ERROR) {
            return json_response(200, AnalysisReport::status(*snapshot));
        }
        auto report = engine.report(job_id);
        if (!report) {
            Json::Value body = AnalysisReport::status(*snapshot);
            body["error"] = "Job not finished";
            return json_response(409, body);
        }
        return json_response(200, *report);
    });

    // GET /outputs/{job_id} - Files pulled back from the guest
    server.route("GET", "/outputs/", [&engine](const HttpRequest& req) {
        std::string job_id = path_tail(req, "/outputs/");
        auto artifacts = engine.list_result_artifacts(job_id);
        if (!artifacts) return json_error(404, "Job not found");
        Json::Value body;
        body["job_id"] = job_id;
        body["outputs"] = AnalysisReport::artifacts(*artifacts);
        return json_response(200, body);
    });

    // GET /download/{job_id}/{filename}
    server.route("GET", "/download/", [&engine](const HttpRequest& req) {
        std::string rest = path_tail(req, "/download/");
        size_t slash = rest.find('/');
        if (slash == std::string::npos) return json_error(400, "Expected /download/{job_id}/{file}");
        std::string job_id = rest.substr(0, slash);
        std::string filename = rest.substr(slash + 1);

        auto data = engine.fetch_artifact(job_id, filename);
        if (!data) return json_error(404, "File not found");

        HttpResponse resp;
        resp.headers["Content-Type"] = FileUtils::get_mime_type(filename);
        resp.headers["Content-Disposition"] = "attachment; filename=\"" + filename + "\"";
        resp.body.assign(data->begin(), data->end());
        return resp;
    });

    // POST /cancel/{job_id}
    server.route("POST", "/cancel/", [&engine](const HttpRequest& req) {
        std::string job_id = path_tail(req, "/cancel/");
        if (!engine.status(job_id)) return json_error(404, "Job not found");
        Json::Value body;
        body["job_id"] = job_id;
        body["cancelled"] = engine.cancel(job_id);
        return json_response(200, body);
    });

    // GET /vm/status
    server.route("GET", "/vm/status", [&engine](const HttpRequest&) {
        return json_response(200, AnalysisReport::vm_status(engine.vm_status(),
                                                            engine.controller().handle()));
    });

    // POST /vm/{start,stop,restart} - Administrative control, waits for the active job
    auto vm_action = [&engine](const std::string& action) {
        return [&engine, action](const HttpRequest&) {
            try {
                if (action == "start") {
                    engine.start_vm();
                } else if (action == "stop") {
                    engine.stop_vm();
                } else {
                    engine.restart_vm();
                }
            } catch (const EngineError& e) {
                Json::Value body = AnalysisReport::vm_status(engine.vm_status(),
                                                             engine.controller().handle());
                body["error"] = e.what();
                body["kind"] = error_kind_to_string(e.kind());
                return json_response(503, body);
            }
            return json_response(200, AnalysisReport::vm_status(engine.vm_status(),
                                                                engine.controller().handle()));
        };
    };
    server.route("POST", "/vm/start", vm_action("start"));
    server.route("POST", "/vm/stop", vm_action("stop"));
    server.route("POST", "/vm/restart", vm_action("restart"));
}

} // namespace malsand
