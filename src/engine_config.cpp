#include "engine_config.h"
#include "engine_errors.h"
#include "guest_path.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace malsand {

namespace {

void read_string(const Json::Value& section, const char* key, std::string& out, const std::string& where) {
    if (!section.isMember(key)) return;
    if (!section[key].isString()) {
        throw std::invalid_argument(where + "." + key + " must be a string");
    }
    out = section[key].asString();
}

void read_bool(const Json::Value& section, const char* key, bool& out, const std::string& where) {
    if (!section.isMember(key)) return;
    if (!section[key].isBool()) {
        throw std::invalid_argument(where + "." + key + " must be true or false");
    }
    out = section[key].asBool();
}

void read_int(const Json::Value& section, const char* key, int& out, const std::string& where) {
    if (!section.isMember(key)) return;
    if (!section[key].isInt()) {
        throw std::invalid_argument(where + "." + key + " must be an integer");
    }
    out = section[key].asInt();
}

const Json::Value& section(const Json::Value& root, const char* name) {
    static const Json::Value empty(Json::objectValue);
    if (!root.isMember(name)) return empty;
    if (!root[name].isObject()) {
        throw std::invalid_argument(std::string(name) + " must be an object");
    }
    return root[name];
}

void require_positive(int value, const std::string& name) {
    if (value <= 0) {
        throw std::invalid_argument(name + " must be positive");
    }
}

} // namespace

EngineConfig EngineConfig::from_json(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw std::invalid_argument("Invalid configuration JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    EngineConfig config;

    const Json::Value& vm = section(root, "vm");
    read_string(vm, "vmx_path", config.vmx_path, "vm");
    read_string(vm, "guest_user", config.guest_user, "vm");
    read_string(vm, "guest_password", config.guest_password, "vm");
    read_string(vm, "base_snapshot", config.base_snapshot, "vm");
    read_string(vm, "guest_work_dir", config.guest_work_dir, "vm");
    read_string(vm, "vmrun_path", config.vmrun_path, "vm");
    read_string(vm, "vmrun_host_type", config.vmrun_host_type, "vm");
    read_bool(vm, "headless", config.headless, "vm");
    read_bool(vm, "power_on_after_revert", config.power_on_after_revert, "vm");
    read_bool(vm, "auto_start", config.auto_start_vm, "vm");
    read_int(vm, "readiness_attempts", config.readiness_attempts, "vm");
    read_int(vm, "readiness_interval_ms", config.readiness_interval_ms, "vm");

    const Json::Value& timeouts = section(root, "timeouts");
    read_int(timeouts, "command", config.command_timeout, "timeouts");
    read_int(timeouts, "start", config.start_timeout, "timeouts");
    read_int(timeouts, "stop_grace", config.stop_grace, "timeouts");
    read_int(timeouts, "compile", config.compile_timeout, "timeouts");
    read_int(timeouts, "execution", config.execution_timeout, "timeouts");
    read_int(timeouts, "job", config.job_timeout, "timeouts");

    const Json::Value& trace = section(root, "trace");
    read_bool(trace, "enabled", config.enable_trace, "trace");
    read_string(trace, "tracer_path", config.tracer_path, "trace");

    const Json::Value& server = section(root, "server");
    read_string(server, "host_work_dir", config.host_work_dir, "server");
    read_int(server, "port", config.port, "server");
    read_int(server, "job_retention_minutes", config.job_retention_minutes, "server");
    if (server.isMember("max_artifact_mb")) {
        int mb = 0;
        read_int(server, "max_artifact_mb", mb, "server");
        require_positive(mb, "server.max_artifact_mb");
        config.max_artifact_size = static_cast<size_t>(mb) * 1024 * 1024;
    }

    return config;
}

EngineConfig EngineConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::invalid_argument("Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

void EngineConfig::apply_environment() {
    if (const char* password = std::getenv("MALSAND_GUEST_PASSWORD")) {
        guest_password = password;
    }
}

void EngineConfig::validate() const {
    if (vmx_path.empty()) {
        throw std::invalid_argument("vm.vmx_path is required (config file or --vmx)");
    }
    if (guest_user.empty()) {
        throw std::invalid_argument("vm.guest_user must not be empty");
    }
    if (base_snapshot.empty()) {
        throw std::invalid_argument("vm.base_snapshot must not be empty");
    }
    try {
        guest_path::require_absolute(guest_work_dir);
        guest_path::require_absolute(tracer_path);
    } catch (const TransferError& e) {
        throw std::invalid_argument(e.what());
    }
    if (guest_path::normalize(guest_work_dir) == "/") {
        throw std::invalid_argument("vm.guest_work_dir must not be the guest root");
    }
    require_positive(readiness_attempts, "vm.readiness_attempts");
    require_positive(readiness_interval_ms, "vm.readiness_interval_ms");
    require_positive(command_timeout, "timeouts.command");
    require_positive(start_timeout, "timeouts.start");
    require_positive(stop_grace, "timeouts.stop_grace");
    require_positive(compile_timeout, "timeouts.compile");
    require_positive(execution_timeout, "timeouts.execution");
    require_positive(job_timeout, "timeouts.job");
    require_positive(job_retention_minutes, "server.job_retention_minutes");
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("server.port must be between 1 and 65535");
    }
    if (host_work_dir.empty()) {
        throw std::invalid_argument("server.host_work_dir must not be empty");
    }
}

Json::Value EngineConfig::to_json() const {
    Json::Value root;
    Json::Value& vm = root["vm"];
    vm["vmx_path"] = vmx_path;
    vm["guest_user"] = guest_user;
    vm["guest_password"] = "<hidden>";
    vm["base_snapshot"] = base_snapshot;
    vm["guest_work_dir"] = guest_work_dir;
    vm["vmrun_path"] = vmrun_path;
    vm["vmrun_host_type"] = vmrun_host_type;
    vm["headless"] = headless;
    vm["power_on_after_revert"] = power_on_after_revert;
    vm["auto_start"] = auto_start_vm;
    vm["readiness_attempts"] = readiness_attempts;
    vm["readiness_interval_ms"] = readiness_interval_ms;

    Json::Value& timeouts = root["timeouts"];
    timeouts["command"] = command_timeout;
    timeouts["start"] = start_timeout;
    timeouts["stop_grace"] = stop_grace;
    timeouts["compile"] = compile_timeout;
    timeouts["execution"] = execution_timeout;
    timeouts["job"] = job_timeout;

    root["trace"]["enabled"] = enable_trace;
    root["trace"]["tracer_path"] = tracer_path;

    Json::Value& server = root["server"];
    server["host_work_dir"] = host_work_dir;
    server["port"] = port;
    server["job_retention_minutes"] = job_retention_minutes;
    server["max_artifact_mb"] = static_cast<Json::UInt64>(max_artifact_size / (1024 * 1024));
    return root;
}

VMHandle EngineConfig::vm_handle() const {
    VMHandle handle;
    handle.image_path = vmx_path;
    handle.credentials = GuestCredentials{guest_user, guest_password};
    handle.base_snapshot = base_snapshot;
    handle.guest_work_dir = guest_path::normalize(guest_work_dir);
    handle.default_timeout = std::chrono::seconds(command_timeout);
    return handle;
}

LifecycleOptions EngineConfig::lifecycle_options() const {
    LifecycleOptions options;
    options.readiness_attempts = readiness_attempts;
    options.readiness_interval = std::chrono::milliseconds(readiness_interval_ms);
    options.start_timeout = std::chrono::seconds(start_timeout);
    options.headless = headless;
    options.power_on_after_revert = power_on_after_revert;
    return options;
}

VmrunOptions EngineConfig::vmrun_options() const {
    VmrunOptions options;
    options.vmrun_path = vmrun_path;
    options.host_type = vmrun_host_type;
    options.command_timeout = std::chrono::seconds(command_timeout);
    options.stop_grace = std::chrono::seconds(stop_grace);
    options.start_timeout = std::chrono::seconds(start_timeout);
    options.capture_dir = host_work_dir + "/.capture";
    return options;
}

PipelineOptions EngineConfig::pipeline_options() const {
    PipelineOptions options;
    options.compile_timeout = std::chrono::seconds(compile_timeout);
    options.execution_timeout = std::chrono::seconds(execution_timeout);
    options.probe_timeout = std::chrono::seconds(command_timeout);
    options.enable_trace = enable_trace;
    options.tracer_path = tracer_path;
    return options;
}

SerializerOptions EngineConfig::serializer_options() const {
    SerializerOptions options;
    options.job_timeout = std::chrono::seconds(job_timeout);
    options.auto_start_vm = auto_start_vm;
    return options;
}

} // namespace malsand
