/*
 * Malsand - VM-isolated dynamic analysis
 * Runs untrusted files inside a snapshot-reverted VM and reports behavior
 */

#include "analysis_engine.h"
#include "analysis_report.h"
#include "api_routes.h"
#include "engine_config.h"
#include "file_utils.h"
#include "http_server.h"
#include "vmrun_hypervisor.h"
#include <iostream>
#include <thread>
#include <sstream>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

using namespace malsand;

namespace {

struct CommandLine {
    std::string command = "serve";          // serve | vm | analyze
    std::string vm_action;
    std::string sample_path;
    std::string language;
    std::string config_file;
    std::string vmx_path;
    std::string snapshot;
    int port = 0;
    bool no_trace = false;
    bool start_vm = false;
};

void print_usage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " [serve] [options]          Run the HTTP API\n"
              << "  " << program << " vm start|stop|restart|status [options]\n"
              << "  " << program << " analyze <file> [--language <name>] [options]\n"
              << "\nOptions:\n"
              << "  --config <file>     JSON configuration\n"
              << "  --vmx <path>        VM descriptor\n"
              << "  --snapshot <name>   Clean snapshot to revert to\n"
              << "  --port <port>       HTTP port (serve)\n"
              << "  --no-trace          Skip the syscall trace stage\n"
              << "  --start-vm          Power on the VM before serving\n"
              << "\nMALSAND_GUEST_PASSWORD overrides the configured guest password.\n";
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
            return argv[++i];
        };
        if (arg == "--config") {
            cli.config_file = value();
        } else if (arg == "--vmx") {
            cli.vmx_path = value();
        } else if (arg == "--snapshot") {
            cli.snapshot = value();
        } else if (arg == "--port") {
            std::string port = value();
            try {
                cli.port = std::stoi(port);
            } catch (const std::exception&) {
                throw std::invalid_argument("Invalid port: " + port);
            }
        } else if (arg == "--language") {
            cli.language = value();
        } else if (arg == "--no-trace") {
            cli.no_trace = true;
        } else if (arg == "--start-vm") {
            cli.start_vm = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (!positional.empty()) {
        cli.command = positional[0];
    }
    if (cli.command == "vm") {
        if (positional.size() != 2) throw std::invalid_argument("vm needs an action");
        cli.vm_action = positional[1];
        static const std::vector<std::string> actions = {"start", "stop", "restart", "status"};
        if (std::find(actions.begin(), actions.end(), cli.vm_action) == actions.end()) {
            throw std::invalid_argument("Unknown vm action: " + cli.vm_action);
        }
    } else if (cli.command == "analyze") {
        if (positional.size() != 2) throw std::invalid_argument("analyze needs a file");
        cli.sample_path = positional[1];
    } else if (cli.command != "serve" || positional.size() > 1) {
        throw std::invalid_argument("Unknown command: " + positional.back());
    }
    return cli;
}

EngineConfig build_config(const CommandLine& cli) {
    EngineConfig config = cli.config_file.empty() ? EngineConfig{}
                                                  : EngineConfig::load_file(cli.config_file);
    if (!cli.vmx_path.empty()) config.vmx_path = cli.vmx_path;
    if (!cli.snapshot.empty()) config.base_snapshot = cli.snapshot;
    if (cli.port != 0) config.port = cli.port;
    if (cli.no_trace) config.enable_trace = false;
    config.apply_environment();
    config.validate();
    return config;
}

int run_vm_command(const CommandLine& cli, const EngineConfig& config,
                   VmrunHypervisor& hypervisor, AnalysisEngine& engine) {
    try {
        if (cli.vm_action == "status") {
            auto running = hypervisor.running_vms();
            bool is_running = std::find(running.begin(), running.end(), config.vmx_path) != running.end();
            bool ready = is_running &&
                hypervisor.is_guest_ready(config.vmx_path,
                                          GuestCredentials{config.guest_user, config.guest_password});
            Json::Value status;
            status["vmx_path"] = config.vmx_path;
            status["base_snapshot"] = config.base_snapshot;
            status["running"] = is_running;
            status["ready"] = ready;
            status["available"] = ready;
            std::cout << AnalysisReport::to_string(status, true) << std::endl;
            return ready ? 0 : 1;
        }
        if (cli.vm_action == "start") {
            engine.start_vm();
        } else if (cli.vm_action == "stop") {
            engine.stop_vm();
        } else {
            engine.restart_vm();
        }
    } catch (const EngineError& e) {
        std::cerr << "[VM] " << error_kind_to_string(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    }
    std::cout << AnalysisReport::to_string(
        AnalysisReport::vm_status(engine.vm_status(), engine.controller().handle()), true) << std::endl;
    return 0;
}

int run_analyze(const CommandLine& cli, const EngineConfig& config, AnalysisEngine& engine) {
    engine.start();
    std::string job_id;
    try {
        job_id = engine.submit_file(cli.sample_path, cli.language);
    } catch (const std::exception& e) {
        std::cerr << "Cannot submit " << cli.sample_path << ": " << e.what() << std::endl;
        return 1;
    }

    auto limit = std::chrono::seconds(config.start_timeout + config.job_timeout + 2 * config.command_timeout);
    if (!engine.wait_for(job_id, limit)) {
        engine.cancel(job_id);
        engine.wait_for(job_id, std::chrono::seconds(config.command_timeout * 2));
    }

    auto snapshot = engine.status(job_id);
    std::cerr << snapshot->output_text;
    if (snapshot->status != JobStatus::DONE) {
        std::cout << AnalysisReport::to_string(AnalysisReport::status(*snapshot), true) << std::endl;
        return 1;
    }
    std::cout << AnalysisReport::to_string(*engine.report(job_id), true) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    EngineConfig config;
    try {
        cli = parse_command_line(argc, argv);
        config = build_config(cli);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    VmrunHypervisor hypervisor(config.vmrun_options());
    AnalysisEngine engine(config, hypervisor);

    if (cli.command == "vm") {
        return run_vm_command(cli, config, hypervisor, engine);
    }
    if (cli.command == "analyze") {
        return run_analyze(cli, config, engine);
    }

    std::cout << "Malsand - VM-isolated dynamic analysis" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "VM:        " << config.vmx_path << std::endl;
    std::cout << "Snapshot:  " << config.base_snapshot << std::endl;
    std::cout << "Guest dir: " << config.guest_work_dir << std::endl;
    std::cout << "Tracing:   " << (config.enable_trace ? config.tracer_path : "disabled") << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    engine.start();

    if (cli.start_vm) {
        try {
            engine.start_vm();
        } catch (const EngineError& e) {
            std::cerr << "[VM] Initial start failed: " << e.what()
                      << " (use POST /vm/restart once fixed)" << std::endl;
        }
    }

    // Drop finished jobs after the retention period
    std::atomic<bool> running{true};
    std::thread purger([&engine, &running, &config]() {
        auto retention = std::chrono::minutes(config.job_retention_minutes);
        while (running) {
            for (int i = 0; i < 60 && running; ++i) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
            engine.purge_finished(retention);
        }
    });

    HttpServer server(config.port, config.max_artifact_size + 64 * 1024);
    register_api_routes(server, engine);

    int exit_code = 0;
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] " << e.what() << std::endl;
        exit_code = 1;
    }

    running = false;
    purger.join();
    engine.shutdown();
    return exit_code;
}
