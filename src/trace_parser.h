#pragma once

#include <optional>
#include <string>
#include <vector>

namespace malsand {

struct FileOperation {
    std::string action;       // read, write, create, delete, rename, mkdir, chmod
    std::string path;
    std::string timestamp;
};

struct NetworkConnection {
    std::string protocol;     // tcp, udp, raw
    std::string destination_ip;
    int port = 0;
    std::string timestamp;
};

struct ProcessCreation {
    std::string process_name;
    std::string arguments;
    std::string timestamp;
};

// Behavior observed in one syscall trace
struct TraceSummary {
    std::vector<FileOperation> file_operations;
    std::vector<NetworkConnection> network_connections;
    std::vector<ProcessCreation> process_creations;
    size_t syscall_count = 0;
};

// One decoded strace line
struct SyscallRecord {
    int pid = 0;
    std::string timestamp;
    std::string name;
    std::string args;
    std::string result;       // Empty while unfinished
    bool unfinished = false;
};

// Reads `strace -f -tt` output. Lines it does not understand (signals,
// exit notices, resumed halves) are skipped, never an error.
class TraceParser {
public:
    static constexpr size_t MAX_ENTRIES_PER_LIST = 500;

    static std::optional<SyscallRecord> parse_line(const std::string& line);
    static TraceSummary parse(const std::string& trace_text);

    // Quoted C strings in an argument list, unescaped, in order
    static std::vector<std::string> quoted_strings(const std::string& text);
};

} // namespace malsand
