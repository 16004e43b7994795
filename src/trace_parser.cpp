#include "trace_parser.h"
#include "guest_path.h"

#include <cctype>
#include <map>
#include <sstream>

namespace malsand {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// "10:15:02.123456" (-tt) or "1697012345.123456" (-ttt)
bool looks_like_timestamp(const std::string& s) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    bool separator = false;
    for (char c : s) {
        if (c == ':' || c == '.') {
            separator = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return separator;
}

std::string next_token(const std::string& line, size_t& pos) {
    while (pos < line.size() && line[pos] == ' ') ++pos;
    size_t start = pos;
    while (pos < line.size() && line[pos] != ' ') ++pos;
    return line.substr(start, pos - start);
}

bool failed(const SyscallRecord& rec) {
    return !rec.unfinished && (rec.result.compare(0, 2, "-1") == 0 || rec.result == "?");
}

bool is_library_noise(const std::string& path) {
    static const char* prefixes[] = {
        "/etc/ld.so", "/lib/", "/lib64/", "/usr/lib/", "/usr/lib64/", "/usr/local/lib/",
        "/usr/share/locale/", "/proc/self/", "/sys/", "/dev/",
    };
    for (const char* prefix : prefixes) {
        if (path.compare(0, std::string(prefix).size(), prefix) == 0) return true;
    }
    return false;
}

std::string open_action(const std::string& args) {
    if (args.find("O_CREAT") != std::string::npos) return "create";
    if (args.find("O_WRONLY") != std::string::npos || args.find("O_RDWR") != std::string::npos) {
        return "write";
    }
    return "read";
}

// Destination in a strace sockaddr rendering, if it is AF_INET/AF_INET6
bool parse_inet_address(const std::string& args, std::string& ip, int& port) {
    size_t family = args.find("sa_family=AF_INET");
    if (family == std::string::npos) return false;
    bool v6 = args.compare(family, 18, "sa_family=AF_INET6") == 0;

    size_t port_pos = args.find(v6 ? "sin6_port=htons(" : "sin_port=htons(", family);
    if (port_pos == std::string::npos) return false;
    port_pos = args.find('(', port_pos) + 1;
    size_t port_end = args.find(')', port_pos);
    std::string port_str = args.substr(port_pos, port_end - port_pos);
    if (!all_digits(port_str)) return false;
    port = std::stoi(port_str);

    size_t addr_pos = v6 ? args.find("inet_pton(AF_INET6, ", family)
                         : args.find("inet_addr(", family);
    if (addr_pos == std::string::npos) return false;
    auto strings = TraceParser::quoted_strings(args.substr(addr_pos));
    if (strings.empty()) return false;
    ip = strings.front();
    return true;
}

std::string socket_protocol(const std::string& args) {
    if (args.find("SOCK_STREAM") != std::string::npos) return "tcp";
    if (args.find("SOCK_DGRAM") != std::string::npos) return "udp";
    if (args.find("SOCK_RAW") != std::string::npos) return "raw";
    return "unknown";
}

template <typename T>
void push_bounded(std::vector<T>& list, T entry) {
    if (list.size() < TraceParser::MAX_ENTRIES_PER_LIST) {
        list.push_back(std::move(entry));
    }
}

} // namespace

std::vector<std::string> TraceParser::quoted_strings(const std::string& text) {
    std::vector<std::string> out;
    size_t pos = 0;
    while ((pos = text.find('"', pos)) != std::string::npos) {
        std::string value;
        ++pos;
        bool closed = false;
        while (pos < text.size()) {
            char c = text[pos++];
            if (c == '\\' && pos < text.size()) {
                char esc = text[pos++];
                switch (esc) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    default: value += esc; break;
                }
            } else if (c == '"') {
                closed = true;
                break;
            } else {
                value += c;
            }
        }
        if (!closed) break;
        // strace marks truncated strings with "..." right after the quote
        out.push_back(value);
    }
    return out;
}

std::optional<SyscallRecord> TraceParser::parse_line(const std::string& raw_line) {
    std::string line = raw_line;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    SyscallRecord rec;
    size_t pos = 0;

    if (line.compare(0, 4, "[pid") == 0) {
        size_t close = line.find(']');
        if (close == std::string::npos) return std::nullopt;
        std::string pid = line.substr(4, close - 4);
        size_t first = pid.find_first_not_of(' ');
        pid = first == std::string::npos ? "" : pid.substr(first);
        if (!all_digits(pid)) return std::nullopt;
        rec.pid = std::stoi(pid);
        pos = close + 1;
    }

    // Optional pid, then optional timestamp
    size_t save = pos;
    std::string token = next_token(line, pos);
    if (rec.pid == 0 && all_digits(token)) {
        rec.pid = std::stoi(token);
        save = pos;
        token = next_token(line, pos);
    }
    if (looks_like_timestamp(token)) {
        rec.timestamp = token;
    } else {
        pos = save;
    }

    while (pos < line.size() && line[pos] == ' ') ++pos;
    std::string call = line.substr(pos);
    if (call.empty() || call[0] == '<' || call.compare(0, 3, "---") == 0 || call.compare(0, 3, "+++") == 0) {
        return std::nullopt;
    }

    size_t paren = call.find('(');
    if (paren == std::string::npos || paren == 0) return std::nullopt;
    rec.name = call.substr(0, paren);
    for (char c : rec.name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return std::nullopt;
    }

    size_t result_sep = call.rfind(") = ");
    size_t unfinished = call.find(" <unfinished ...>");
    if (result_sep != std::string::npos && (unfinished == std::string::npos || result_sep > unfinished)) {
        rec.args = call.substr(paren + 1, result_sep - paren - 1);
        rec.result = call.substr(result_sep + 4);
    } else if (unfinished != std::string::npos) {
        rec.args = call.substr(paren + 1, unfinished - paren - 1);
        rec.unfinished = true;
    } else {
        return std::nullopt;
    }
    return rec;
}

TraceSummary TraceParser::parse(const std::string& trace_text) {
    TraceSummary summary;
    // (pid, fd) -> protocol, from socket() results
    std::map<std::pair<int, std::string>, std::string> sockets;

    std::istringstream stream(trace_text);
    std::string line;
    while (std::getline(stream, line)) {
        auto parsed = parse_line(line);
        if (!parsed) continue;
        const SyscallRecord& rec = *parsed;
        ++summary.syscall_count;

        const std::string& name = rec.name;
        if (name == "open" || name == "openat" || name == "creat") {
            if (failed(rec)) continue;
            auto paths = quoted_strings(rec.args);
            if (paths.empty()) continue;
            std::string action = (name == "creat") ? "create" : open_action(rec.args);
            if (action == "read" && is_library_noise(paths.front())) continue;
            push_bounded(summary.file_operations, FileOperation{action, paths.front(), rec.timestamp});
        } else if (name == "unlink" || name == "unlinkat" || name == "rmdir") {
            if (failed(rec)) continue;
            auto paths = quoted_strings(rec.args);
            if (paths.empty()) continue;
            push_bounded(summary.file_operations, FileOperation{"delete", paths.front(), rec.timestamp});
        } else if (name == "rename" || name == "renameat" || name == "renameat2") {
            if (failed(rec)) continue;
            auto paths = quoted_strings(rec.args);
            if (paths.size() < 2) continue;
            push_bounded(summary.file_operations,
                         FileOperation{"rename", paths[0] + " -> " + paths[1], rec.timestamp});
        } else if (name == "mkdir" || name == "mkdirat") {
            if (failed(rec)) continue;
            auto paths = quoted_strings(rec.args);
            if (paths.empty()) continue;
            push_bounded(summary.file_operations, FileOperation{"mkdir", paths.front(), rec.timestamp});
        } else if (name == "chmod" || name == "fchmodat") {
            if (failed(rec)) continue;
            auto paths = quoted_strings(rec.args);
            if (paths.empty()) continue;
            push_bounded(summary.file_operations, FileOperation{"chmod", paths.front(), rec.timestamp});
        } else if (name == "socket") {
            if (failed(rec) || rec.unfinished) continue;
            if (rec.args.find("AF_INET") == std::string::npos) continue;
            std::string fd = rec.result.substr(0, rec.result.find(' '));
            sockets[{rec.pid, fd}] = socket_protocol(rec.args);
        } else if (name == "connect" || name == "sendto" || name == "sendmsg") {
            // Attempts count even when refused or non-blocking
            std::string ip;
            int port = 0;
            if (!parse_inet_address(rec.args, ip, port)) continue;
            std::string fd = rec.args.substr(0, rec.args.find(','));
            auto it = sockets.find({rec.pid, fd});
            std::string protocol = it != sockets.end() ? it->second
                                 : (name == "connect" ? "tcp" : "udp");
            push_bounded(summary.network_connections,
                         NetworkConnection{protocol, ip, port, rec.timestamp});
        } else if (name == "execve" || name == "execveat") {
            if (failed(rec) || rec.unfinished) continue;
            auto strings = quoted_strings(rec.args);
            if (strings.empty()) continue;
            std::string arguments;
            size_t argv_start = rec.args.find('[');
            size_t argv_end = rec.args.find(']', argv_start == std::string::npos ? 0 : argv_start);
            if (argv_start != std::string::npos && argv_end != std::string::npos) {
                auto argv = quoted_strings(rec.args.substr(argv_start, argv_end - argv_start + 1));
                for (size_t i = 1; i < argv.size(); ++i) {
                    if (!arguments.empty()) arguments += ' ';
                    arguments += argv[i];
                }
            }
            push_bounded(summary.process_creations,
                         ProcessCreation{guest_path::basename(strings.front()), arguments, rec.timestamp});
        }
    }
    return summary;
}

} // namespace malsand
