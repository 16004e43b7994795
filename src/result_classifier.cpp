#include "result_classifier.h"
#include "constants.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace malsand {

namespace {

const char* const STDOUT_MARKER = "--- stdout ---";
const char* const STDERR_MARKER = "--- stderr ---";

const char* const FAILURE_INDICATORS[] = {
    "fail", "error", "exception", "timed out", "killed",
    "segmentation fault", "permission denied", "core dumped",
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool take_field(const std::string& line, const std::string& label, std::string& out, bool& seen) {
    if (seen || line.compare(0, label.size(), label) != 0) return false;
    std::string value = trim(line.substr(label.size()));
    if (!value.empty()) out = value;
    seen = true;
    return true;
}

std::string excerpt(const std::string& text) {
    if (text.size() <= MAX_REPORTED_OUTPUT) return text;
    return text.substr(0, MAX_REPORTED_OUTPUT) + "\n[... truncated]";
}

} // namespace

std::string ResultClassifier::label_to_string(VerdictLabel label) {
    return label == VerdictLabel::SUSPICIOUS ? "Suspicious" : "Safe";
}

std::string ResultClassifier::trace_outcome_to_string(TraceOutcome outcome) {
    switch (outcome) {
        case TraceOutcome::SUCCESS: return "success";
        case TraceOutcome::FAILURE: return "failure";
        case TraceOutcome::SKIPPED: return "skipped";
    }
    return "unknown";
}

std::string ResultClassifier::render(const ExecutionResult& result) {
    std::ostringstream out;
    out << "File Analysis Results:\n";
    out << "File Type: " << result.file_type << "\n";
    out << "Interpreter: " << result.interpreter << "\n";
    out << "Needs Compilation: " << (result.compilation_required ? "True" : "False") << "\n";
    out << "Execution Result: " << result.execution.message << "\n";
    out << "Exit Code: " << result.execution.exit_code << "\n";
    if (result.trace != TraceOutcome::SKIPPED || !result.trace_message.empty()) {
        out << "Trace Result: " << result.trace_message << "\n";
    }
    if (!result.stdout_output.empty()) {
        out << STDOUT_MARKER << "\n" << excerpt(result.stdout_output);
        if (result.stdout_output.back() != '\n') out << "\n";
    }
    if (!result.stderr_output.empty()) {
        out << STDERR_MARKER << "\n" << excerpt(result.stderr_output);
        if (result.stderr_output.back() != '\n') out << "\n";
    }
    return out.str();
}

ClassifiedResult ResultClassifier::classify(const ExecutionResult& result) {
    return classify(result.raw_text.empty() ? render(result) : result.raw_text);
}

ClassifiedResult ResultClassifier::classify(const std::string& text) {
    ClassifiedResult fields;
    bool file_type = false, interpreter = false, compilation = false;
    bool execution = false, exit_code = false, trace = false;

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Guest output below this point must not be read as fields
        if (line == STDOUT_MARKER || line == STDERR_MARKER) break;

        if (take_field(line, "File Type:", fields.file_type, file_type)) continue;
        if (take_field(line, "Interpreter:", fields.interpreter, interpreter)) continue;
        if (take_field(line, "Needs Compilation:", fields.needs_compilation, compilation)) continue;
        if (take_field(line, "Execution Result:", fields.execution_result, execution)) continue;
        if (take_field(line, "Exit Code:", fields.exit_code, exit_code)) continue;
        take_field(line, "Trace Result:", fields.trace_result, trace);
    }

    Verdict& verdict = fields.verdict;
    std::string execution_lower = to_lower(fields.execution_result);
    std::string indicator;
    for (const char* candidate : FAILURE_INDICATORS) {
        if (execution_lower.find(candidate) != std::string::npos) {
            indicator = candidate;
            break;
        }
    }

    bool nonzero_exit = false;
    if (exit_code) {
        try {
            nonzero_exit = std::stoi(fields.exit_code) != 0;
        } catch (const std::exception&) {
            nonzero_exit = false;
        }
    }

    if (!execution) {
        verdict.label = VerdictLabel::SUSPICIOUS;
        verdict.basis = "No execution result recorded";
        verdict.confidence = 0.3;
    } else if (!indicator.empty() && nonzero_exit) {
        verdict.label = VerdictLabel::SUSPICIOUS;
        verdict.basis = "Execution reported '" + indicator + "' and exit code " + fields.exit_code;
        verdict.confidence = 0.8;
    } else if (!indicator.empty()) {
        verdict.label = VerdictLabel::SUSPICIOUS;
        verdict.basis = "Execution reported '" + indicator + "'";
        verdict.confidence = 0.65;
    } else if (nonzero_exit) {
        verdict.label = VerdictLabel::SUSPICIOUS;
        verdict.basis = "Process exited with code " + fields.exit_code;
        verdict.confidence = 0.6;
    } else {
        verdict.label = VerdictLabel::SAFE;
        verdict.basis = "File ran to completion without failure indicators";
        verdict.confidence = trace ? 0.7 : 0.5;
    }
    return fields;
}

} // namespace malsand
