#pragma once

#include <string>

namespace malsand {

enum class TraceOutcome {
    SUCCESS,
    FAILURE,
    SKIPPED
};

struct ExecutionOutcome {
    bool success = false;
    std::string message;
    int exit_code = 0;          // Negative: killed by signal
    bool timed_out = false;
};

// Everything the pipeline learned about one run
struct ExecutionResult {
    std::string file_type;
    std::string interpreter;
    bool compilation_required = false;
    ExecutionOutcome execution;
    TraceOutcome trace = TraceOutcome::SKIPPED;
    std::string trace_message;
    std::string stdout_output;
    std::string stderr_output;
    std::string raw_text;       // render() of the above
};

enum class VerdictLabel {
    SAFE,
    SUSPICIOUS
};

struct Verdict {
    VerdictLabel label = VerdictLabel::SAFE;
    std::string basis;
    double confidence = 0.0;
};

// Labeled fields recovered from the accumulated text
struct ClassifiedResult {
    std::string file_type = "Unknown";
    std::string interpreter = "Unknown";
    std::string needs_compilation = "Unknown";
    std::string execution_result = "Unknown";
    std::string exit_code = "Unknown";
    std::string trace_result = "Not performed";
    Verdict verdict;
};

// Best-effort marker parsing of pipeline output.
//
// The verdict is a coarse placeholder signal derived from the execution
// line and exit code. It is not a security boundary and says nothing
// about whether a sample is actually malicious.
class ResultClassifier {
public:
    static std::string render(const ExecutionResult& result);

    // Never throws; missing fields keep their defaults
    static ClassifiedResult classify(const std::string& text);
    static ClassifiedResult classify(const ExecutionResult& result);

    static std::string label_to_string(VerdictLabel label);
    static std::string trace_outcome_to_string(TraceOutcome outcome);
};

} // namespace malsand
