#pragma once

#include <optional>
#include <string>
#include <vector>

namespace malsand {

enum class Language {
    PYTHON,
    NODEJS,
    BASH,
    RUBY,
    PERL,
    PHP,
    C,
    CPP,
    GO,
    JAVA,
    ELF     // Prebuilt Linux executable
};

// What the guest needs to run one kind of artifact
struct LanguageProfile {
    Language language;
    std::string name;               // "python", "c", ...
    std::string file_type;          // Label reported as "File Type", e.g. ".py"
    std::string toolchain;          // Interpreter or compiler name, e.g. "python3"
    bool needs_compilation = false;
    bool detected_by_content = false;
};

// A guest invocation: absolute program path plus arguments
struct ToolInvocation {
    std::string program;
    std::vector<std::string> args;
};

class LanguageDetector {
public:
    // Extension lookup, then content sniffing (shebang, ELF magic, <?php)
    // when the extension is missing or unknown
    static std::optional<LanguageProfile> detect(const std::string& filename,
                                                 const std::string& content_head);

    // Profile for a caller-declared language name ("python", "c", ...)
    static std::optional<LanguageProfile> for_name(const std::string& name);

    static std::vector<std::string> supported_extensions();

    // Guest commands; paths are POSIX guest paths
    static std::optional<ToolInvocation> prepare_command(const LanguageProfile& profile,
                                                         const std::string& artifact);
    static std::optional<ToolInvocation> compile_command(const LanguageProfile& profile,
                                                         const std::string& source,
                                                         const std::string& output);
    static ToolInvocation run_command(const LanguageProfile& profile,
                                      const std::string& artifact,
                                      const std::string& compiled_output);

    static std::string language_to_string(Language language);

private:
    static std::optional<LanguageProfile> sniff(const std::string& content_head);
    static LanguageProfile make_profile(Language language, const std::string& file_type);
};

} // namespace malsand
