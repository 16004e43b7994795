#include "language_detector.h"
#include "guest_path.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace malsand {

namespace {

struct Capability {
    std::string name;
    std::string toolchain;
    std::string program;        // Absolute guest path of interpreter/compiler
    bool needs_compilation;
};

const std::map<Language, Capability> kCapabilities = {
    {Language::PYTHON, {"python", "python3", "/usr/bin/python3", false}},
    {Language::NODEJS, {"javascript", "node", "/usr/bin/node", false}},
    {Language::BASH,   {"bash", "bash", "/bin/bash", false}},
    {Language::RUBY,   {"ruby", "ruby", "/usr/bin/ruby", false}},
    {Language::PERL,   {"perl", "perl", "/usr/bin/perl", false}},
    {Language::PHP,    {"php", "php", "/usr/bin/php", false}},
    {Language::C,      {"c", "gcc", "/usr/bin/gcc", true}},
    {Language::CPP,    {"cpp", "g++", "/usr/bin/g++", true}},
    {Language::GO,     {"go", "go", "/usr/bin/go", true}},
    {Language::JAVA,   {"java", "javac", "/usr/bin/javac", true}},
    {Language::ELF,    {"elf", "native", "", false}},
};

const std::map<std::string, Language> kExtensions = {
    {".py", Language::PYTHON},
    {".js", Language::NODEJS},
    {".mjs", Language::NODEJS},
    {".sh", Language::BASH},
    {".bash", Language::BASH},
    {".rb", Language::RUBY},
    {".pl", Language::PERL},
    {".php", Language::PHP},
    {".c", Language::C},
    {".cpp", Language::CPP},
    {".cc", Language::CPP},
    {".cxx", Language::CPP},
    {".go", Language::GO},
    {".java", Language::JAVA},
    {".elf", Language::ELF},
    {".bin", Language::ELF},
};

std::string lowercase_extension(const std::string& filename) {
    std::string name = guest_path::basename(filename);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return "";
    std::string ext = name.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

LanguageProfile LanguageDetector::make_profile(Language language, const std::string& file_type) {
    const Capability& cap = kCapabilities.at(language);
    LanguageProfile profile;
    profile.language = language;
    profile.name = cap.name;
    profile.file_type = file_type;
    profile.toolchain = cap.toolchain;
    profile.needs_compilation = cap.needs_compilation;
    return profile;
}

std::optional<LanguageProfile> LanguageDetector::detect(const std::string& filename,
                                                        const std::string& content_head) {
    std::string ext = lowercase_extension(filename);
    auto it = kExtensions.find(ext);
    if (it != kExtensions.end()) {
        return make_profile(it->second, ext);
    }

    auto sniffed = sniff(content_head);
    if (sniffed) {
        if (!ext.empty()) sniffed->file_type = ext;
        return sniffed;
    }
    return std::nullopt;
}

std::optional<LanguageProfile> LanguageDetector::sniff(const std::string& content_head) {
    if (content_head.size() >= 4 && content_head.compare(0, 4, "\x7f" "ELF") == 0) {
        auto profile = make_profile(Language::ELF, "elf");
        profile.detected_by_content = true;
        return profile;
    }

    std::string first_line = content_head.substr(0, content_head.find('\n'));
    if (!first_line.empty() && first_line.back() == '\r') first_line.pop_back();

    if (first_line.compare(0, 5, "<?php") == 0) {
        auto profile = make_profile(Language::PHP, "php");
        profile.detected_by_content = true;
        return profile;
    }

    if (first_line.compare(0, 2, "#!") != 0) {
        return std::nullopt;
    }

    // "#!/usr/bin/env python3" and "#!/usr/bin/python3 -u" both name the
    // interpreter in the last path component of the first or second word
    static const std::vector<std::pair<std::string, Language>> interpreters = {
        {"python", Language::PYTHON},
        {"node", Language::NODEJS},
        {"bash", Language::BASH},
        {"sh", Language::BASH},
        {"ruby", Language::RUBY},
        {"perl", Language::PERL},
        {"php", Language::PHP},
    };

    std::string command = first_line.substr(2);
    std::vector<std::string> words;
    size_t pos = 0;
    while (pos < command.size()) {
        size_t start = command.find_first_not_of(" \t", pos);
        if (start == std::string::npos) break;
        size_t end = command.find_first_of(" \t", start);
        words.push_back(command.substr(start, end == std::string::npos ? std::string::npos : end - start));
        pos = (end == std::string::npos) ? command.size() : end;
    }
    if (words.empty()) return std::nullopt;

    std::string program = guest_path::basename(words[0]);
    if (program == "env" && words.size() > 1) {
        program = words[1] == "-S" && words.size() > 2 ? words[2] : words[1];
        program = guest_path::basename(program);
    }

    for (const auto& [prefix, language] : interpreters) {
        if (program.compare(0, prefix.size(), prefix) == 0) {
            // "sh" must not swallow e.g. "shellcheck"
            if (prefix == "sh" && program != "sh") continue;
            auto profile = make_profile(language, "script");
            profile.detected_by_content = true;
            return profile;
        }
    }
    return std::nullopt;
}

std::optional<LanguageProfile> LanguageDetector::for_name(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [language, cap] : kCapabilities) {
        if (cap.name == lowered || cap.toolchain == lowered) {
            return make_profile(language, "declared:" + cap.name);
        }
    }
    return std::nullopt;
}

std::vector<std::string> LanguageDetector::supported_extensions() {
    std::vector<std::string> exts;
    for (const auto& entry : kExtensions) {
        exts.push_back(entry.first);
    }
    return exts;
}

std::optional<ToolInvocation> LanguageDetector::prepare_command(const LanguageProfile& profile,
                                                                const std::string& artifact) {
    if (profile.language == Language::ELF) {
        return ToolInvocation{"/bin/chmod", {"755", artifact}};
    }
    return std::nullopt;
}

std::optional<ToolInvocation> LanguageDetector::compile_command(const LanguageProfile& profile,
                                                                const std::string& source,
                                                                const std::string& output) {
    if (!profile.needs_compilation) {
        return std::nullopt;
    }
    const std::string& compiler = kCapabilities.at(profile.language).program;
    switch (profile.language) {
        case Language::C:
        case Language::CPP:
            return ToolInvocation{compiler, {source, "-o", output}};
        case Language::GO:
            return ToolInvocation{compiler, {"build", "-o", output, source}};
        case Language::JAVA:
            // Class files land in the output directory
            return ToolInvocation{compiler, {"-d", output, source}};
        default:
            return std::nullopt;
    }
}

ToolInvocation LanguageDetector::run_command(const LanguageProfile& profile,
                                             const std::string& artifact,
                                             const std::string& compiled_output) {
    switch (profile.language) {
        case Language::C:
        case Language::CPP:
        case Language::GO:
            return ToolInvocation{compiled_output, {}};
        case Language::JAVA:
            return ToolInvocation{"/usr/bin/java", {"-cp", compiled_output, guest_path::stem(artifact)}};
        case Language::ELF:
            return ToolInvocation{artifact, {}};
        default:
            return ToolInvocation{kCapabilities.at(profile.language).program, {artifact}};
    }
}

std::string LanguageDetector::language_to_string(Language language) {
    return kCapabilities.at(language).name;
}

} // namespace malsand
