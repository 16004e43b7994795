#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace malsand {

// Host-side file produced by a job (trace log, guest output files)
struct ArtifactInfo {
    std::string filename;
    size_t size_bytes = 0;
    std::string sha256_hash;
};

class FileUtils {
public:
    // Hash utilities (sample identity, artifact listings)
    static std::string sha256_file(const std::string& filepath);
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Format file size as human-readable string
    static std::string format_file_size(size_t bytes);

    // Get MIME type for file
    static std::string get_mime_type(const std::string& filename);

    // Whole-file IO; read_file throws std::runtime_error if unreadable
    static std::vector<uint8_t> read_file(const std::string& filepath);
    static std::string read_text_file(const std::string& filepath);
    static void write_file(const std::string& filepath, const std::string& data);

    // First bytes of a file, for content sniffing
    static std::string read_head(const std::string& filepath, size_t max_bytes);

    // Regular files directly in dirpath, sorted by name
    static std::vector<ArtifactInfo> list_artifacts(const std::string& dirpath);

    // True if candidate resolves to a location inside root
    static bool is_within(const std::string& root, const std::string& candidate);
};

} // namespace malsand
