#include "file_utils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

namespace malsand {

namespace fs = std::filesystem;

namespace {

const std::map<std::string, std::string> kMimeTypes = {
    {".txt", "text/plain"},
    {".log", "text/plain"},
    {".json", "application/json"},
    {".csv", "text/csv"},
    {".py", "text/x-python"},
    {".js", "application/javascript"},
    {".sh", "application/x-sh"},
    {".c", "text/x-c"},
    {".cpp", "text/x-c++"},
    {".java", "text/x-java"},
    {".go", "text/x-go"},
    {".html", "text/html"},
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".tar", "application/x-tar"},
    {".pdf", "application/pdf"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
};

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestCtx new_sha256_ctx() {
    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 digest");
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1) {
        throw std::runtime_error("Failed to finalise SHA-256 digest");
    }
    return FileUtils::bytes_to_hex(hash, len);
}

} // namespace

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    auto ctx = new_sha256_ctx();
    EVP_DigestUpdate(ctx.get(), data.data(), data.size());
    return finish_hex(ctx.get());
}

std::string FileUtils::sha256_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return "";  // Unreadable files hash to empty
    }

    auto ctx = new_sha256_ctx();
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount()));
    }
    return finish_hex(ctx.get());
}

std::string FileUtils::format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

std::string FileUtils::get_mime_type(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = kMimeTypes.find(ext);
    if (it != kMimeTypes.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::vector<uint8_t> FileUtils::read_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
}

std::string FileUtils::read_text_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

void FileUtils::write_file(const std::string& filepath, const std::string& data) {
    fs::path parent = fs::path(filepath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
    std::ofstream out(filepath, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write file: " + filepath);
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Short write to file: " + filepath);
    }
}

std::string FileUtils::read_head(const std::string& filepath, size_t max_bytes) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }
    std::string head(max_bytes, '\0');
    file.read(&head[0], static_cast<std::streamsize>(max_bytes));
    head.resize(static_cast<size_t>(file.gcount()));
    return head;
}

std::vector<ArtifactInfo> FileUtils::list_artifacts(const std::string& dirpath) {
    std::vector<ArtifactInfo> artifacts;
    std::error_code ec;
    if (!fs::is_directory(dirpath, ec)) {
        return artifacts;
    }

    for (const auto& entry : fs::directory_iterator(dirpath, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        ArtifactInfo info;
        info.filename = entry.path().filename().string();
        info.size_bytes = static_cast<size_t>(entry.file_size());
        info.sha256_hash = sha256_file(entry.path().string());
        artifacts.push_back(info);
    }

    std::sort(artifacts.begin(), artifacts.end(),
              [](const ArtifactInfo& a, const ArtifactInfo& b) { return a.filename < b.filename; });
    return artifacts;
}

bool FileUtils::is_within(const std::string& root, const std::string& candidate) {
    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(root, ec);
    if (ec) return false;
    if (canonical_root.has_parent_path() && canonical_root.filename().empty()) {
        canonical_root = canonical_root.parent_path();
    }
    fs::path canonical_candidate = fs::weakly_canonical(candidate, ec);
    if (ec) return false;

    auto root_it = canonical_root.begin();
    auto cand_it = canonical_candidate.begin();
    for (; root_it != canonical_root.end(); ++root_it, ++cand_it) {
        if (cand_it == canonical_candidate.end() || *root_it != *cand_it) {
            return false;
        }
    }
    return true;
}

} // namespace malsand
