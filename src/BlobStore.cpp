#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <syslog.h>

#include "BlobStore.h"
#include "utils.h"

namespace fs = std::filesystem;

FileBlobStore::FileBlobStore(std::string root, std::string baseUrl)
    : root_(std::move(root)), baseUrl_(std::move(baseUrl)) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

// keys are relative and may not climb out of the root
std::string FileBlobStore::pathFor(const std::string& key) const {
    if (key.empty() || key[0] == '/') return {};
    const fs::path rel = fs::path(key).lexically_normal();
    for (const auto& part : rel) {
        if (part == "..") return {};
    }
    return (fs::path(root_) / rel).string();
}

bool FileBlobStore::get(const std::string& key, std::string& bytesOut) {
    const std::string path = pathFor(key);
    if (path.empty()) return false;

    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    bytesOut = ss.str();
    return true;
}

void FileBlobStore::put(const std::string& key, const std::string& bytes, const std::string& contentType) {
    const std::string path = pathFor(key);
    if (path.empty())
        throw std::runtime_error("blob key rejected: " + key);

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec)
        throw std::runtime_error("blob mkdir failed: " + ec.message());

    // write beside the target, then move it into place
    const std::string tmp = path + ".part";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            throw std::runtime_error("blob open failed: " + tmp);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out)
            throw std::runtime_error("blob write failed: " + tmp);
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("blob rename failed: " + path);
    }
    syslog(SYSLOG_DEBUG, "blob stored [%s] %zu bytes (%s)", key.c_str(), bytes.size(), contentType.c_str());
}

std::string FileBlobStore::urlFor(const std::string& key) const {
    return baseUrl_ + "/" + encodeUrlPath(key);
}
