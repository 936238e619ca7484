#include "apisim/replay/RecordingStore.h"
#include "apisim/common/Logger.h"
#include "apisim/protocol/Compression.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace apisim {
namespace replay {

using apisim::protocol::Compression;

RecordingStore::RecordingStore(std::string dir, bool compress)
    : dir_(std::move(dir)), compress_(compress) {}

std::string RecordingStore::FileNameForPath(const std::string& path, bool compress) {
    std::string name;
    for (char c : path) {
        const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '.';
        name.push_back(keep ? c : '_');
    }
    while (!name.empty() && name.front() == '_') name.erase(0, 1);
    if (name.empty()) name = "root";
    // Flattening can merge distinct paths; the digest prefix keeps them apart.
    name += "-" + Recording::Digest("", path, "").substr(0, 8);
    name += compress ? ".rec.gz" : ".rec";
    return name;
}

std::string RecordingStore::FilePath(const std::string& path, bool compress) const {
    return dir_ + "/" + FileNameForPath(path, compress);
}

bool RecordingStore::EnsureDir() const {
    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = dir_.find('/', pos + 1);
        partial = dir_.substr(0, pos);
        if (partial.empty()) continue;
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            LOG_ERROR << "mkdir " << partial << " failed: " << std::strerror(errno);
            return false;
        }
    }
    return true;
}

std::vector<Recording>& RecordingStore::LoadLocked(const std::string& path) {
    auto it = byPath_.find(path);
    if (it != byPath_.end()) return it->second;

    std::vector<Recording>& list = byPath_[path];
    // Files written under the other compression setting still load; the
    // content decides whether to inflate.
    std::string file = FilePath(path, compress_);
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        file = FilePath(path, !compress_);
        in.clear();
        in.open(file, std::ios::binary);
    }
    if (!in) {
        LOG_DEBUG << "No recording file for " << path << " (" << FilePath(path, compress_) << ")";
        return list;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string data = ss.str();

    if (Compression::LooksGzipped(data)) {
        std::string plain;
        if (!Compression::Decompress(Compression::Encoding::kGzip, data, &plain)) {
            LOG_ERROR << "Corrupt compressed recording file " << file;
            return list;
        }
        data.swap(plain);
    }
    if (!Recording::Parse(data, &list)) {
        LOG_ERROR << "Malformed recording file " << file << ", kept " << list.size() << " records";
    }
    LOG_INFO << "Loaded " << list.size() << " recordings for " << path;
    return list;
}

std::optional<Recording> RecordingStore::Find(const std::string& path, const std::string& digest) {
    for (const auto& r : LoadLocked(path)) {
        if (r.requestDigest == digest) return r;
    }
    return std::nullopt;
}

void RecordingStore::Add(const std::string& path, Recording recording) {
    std::vector<Recording>& list = LoadLocked(path);
    dirty_.insert(path);
    for (auto& r : list) {
        if (r.requestDigest == recording.requestDigest) {
            r = std::move(recording);
            return;
        }
    }
    list.push_back(std::move(recording));
}

size_t RecordingStore::countFor(const std::string& path) {
    return LoadLocked(path).size();
}

bool RecordingStore::SavePath(const std::string& path) {
    auto it = byPath_.find(path);
    if (it == byPath_.end()) {
        dirty_.erase(path);
        return true;
    }
    if (!EnsureDir()) return false;

    std::string data = Recording::Serialize(it->second);
    if (compress_) {
        std::string packed;
        if (!Compression::Compress(Compression::Encoding::kGzip, data, &packed)) {
            LOG_ERROR << "Compressing recordings for " << path << " failed";
            return false;
        }
        data.swap(packed);
    }

    const std::string file = FilePath(path, compress_);
    const std::string tmp = file + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_ERROR << "Cannot open " << tmp << " for writing";
            return false;
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!out) {
            LOG_ERROR << "Write to " << tmp << " failed";
            return false;
        }
    }
    if (std::rename(tmp.c_str(), file.c_str()) != 0) {
        LOG_ERROR << "rename " << tmp << " -> " << file << " failed: " << std::strerror(errno);
        return false;
    }
    const std::string stale = FilePath(path, !compress_);
    if (std::remove(stale.c_str()) != 0 && errno != ENOENT) {
        LOG_WARN << "Cannot remove stale " << stale << ": " << std::strerror(errno);
    }
    dirty_.erase(path);
    LOG_DEBUG << "Saved " << it->second.size() << " recordings to " << file;
    return true;
}

bool RecordingStore::Save(size_t* written) {
    size_t count = 0;
    bool ok = true;
    const std::set<std::string> pending = dirty_;
    for (const auto& path : pending) {
        if (SavePath(path)) {
            count++;
        } else {
            ok = false;
        }
    }
    if (written) *written = count;
    return ok;
}

} // namespace replay
} // namespace apisim
