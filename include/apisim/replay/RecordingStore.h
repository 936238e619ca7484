#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/replay/Recording.h"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace apisim {
namespace replay {

// Recordings grouped by URL path, one file per path under `dir`. A path's
// file is read the first time the path is touched, under either
// extension. Saving removes the file with the unused extension. Not synchronised: the
// owner serialises every call.
class RecordingStore : apisim::common::noncopyable {
public:
    RecordingStore(std::string dir, bool compress);

    std::optional<Recording> Find(const std::string& path, const std::string& digest);

    // Replaces an existing recording with the same digest. Marks the path dirty.
    void Add(const std::string& path, Recording recording);

    // Writes every dirty path. *written counts the files written.
    bool Save(size_t* written = nullptr);
    bool SavePath(const std::string& path);

    size_t dirtyCount() const { return dirty_.size(); }
    size_t countFor(const std::string& path);

    const std::string& dir() const { return dir_; }

    // Flattens the path into a file name, e.g.
    // /openai/deployments/gpt-4/embeddings -> openai_deployments_gpt-4_embeddings-<hash>.rec
    static std::string FileNameForPath(const std::string& path, bool compress);

private:
    std::vector<Recording>& LoadLocked(const std::string& path);
    std::string FilePath(const std::string& path, bool compress) const;
    bool EnsureDir() const;

    const std::string dir_;
    const bool compress_;

    std::map<std::string, std::vector<Recording>> byPath_;
    std::set<std::string> dirty_;
};

} // namespace replay
} // namespace apisim
