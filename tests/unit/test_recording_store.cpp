#include "apisim/common/Logger.h"
#include "apisim/protocol/Compression.h"
#include "apisim/replay/Recording.h"
#include "apisim/replay/RecordingStore.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using apisim::common::Logger;
using apisim::protocol::Compression;
using apisim::replay::Recording;
using apisim::replay::RecordingStore;

static std::string makeTempDir() {
    char tmpl[] = "/tmp/apisim_store_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    assert(dir != nullptr);
    return dir;
}

static std::string readFile(const std::string& file) {
    std::ifstream in(file, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool fileExists(const std::string& file) {
    struct stat st;
    return ::stat(file.c_str(), &st) == 0;
}

static Recording makeRecording(const std::string& path, const std::string& body) {
    Recording r;
    r.method = "POST";
    r.target = path + "?api-version=2024-02-01";
    r.requestDigest = Recording::Digest(r.method, r.target, body);
    r.status = 200;
    r.headers["Content-Type"] = "application/json";
    r.body = "{\"reply\":\"line one\nline two\"}";
    r.durationMs = 123.5;
    r.limiterKey = std::string("openai");
    r.deploymentName = std::string("gpt-4");
    r.tokenCount = 42L;
    return r;
}

static void testDigest() {
    const std::string a = Recording::Digest("POST", "/x", "{}");
    assert(a.size() == 64);
    assert(a == Recording::Digest("POST", "/x", "{}"));
    assert(a != Recording::Digest("POST", "/x", "{ }"));
    assert(a != Recording::Digest("GET", "/x", "{}"));
    assert(a != Recording::Digest("POST", "/x?v=1", "{}"));
    // Field separators keep shifted boundaries apart.
    assert(Recording::Digest("PO", "ST/x", "") != Recording::Digest("POST", "/x", ""));
}

static void testSerializeKeepsEveryField() {
    std::vector<Recording> in{makeRecording("/a", "1"), makeRecording("/a", "2")};
    in[1].limiterKey.reset();
    in[1].tokenCount.reset();
    in[1].body = "";

    std::vector<Recording> out;
    assert(Recording::Parse(Recording::Serialize(in), &out));
    assert(out.size() == 2);
    assert(out[0].body == in[0].body);
    assert(out[0].headers == in[0].headers);
    assert(out[0].durationMs == 123.5);
    assert(out[0].limiterKey && *out[0].limiterKey == "openai");
    assert(out[0].tokenCount && *out[0].tokenCount == 42);
    assert(out[1].requestDigest == in[1].requestDigest);
    assert(!out[1].limiterKey);
    assert(!out[1].tokenCount);
    assert(out[1].body.empty());
}

static void testParseRejectsDamage() {
    const std::string good = Recording::Serialize({makeRecording("/a", "1"), makeRecording("/a", "2")});
    std::vector<Recording> out;
    assert(!Recording::Parse(good.substr(0, good.size() - 3), &out));
    assert(out.size() == 1);

    out.clear();
    assert(!Recording::Parse("begin 0\n\nstatus 3\nabc\nend 0\n\n", &out));
    out.clear();
    assert(!Recording::Parse("begin 0\n\nend 0\n\n", &out));
    out.clear();
    assert(!Recording::Parse("nonsense", &out));
    out.clear();
    assert(Recording::Parse("", &out));
    assert(out.empty());
}

static void testFindAndReplace() {
    RecordingStore store(makeTempDir(), false);
    Recording r = makeRecording("/a", "1");
    assert(!store.Find("/a", r.requestDigest));

    store.Add("/a", r);
    auto found = store.Find("/a", r.requestDigest);
    assert(found && found->status == 200);
    assert(!store.Find("/b", r.requestDigest));

    r.status = 429;
    store.Add("/a", r);
    assert(store.countFor("/a") == 1);
    assert(store.Find("/a", r.requestDigest)->status == 429);
    assert(store.dirtyCount() == 1);
}

static void testSaveIsIdempotentAndReloads() {
    const std::string dir = makeTempDir() + "/nested/recordings";
    const std::string path = "/openai/deployments/gpt-4/embeddings";
    {
        RecordingStore store(dir, false);
        store.Add(path, makeRecording(path, "1"));
        store.Add(path, makeRecording(path, "2"));

        size_t written = 0;
        assert(store.Save(&written));
        assert(written == 1);
        assert(store.dirtyCount() == 0);

        const std::string file = dir + "/" + RecordingStore::FileNameForPath(path, false);
        assert(fileExists(file));
        assert(!fileExists(file + ".tmp"));
        const std::string first = readFile(file);

        // Nothing changed: nothing written, file untouched.
        assert(store.Save(&written));
        assert(written == 0);
        assert(readFile(file) == first);
    }

    RecordingStore reloaded(dir, false);
    assert(reloaded.countFor(path) == 2);
    auto r = reloaded.Find(path, makeRecording(path, "2").requestDigest);
    assert(r && r->deploymentName && *r->deploymentName == "gpt-4");
    assert(reloaded.dirtyCount() == 0);
}

static void testCompressedFiles() {
    const std::string dir = makeTempDir();
    const std::string path = "/formrecognizer/documentModels/prebuilt-read:analyze";
    {
        RecordingStore store(dir, true);
        store.Add(path, makeRecording(path, "doc"));
        assert(store.SavePath(path));
    }
    const std::string file = dir + "/" + RecordingStore::FileNameForPath(path, true);
    assert(Compression::LooksGzipped(readFile(file)));

    RecordingStore reloaded(dir, true);
    assert(reloaded.Find(path, makeRecording(path, "doc").requestDigest));
}

static void testCompressionSettingCanChange() {
    const std::string dir = makeTempDir();
    const std::string path = "/openai/deployments/gpt-4/chat/completions";
    const std::string plain = dir + "/" + RecordingStore::FileNameForPath(path, false);
    const std::string packed = dir + "/" + RecordingStore::FileNameForPath(path, true);
    {
        RecordingStore store(dir, true);
        store.Add(path, makeRecording(path, "first"));
        assert(store.SavePath(path));
    }
    assert(fileExists(packed) && !fileExists(plain));

    // Written compressed, read back with compression off.
    {
        RecordingStore store(dir, false);
        assert(store.countFor(path) == 1);
        assert(store.Find(path, makeRecording(path, "first").requestDigest));
        store.Add(path, makeRecording(path, "second"));
        assert(store.SavePath(path));
    }
    assert(fileExists(plain) && !fileExists(packed));
    assert(!Compression::LooksGzipped(readFile(plain)));

    // And the other way round: nothing recorded earlier is lost.
    RecordingStore store(dir, true);
    assert(store.countFor(path) == 2);
    assert(store.Find(path, makeRecording(path, "first").requestDigest));
    assert(store.Find(path, makeRecording(path, "second").requestDigest));
}

static void testFileNames() {
    const std::string a = RecordingStore::FileNameForPath("/openai/deployments/gpt-4/embeddings", false);
    assert(a.rfind("openai_deployments_gpt-4_embeddings-", 0) == 0);
    assert(a.size() > 4 && a.substr(a.size() - 4) == ".rec");
    assert(RecordingStore::FileNameForPath("/a/b", true).find(".rec.gz") != std::string::npos);
    // Paths that flatten to the same text still get distinct files.
    assert(RecordingStore::FileNameForPath("/a/b", false) != RecordingStore::FileNameForPath("/a_b", false));
    assert(RecordingStore::FileNameForPath("/", false).rfind("root-", 0) == 0);
}

int main() {
    Logger::Instance().SetLevel(apisim::common::LogLevel::FATAL);
    testDigest();
    testSerializeKeepsEveryField();
    testParseRejectsDamage();
    testFindAndReplace();
    testSaveIsIdempotentAndReloads();
    testCompressedFiles();
    testCompressionSettingCanChange();
    testFileNames();
    return 0;
}
