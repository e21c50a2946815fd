#include <catch2/catch_test_macros.hpp>
#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "StructureFile.hpp"
#include "TestHelpers.hpp"
#include "WorkspaceStore.hpp"

#include <nlohmann/json.hpp>

using flatsync::FileRecord;
using flatsync::LoadTier;
using flatsync::PreconditionError;
using flatsync::Project;
using flatsync::WorkspaceStore;

namespace {

FileRecord make_record(const std::string& full, const std::string& rel, const std::string& flat) {
    FileRecord record;
    record.originalPath = rel;
    record.fullOriginalPath = full;
    record.newPath = flat;
    record.originalDirectory = full.substr(0, full.find_last_of('/'));
    record.size = 7;
    record.mtime = "2024-01-02T03:04:05.000Z";
    return record;
}

// Drops the one line that is expected to differ between two saves.
std::string without_timestamp(const std::string& text) {
    std::string out;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        auto line = text.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
        if (line.rfind("# Last Updated:", 0) != 0) {
            out += line;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return out;
}

} // namespace

TEST_CASE("create provisions the workspace and persists both tiers") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());

    Project project = store.create("demo");
    CHECK(project.name() == "demo");
    CHECK(store.exists("demo"));
    CHECK(std::filesystem::is_regular_file(store.structurePath("demo")));
    CHECK(std::filesystem::is_regular_file(store.cachePath("demo")));
    CHECK_FALSE(std::filesystem::exists(store.analysisPath("demo")));
}

TEST_CASE("create rejects invalid and duplicate names") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());

    CHECK_THROWS_AS(store.create(""), PreconditionError);
    CHECK_THROWS_AS(store.create("has space"), PreconditionError);
    CHECK_THROWS_AS(store.create("../escape"), PreconditionError);

    store.create("dup");
    CHECK_THROWS_AS(store.create("dup"), PreconditionError);
    CHECK_NOTHROW(store.create("dup", true));
}

TEST_CASE("listAll returns sorted project names") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    CHECK(store.listAll().empty());

    store.create("zeta");
    store.create("alpha");
    store.create("mid-1");
    CHECK(store.listAll() == std::vector<std::string>{"alpha", "mid-1", "zeta"});
}

TEST_CASE("loading an unknown project yields an empty project") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());

    LoadTier tier = LoadTier::Cache;
    Project project = store.load("nothing", &tier);
    CHECK(tier == LoadTier::Empty);
    CHECK(project.name() == "nothing");
    CHECK(project.files().empty());
}

TEST_CASE("save then load comes back from the cache tier") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    project.addSourceDirectory("/src");
    project.addFiles({make_record("/src/a.js", "a.js", "a.js"),
                      make_record("/src/sub/b.js", "sub/b.js", "sub_b.js")});
    project.setInstructions("Be concise.");
    REQUIRE(store.save(project));

    LoadTier tier = LoadTier::Empty;
    Project loaded = store.load("demo", &tier);
    CHECK(tier == LoadTier::Cache);
    CHECK(loaded.lastUpdated() == project.lastUpdated());
    CHECK(loaded.sourceDirectories() == project.sourceDirectories());
    REQUIRE(loaded.files().size() == 2);
    const FileRecord* b = loaded.findFile("/src/sub/b.js");
    REQUIRE(b != nullptr);
    CHECK(b->newPath == "sub_b.js");
    CHECK(b->size == 7);
    CHECK(b->mtime == std::optional<std::string>("2024-01-02T03:04:05.000Z"));
    CHECK(loaded.instructions() == "Be concise.");
    CHECK(loaded.directoryStructure().find("sub_b.js") != std::string::npos);
}

TEST_CASE("missing cache falls back to structure.txt and rebuilds the cache") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    project.addSourceDirectory("/src");
    project.addFiles({make_record("/src/a.js", "a.js", "a.js")});
    REQUIRE(store.save(project));

    std::filesystem::remove(store.cachePath("demo"));

    LoadTier tier = LoadTier::Empty;
    Project loaded = store.load("demo", &tier);
    CHECK(tier == LoadTier::Structure);
    CHECK(loaded.lastUpdated() == project.lastUpdated());
    CHECK(loaded.sourceDirectories() == std::vector<std::string>{"/src"});
    REQUIRE(loaded.files().size() == 1);
    CHECK(loaded.files()[0].newPath == "a.js");
    CHECK_FALSE(loaded.files()[0].mtime.has_value());

    CHECK(std::filesystem::is_regular_file(store.cachePath("demo")));
    store.load("demo", &tier);
    CHECK(tier == LoadTier::Cache);
}

TEST_CASE("unreadable cache falls back to the durable tier") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    project.addFiles({make_record("/src/a.js", "a.js", "a.js")});
    REQUIRE(store.save(project));

    write_file(store.cachePath("demo"), "this is not a sqlite database");

    LoadTier tier = LoadTier::Empty;
    Project loaded = store.load("demo", &tier);
    CHECK(tier == LoadTier::Structure);
    CHECK(loaded.files().size() == 1);
}

TEST_CASE("a cache older than structure.txt is ignored") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    REQUIRE(store.save(project));

    // Simulate a save whose cache write was lost: newer durable tier only.
    Project newer("demo");
    newer.setTimestamps(project.createdAt(), "2999-01-01T00:00:00.000Z");
    newer.addFiles({make_record("/src/late.js", "late.js", "late.js")});
    write_file(store.structurePath("demo"), StructureFile::serialize(newer));

    LoadTier tier = LoadTier::Empty;
    Project loaded = store.load("demo", &tier);
    CHECK(tier == LoadTier::Structure);
    CHECK(loaded.findFile("/src/late.js") != nullptr);
}

TEST_CASE("legacy metadata.json is migrated to both tiers") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    std::filesystem::create_directories(store.projectPath("old"));

    nlohmann::json legacy = {
        {"name", "old"},
        {"createdAt", "2020-05-01T10:00:00.000Z"},
        {"lastUpdated", "2020-05-02T10:00:00.000Z"},
        {"sourceDirectories", {"/legacy/src"}},
        {"instructions", "Legacy notes"},
        {"files",
         {{{"originalPath", "lib/util.php"},
           {"fullOriginalPath", "/legacy/src/lib/util.php"},
           {"newPath", "lib_util.php"},
           {"size", 120}},
          {{"originalPath", "index.php"}, {"newPath", "index.php"}},
          {{"originalPath", "broken.php"}}}}};
    write_file(store.legacyPath("old"), legacy.dump(2));

    LoadTier tier = LoadTier::Empty;
    Project loaded = store.load("old", &tier);
    CHECK(tier == LoadTier::Legacy);
    CHECK(loaded.createdAt() == "2020-05-01T10:00:00.000Z");
    CHECK(loaded.sourceDirectories() == std::vector<std::string>{"/legacy/src"});
    REQUIRE(loaded.files().size() == 2);
    const FileRecord* util = loaded.findFile("/legacy/src/lib/util.php");
    REQUIRE(util != nullptr);
    CHECK(util->originalDirectory == "/legacy/src/lib");
    CHECK(util->size == 120);
    CHECK_FALSE(util->mtime.has_value());
    CHECK(loaded.findFile("index.php") != nullptr);
    CHECK(loaded.instructions() == "Legacy notes");

    CHECK(std::filesystem::is_regular_file(store.structurePath("old")));
    CHECK(std::filesystem::is_regular_file(store.cachePath("old")));
    CHECK(read_file(store.analysisPath("old")) == "Legacy notes");

    store.load("old", &tier);
    CHECK(tier == LoadTier::Cache);
}

TEST_CASE("malformed legacy metadata yields an empty project") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    write_file(store.legacyPath("bad"), "{ not json");

    LoadTier tier = LoadTier::Cache;
    Project loaded = store.load("bad", &tier);
    CHECK(tier == LoadTier::Empty);
    CHECK(loaded.files().empty());
}

TEST_CASE("saving twice changes only the timestamp line") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    project.addSourceDirectory("/src");
    project.addFiles({make_record("/src/b.js", "b.js", "b.js"),
                      make_record("/src/a/c.js", "a/c.js", "a_c.js")});
    REQUIRE(store.save(project));
    const std::string first = read_file(store.structurePath("demo"));

    REQUIRE(store.save(project));
    const std::string second = read_file(store.structurePath("demo"));

    CHECK(without_timestamp(first) == without_timestamp(second));
    CHECK(first.find("# Last Updated:") != std::string::npos);
}

TEST_CASE("save regenerates a stale directory structure") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    project.addFiles({make_record("/src/a.js", "a.js", "a.js")});
    project.setDirectoryStructure("hand edited");
    REQUIRE(store.save(project));

    CHECK(project.directoryStructure().find("Total files: 1") != std::string::npos);
    CHECK(read_file(store.structurePath("demo")).find("hand edited") == std::string::npos);
}

TEST_CASE("instructions are written only when present") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    REQUIRE(store.save(project));
    CHECK_FALSE(std::filesystem::exists(store.analysisPath("demo")));

    project.setInstructions("Use original paths.");
    REQUIRE(store.save(project));
    CHECK(read_file(store.analysisPath("demo")) == "Use original paths.");
}

TEST_CASE("cleared instructions stay cleared after a reload") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    project.setInstructions("Use original paths.");
    REQUIRE(store.save(project));
    REQUIRE(std::filesystem::exists(store.analysisPath("demo")));

    project.setInstructions("");
    REQUIRE(store.save(project));
    CHECK_FALSE(std::filesystem::exists(store.analysisPath("demo")));
    CHECK(store.load("demo").instructions().empty());
}

TEST_CASE("records without an absolute source survive the structure tier unkeyed") {
    TempDir temp_dir;
    WorkspaceStore store(temp_dir.path().string());
    Project project = store.create("demo");
    FileRecord legacy;
    legacy.originalPath = "old.js";
    legacy.newPath = "old.js";
    project.addFiles({legacy, make_record("/src/a.js", "a.js", "a.js")});
    REQUIRE(store.save(project));
    std::filesystem::remove(store.cachePath("demo"));

    LoadTier tier = LoadTier::Empty;
    Project reloaded = store.load("demo", &tier);
    CHECK(tier == LoadTier::Structure);
    REQUIRE(reloaded.files().size() == 2);
    const FileRecord* record = reloaded.findFile("old.js");
    REQUIRE(record != nullptr);
    CHECK(record->fullOriginalPath.empty());
    CHECK(reloaded.recordsByOriginalPath().size() == 1);
}

TEST_CASE("DatabaseManager round-trips a project") {
    TempDir temp_dir;
    const std::string db_path = (temp_dir.path() / "project.db").string();

    flatsync::DatabaseManager missing(db_path);
    CHECK_FALSE(missing.exists());
    CHECK_FALSE(missing.loadProject().has_value());

    Project project("cached");
    project.addSourceDirectory("/b");
    project.addSourceDirectory("/a");
    FileRecord legacy = make_record("/a/x.js", "x.js", "x.js");
    legacy.mtime.reset();
    project.addFiles({make_record("/b/y.js", "y.js", "y.js"), legacy});

    flatsync::DatabaseManager db(db_path);
    REQUIRE(db.storeProject(project));
    REQUIRE(db.storeProject(project));

    auto loaded = flatsync::DatabaseManager(db_path).loadProject();
    REQUIRE(loaded.has_value());
    CHECK(loaded->name() == "cached");
    CHECK(loaded->sourceDirectories() == std::vector<std::string>{"/b", "/a"});
    REQUIRE(loaded->files().size() == 2);
    CHECK(loaded->files()[0].fullOriginalPath == "/b/y.js");
    CHECK_FALSE(loaded->files()[1].mtime.has_value());
}
