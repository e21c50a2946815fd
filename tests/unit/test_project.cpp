#include <catch2/catch_test_macros.hpp>
#include "Project.hpp"

#include <string>
#include <vector>

using flatsync::FileRecord;
using flatsync::Project;

namespace {

FileRecord make_record(const std::string& full, const std::string& flat, int64_t size) {
    FileRecord record;
    record.originalPath = flat;
    record.fullOriginalPath = full;
    record.newPath = flat;
    record.size = size;
    record.mtime = "2024-01-01T00:00:00.000Z";
    return record;
}

} // namespace

TEST_CASE("addFiles replaces records that share a key and keeps insertion order") {
    Project project("demo");
    project.addFiles({make_record("/src/a.js", "a.js", 1), make_record("/src/b.js", "b.js", 2)});
    project.addFiles({make_record("/src/a.js", "a.js", 10), make_record("/src/c.js", "c.js", 3)});

    REQUIRE(project.files().size() == 3);
    CHECK(project.files()[0].fullOriginalPath == "/src/a.js");
    CHECK(project.files()[0].size == 10);
    CHECK(project.files()[2].fullOriginalPath == "/src/c.js");
}

TEST_CASE("records without an absolute path are keyed by their relative path") {
    Project project("demo");
    FileRecord legacy;
    legacy.originalPath = "old.js";
    legacy.newPath = "old.js";
    project.addFiles({legacy, legacy});

    REQUIRE(project.files().size() == 1);
    REQUIRE(project.findFile("old.js") != nullptr);
    CHECK(project.recordsByOriginalPath().empty());
}

TEST_CASE("updateFileMetadata touches only size and mtime") {
    Project project("demo");
    project.addFiles({make_record("/src/a.js", "a.js", 1)});

    CHECK(project.updateFileMetadata("/src/a.js", 42, "2024-02-02T00:00:00.000Z"));
    CHECK_FALSE(project.updateFileMetadata("/src/missing.js", 1, "x"));

    const FileRecord* record = project.findFile("/src/a.js");
    REQUIRE(record != nullptr);
    CHECK(record->size == 42);
    CHECK(record->mtime == "2024-02-02T00:00:00.000Z");
    CHECK(record->newPath == "a.js");
}

TEST_CASE("lookups stay valid on a copied project") {
    Project original("demo");
    original.addFiles({make_record("/src/a.js", "a.js", 1)});
    Project copy = original;
    copy.addFiles({make_record("/src/b.js", "b.js", 2)});

    REQUIRE(copy.findFile("/src/b.js") != nullptr);
    CHECK(copy.findFile("/src/b.js")->size == 2);
    CHECK(original.findFile("/src/b.js") == nullptr);
}

TEST_CASE("large record sets load with one record per key") {
    constexpr int count = 20000;
    std::vector<FileRecord> records;
    records.reserve(count);
    for (int i = 0; i < count; ++i) {
        const std::string name = "f" + std::to_string(i) + ".js";
        records.push_back(make_record("/src/" + name, name, i));
    }

    Project project("demo");
    project.addFiles(records);
    project.addFiles(records);

    REQUIRE(project.files().size() == static_cast<std::size_t>(count));
    REQUIRE(project.findFile("/src/f19999.js") != nullptr);
    CHECK(project.findFile("/src/f19999.js")->size == 19999);
}
