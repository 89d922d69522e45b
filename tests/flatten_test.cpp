#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "cpe/filesystem.hpp"
#include "cpe/flatten.hpp"

using namespace caravel;

bool flatten_test() {
    MemoryFileSystem fs;
    fs.add_file("/work/dist/dist/pkg-1.0.whl", "wheel");
    fs.add_file("/work/dist/dist/pkg-1.0.tar.gz", "sdist");
    fs.add_file("/work/dist/notes.txt", "old");
    fs.add_file("/work/dist/dist/notes.txt", "new");

    auto plan = plan_flatten(fs, "/work/dist", "dist");
    EXPECT(plan.has_value());
    EXPECT(plan->size() == 5); // stage, three hoists, remove
    EXPECT(plan->front().kind == FlattenOp::Kind::Move);
    EXPECT(plan->back().kind == FlattenOp::Kind::Remove);
    // planning does not touch the tree
    EXPECT(fs.exists("/work/dist/dist/pkg-1.0.whl"));

    auto changed = flatten_artifact_dir(fs, "/work/dist", "dist");
    EXPECT(changed.has_value() && *changed);

    const std::vector<std::string> expected = {
        "/work/",
        "/work/dist/",
        "/work/dist/notes.txt",
        "/work/dist/pkg-1.0.tar.gz",
        "/work/dist/pkg-1.0.whl",
    };
    EXPECT(fs.snapshot() == expected);
    // same-named entries are replaced
    EXPECT(fs.read("/work/dist/notes.txt") == "new");

    // Second application is a no-op.
    auto again = plan_flatten(fs, "/work/dist", "dist");
    EXPECT(again.has_value() && again->empty());
    changed = flatten_artifact_dir(fs, "/work/dist", "dist");
    EXPECT(changed.has_value() && !*changed);
    EXPECT(fs.snapshot() == expected);

    EXPECT(!plan_flatten(fs, "/work/dist", "").has_value());
    EXPECT(!plan_flatten(fs, "/work/dist", "a/b").has_value());
    EXPECT(!plan_flatten(fs, "/work/dist", ".").has_value());
    EXPECT(!plan_flatten(fs, "/work", "..").has_value());
    return true;
}

bool flatten_same_name_test() {
    // dist/dist/dist/x: the inner folder shares the name of the one being removed.
    MemoryFileSystem fs;
    fs.add_file("out/dist/dist/dist/x.bin", "x");
    fs.add_directory("out/dist/dist/empty");

    auto changed = flatten_artifact_dir(fs, "out/dist", "dist");
    EXPECT(changed.has_value() && *changed);
    const std::vector<std::string> once = {
        "out/",
        "out/dist/",
        "out/dist/dist/",
        "out/dist/dist/x.bin",
        "out/dist/empty/",
    };
    EXPECT(fs.snapshot() == once);

    changed = flatten_artifact_dir(fs, "out/dist", "dist");
    EXPECT(changed.has_value() && *changed);
    const std::vector<std::string> twice = {
        "out/",
        "out/dist/",
        "out/dist/empty/",
        "out/dist/x.bin",
    };
    EXPECT(fs.snapshot() == twice);

    // The same plan against the real filesystem.
    ScratchDir dir("flatten");
    create_file(dir / "dist/dist/a.txt", "a");
    create_file(dir / "dist/dist/sub/b.txt", "b");
    RealFileSystem real;
    changed = flatten_artifact_dir(real, dir / "dist", "dist");
    EXPECT(changed.has_value() && *changed);
    EXPECT(read_file(dir / "dist/a.txt") == "a");
    EXPECT(read_file(dir / "dist/sub/b.txt") == "b");
    EXPECT(!std::filesystem::exists(dir / "dist/dist"));
    EXPECT(!std::filesystem::exists(dir / "dist/.cpe-flatten-dist"));

    changed = flatten_artifact_dir(real, dir / "dist", "dist");
    EXPECT(changed.has_value() && !*changed);
    return true;
}
