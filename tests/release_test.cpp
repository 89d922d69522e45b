#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "cpe/process_exec.hpp"
#include "cpe/release.hpp"

using namespace caravel;

namespace {

// Runs git in `dir`, failing the calling test on a non-zero exit.
bool git(const std::filesystem::path &dir, std::vector<std::string> args) {
    args.insert(args.begin(), {"git", "-C", dir.string(), "-c", "user.name=cpe", "-c", "user.email=cpe@localhost"});
    std::string output;
    ProcessOptions options;
    options.on_line = [&output](std::string_view line) {
        output += line;
        output += '\n';
    };
    auto res = process_exec(args, options);
    if (!res || *res != 0) {
        std::println(std::cerr, "git {} failed: {}", args[7], res ? output : res.error());
        return false;
    }
    return true;
}

bool has_tag(const std::filesystem::path &dir, const std::string &tag) {
    auto res = process_exec({"git", "-C", dir.string(), "rev-parse", "-q", "--verify", "refs/tags/" + tag});
    return res && *res == 0;
}

} // namespace

bool release_naming_test() {
    EXPECT(release_tag(42) == "v42");
    EXPECT(release_title(42) == "Release v42");
    EXPECT(release_tag(1) == "v1");
    return true;
}

bool git_tag_service_test() {
    ScratchDir dir("git-tags");
    const auto repo = dir / "repo";
    create_file(repo / "README.md", "package");
    EXPECT(git(repo, {"init", "-q"}));
    EXPECT(git(repo, {"add", "README.md"}));
    EXPECT(git(repo, {"commit", "-q", "-m", "init"}));

    // Local only: there is no remote, so any push attempt would fail.
    GitTagService local("origin", "", false);
    EXPECT(local.create_tag("v42", repo).has_value());
    EXPECT(has_tag(repo, "v42"));

    auto again = local.create_tag("v42", repo);
    EXPECT(!again.has_value());
    EXPECT(again.error().kind == ErrorKind::TagConflict);

    auto bad = local.create_tag("bad tag", repo);
    EXPECT(!bad.has_value());
    EXPECT(bad.error().kind == ErrorKind::StepExecution);
    EXPECT(!has_tag(repo, "bad"));

    // Pushing goes to the named remote, here a bare repository on disk.
    const auto remote = dir / "remote.git";
    EXPECT(git(dir.path(), {"init", "-q", "--bare", remote.string()}));
    GitTagService pushing(remote.string(), "not-used-by-local-remotes", true);
    EXPECT(pushing.create_tag("v43", repo).has_value());
    EXPECT(has_tag(remote, "v43"));
    EXPECT(!has_tag(remote, "v42"));

    GitTagService unreachable((dir / "missing.git").string(), "", true);
    auto failed = unreachable.create_tag("v44", repo);
    EXPECT(!failed.has_value());
    EXPECT(failed.error().kind == ErrorKind::StepExecution);
    return true;
}

bool local_release_test() {
    ScratchDir dir("releases");
    create_file(dir / "dist/pkg.whl", "wheel");

    LocalReleaseService service(dir / "releases");
    auto record = service.create_release({"v42", "Release v42", false, {dir / "dist/pkg.whl"}});
    if (!record) {
        std::println(std::cerr, "create_release failed: {}", record.error().message);
        return false;
    }
    EXPECT(read_file(dir / "releases/v42/pkg.whl") == "wheel");

    auto found = service.find("v42");
    EXPECT(found.has_value());
    EXPECT(found->title == "Release v42");
    EXPECT(found->assets == std::vector<std::string>{"pkg.whl"});

    auto duplicate = service.create_release({"v42", "Release v42", false, {}});
    EXPECT(!duplicate.has_value());
    EXPECT(duplicate.error().kind == ErrorKind::TagConflict);

    auto bad = service.create_release({"bad tag", "x", false, {}});
    EXPECT(!bad.has_value());
    EXPECT(bad.error().kind == ErrorKind::StepExecution);
    EXPECT(!service.find("v1").has_value());
    return true;
}

bool run_counter_test() {
    ScratchDir dir("counter");
    const auto counter = dir / "state/run_number";

    auto first = next_run_number(counter);
    EXPECT(first.has_value() && *first == 1);
    auto second = next_run_number(counter);
    EXPECT(second.has_value() && *second == 2);
    EXPECT(read_file(counter) == "2\n");

    create_file(counter, "41\n");
    auto resumed = next_run_number(counter);
    EXPECT(resumed.has_value() && *resumed == 42);

    create_file(counter, "garbage");
    EXPECT(!next_run_number(counter).has_value());
    return true;
}
