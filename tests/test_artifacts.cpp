#include "test_common.h"
#include "scriptbox/artifacts.h"
#include "scriptbox/ids.h"

#include <fstream>

using namespace scriptbox;
namespace fs = std::filesystem;

static void touch(const fs::path& p) {
    std::ofstream f(p, std::ios::binary);
    f << "x";
}

int main() {
    const auto root = make_temp_dir("artifacts");
    SandboxPolicy policy = default_policy();
    policy.output_root = root;

    // Test 1: only regular files with the artifact extension, in name order
    {
        const std::string id = gen_execution_id();
        const fs::path dir = root / id;
        fs::create_directories(dir / "nested.png");
        touch(dir / "plot_002.png");
        touch(dir / "plot_001.png");
        touch(dir / "plot_010.png");
        touch(dir / "notes.txt");
        touch(dir / "image.PNG");

        auto arts = collect_artifacts(dir, id, policy);
        expect_eq_ll((long long)arts.size(), 3, "three png artifacts");
        expect_eq_str(arts[0], "/api/code-output/" + id + "/plot_001.png", "first artifact");
        expect_eq_str(arts[1], "/api/code-output/" + id + "/plot_002.png", "creation order");
        expect_eq_str(arts[2], "/api/code-output/" + id + "/plot_010.png", "zero padding sorts");
        expect_true(fs::exists(dir), "directory with artifacts kept");
    }

    // Test 2: nothing qualifying removes the directory
    {
        const std::string id = gen_execution_id();
        const fs::path dir = root / id;
        fs::create_directories(dir);
        touch(dir / "data.csv");
        auto arts = collect_artifacts(dir, id, policy);
        expect_true(arts.empty(), "no artifacts");
        expect_true(!fs::exists(dir), "empty output directory removed");
    }

    // Test 3: a missing directory is simply no artifacts
    {
        const std::string id = gen_execution_id();
        expect_true(collect_artifacts(root / id, id, policy).empty(), "missing dir");
    }

    // Test 4: resource identifiers map back under the output root only
    {
        const std::string id = "01234567-89ab-4def-8123-456789abcdef";
        fs::create_directories(root / id);
        touch(root / id / "plot_001.png");
        auto p = resolve_artifact(policy, "/api/code-output/" + id + "/plot_001.png");
        expect_true(p.has_value(), "well-formed resource resolves");
        expect_true(*p == root / id / "plot_001.png", "resolved path");
        expect_true(read_artifact(*p) == std::string("x"), "artifact contents");
        expect_true(!resolve_artifact(policy, "/api/code-output/" + id + "/plot_002.png"), "missing file");

        expect_true(!resolve_artifact(policy, "/api/other/" + id + "/plot_001.png"), "wrong namespace");
        expect_true(!resolve_artifact(policy, "/api/code-output/../../etc/passwd"), "traversal");
        expect_true(!resolve_artifact(policy, "/api/code-output/" + id + "/../x.png"), "dot-dot file");
        expect_true(!resolve_artifact(policy, "/api/code-output/" + id + "/.hidden"), "hidden file");
        expect_true(!resolve_artifact(policy, "/api/code-output/" + id + "/a/b.png"), "nested path");
        expect_true(!resolve_artifact(policy, "/api/code-output/" + id + "/"), "empty file name");
        expect_true(!resolve_artifact(policy, "/api/code-output/" + id), "no file name");
        expect_true(!resolve_artifact(policy, "/api/code-output/not-a-uuid/plot.png"), "bad id");
        expect_true(!resolve_artifact(policy, "/api/code-outputX/" + id + "/plot.png"), "namespace prefix only");
    }

    // Test 5: symlinks and non-files are never served
    {
        const std::string id = gen_execution_id();
        const fs::path dir = root / id;
        fs::create_directories(dir / "folder.png");
        const auto outside = make_temp_dir("artifacts_outside");
        touch(outside / "secret.png");
        touch(outside / "notes.txt");
        fs::create_symlink(outside / "secret.png", dir / "escape.png");
        fs::create_symlink(dir / "missing.png", dir / "dangling.png");
        touch(dir / "real.png");
        fs::create_symlink(dir / "real.png", dir / "alias.png");
        touch(dir / "notes.txt");

        const std::string base = "/api/code-output/" + id + "/";
        expect_true(!resolve_artifact(policy, base + "escape.png"), "symlink out of the output root");
        expect_true(!resolve_artifact(policy, base + "dangling.png"), "dangling symlink");
        expect_true(!resolve_artifact(policy, base + "alias.png"), "symlink inside the directory");
        expect_true(!resolve_artifact(policy, base + "folder.png"), "directory named like an artifact");
        expect_true(!resolve_artifact(policy, base + "notes.txt"), "other extensions");
        expect_true(resolve_artifact(policy, base + "real.png").has_value(), "regular file beside them");

        expect_true(!read_artifact(dir / "escape.png"), "read refuses a final symlink");
        expect_true(!read_artifact(dir / "folder.png"), "read refuses a directory");

        auto arts = collect_artifacts(dir, id, policy);
        expect_eq_ll((long long)arts.size(), 1, "only the regular file is collected");
        expect_eq_str(arts[0], base + "real.png", "collected regular file");

        const std::string linked_id = gen_execution_id();
        fs::create_directory_symlink(outside, root / linked_id);
        expect_true(!resolve_artifact(policy, "/api/code-output/" + linked_id + "/secret.png"),
                    "symlinked execution directory");
        fs::remove(root / linked_id);
        fs::remove_all(outside);
    }

    // Test 6: content types
    expect_eq_str(content_type_for("a/plot_001.png"), "image/png", "png");
    expect_eq_str(content_type_for("a/x.JPG"), "image/jpeg", "jpg upper");
    expect_eq_str(content_type_for("a/x.svg"), "image/svg+xml", "svg");
    expect_eq_str(content_type_for("a/x.bin"), "application/octet-stream", "fallback");

    expect_eq_str(artifact_resource("/ns", "id", "f.png"), "/ns/id/f.png", "resource format");

    fs::remove_all(root);
    std::cerr << "test_artifacts: ALL PASSED" << std::endl;
    return 0;
}
