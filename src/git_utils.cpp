#include "git_utils.hpp"
#include <git2.h>
#include <stdexcept>

struct GitLib {
    GitLib() { git_libgit2_init(); }
    ~GitLib() { git_libgit2_shutdown(); }
};

static GitLib& git_lib() {
    static GitLib git_init;
    return git_init;
}

static std::runtime_error git_failure(const std::string& what) {
    const git_error* err = git_error_last();
    return std::runtime_error(what + ": " + (err && err->message ? err->message : "unknown libgit2 error"));
}

std::optional<std::string> find_git_workdir(const std::string& path) {
    git_lib();

    git_repository* repo = nullptr;
    std::string workdir;
    bool found = false;

    int error = git_repository_open_ext(&repo, path.c_str(), 0, nullptr);
    if (error == 0) {
        const char* dir = git_repository_workdir(repo);
        if (dir) {
            workdir = dir;
            found = true;
        }
    }

    if (repo) git_repository_free(repo);

    if (found) return workdir;
    return std::nullopt;
}

bool git_commit_paths(const std::string& workdir, const std::vector<std::string>& paths,
                      const std::string& message) {
    git_lib();

    git_repository* repo = nullptr;
    git_index* index = nullptr;
    git_tree* tree = nullptr;
    git_signature* sig = nullptr;
    git_commit* parent = nullptr;
    bool committed = false;
    std::string failure;

    // single exit so every handle is released on all paths
    do {
        if (git_repository_open(&repo, workdir.c_str()) != 0) { failure = "open " + workdir; break; }
        if (git_repository_index(&index, repo) != 0) { failure = "index"; break; }

        bool staged = true;
        for (const auto& p : paths) {
            if (git_index_add_bypath(index, p.c_str()) != 0) { failure = "add " + p; staged = false; break; }
        }
        if (!staged) break;
        if (git_index_write(index) != 0) { failure = "write index"; break; }

        git_oid tree_id;
        if (git_index_write_tree(&tree_id, index) != 0) { failure = "write tree"; break; }
        if (git_tree_lookup(&tree, repo, &tree_id) != 0) { failure = "lookup tree"; break; }

        git_oid parent_id;
        // an unborn branch has no HEAD yet; the first commit has no parent
        if (git_reference_name_to_id(&parent_id, repo, "HEAD") == 0) {
            if (git_commit_lookup(&parent, repo, &parent_id) != 0) { failure = "lookup HEAD"; break; }
            if (git_oid_equal(git_commit_tree_id(parent), &tree_id)) break;
        }

        if (git_signature_default(&sig, repo) != 0 &&
            git_signature_now(&sig, "shist", "shist@localhost") != 0) {
            failure = "signature";
            break;
        }

        git_oid commit_id;
        const git_commit* parents[] = {parent};
        if (git_commit_create(&commit_id, repo, "HEAD", sig, sig, nullptr, message.c_str(),
                              tree, parent ? 1 : 0, parent ? parents : nullptr) != 0) {
            failure = "commit";
            break;
        }
        committed = true;
    } while (false);

    std::runtime_error error = failure.empty() ? std::runtime_error("") : git_failure(failure);

    if (parent) git_commit_free(parent);
    if (sig) git_signature_free(sig);
    if (tree) git_tree_free(tree);
    if (index) git_index_free(index);
    if (repo) git_repository_free(repo);

    if (!failure.empty()) throw error;
    return committed;
}
