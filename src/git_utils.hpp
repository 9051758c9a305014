#pragma once
#include <string>
#include <optional>
#include <vector>

// Work tree root of the git repository containing path, if any.
std::optional<std::string> find_git_workdir(const std::string& path);

// Stages the given work-tree relative paths and commits them on HEAD.
// Returns false when the staged tree equals HEAD's tree (nothing to commit).
// Throws std::runtime_error with libgit2's message on failure.
bool git_commit_paths(const std::string& workdir, const std::vector<std::string>& paths,
                      const std::string& message);
