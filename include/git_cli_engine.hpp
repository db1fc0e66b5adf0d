#ifndef GIT_CLI_ENGINE_HPP
#define GIT_CLI_ENGINE_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "system_utils.hpp"
#include "vcs_engine.hpp"

namespace committer {

/**
 * @brief Engine that runs the `git` executable for every operation.
 *
 * Each call is one blocking child process with stdout and stderr captured
 * together. Paths are passed to git unchanged, so they are resolved against
 * @a cwd exactly like on a shell prompt, and are matched literally
 * (`--literal-pathspecs`). This engine runs the repository's commit hooks.
 */
class GitCliEngine : public VcsEngine {
  public:
    explicit GitCliEngine(std::string git_binary = "git", std::filesystem::path cwd = {});

    std::string name() const override { return "git"; }
    bool path_in_index(const std::string& path) override;
    bool blob_in_commit(const std::string& ref, const std::string& path) override;
    void reset_index(const std::string& ref) override;
    void stage_paths(const std::vector<std::string>& paths) override;
    bool staged_diff_empty(const std::vector<std::string>& paths) override;
    CommitOutput commit(const std::string& message,
                        const std::vector<std::string>& paths) override;

  private:
    procutil::ProcessResult git(const std::vector<std::string>& args) const;
    bool head_unborn() const;

    std::string binary_;
    std::filesystem::path cwd_;
};

} // namespace committer

#endif // GIT_CLI_ENGINE_HPP
