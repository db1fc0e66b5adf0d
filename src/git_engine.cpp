#include "git_engine.hpp"
#include <system_error>
#include <utility>
#include "errors.hpp"
#include "logger.hpp"

using committer::CommitOutput;
using committer::FatalError;

namespace git {

namespace {

/// Owns the strings behind a git_strarray pathspec.
struct PathSpec {
    std::vector<std::string> paths;
    std::vector<char*> ptrs;
    git_strarray array{nullptr, 0};

    explicit PathSpec(std::vector<std::string> p) : paths(std::move(p)) {
        ptrs.reserve(paths.size());
        for (auto& s : paths)
            ptrs.push_back(const_cast<char*>(s.c_str()));
        array.strings = ptrs.data();
        array.count = ptrs.size();
    }
    PathSpec(const PathSpec&) = delete;
    PathSpec& operator=(const PathSpec&) = delete;

    /// True when @a path is one of the paths or lies below one of them.
    bool covers(const char* path) const {
        const std::string candidate = path ? path : "";
        for (const auto& p : paths) {
            if (p == "." || candidate == p)
                return true;
            if (candidate.size() > p.size() && candidate.compare(0, p.size(), p) == 0 &&
                candidate[p.size()] == '/')
                return true;
        }
        return false;
    }
};

// libgit2 matches pathspecs as globs; keep only literal matches.
int literal_match(const char* path, const char*, void* payload) {
    return static_cast<const PathSpec*>(payload)->covers(path) ? 0 : 1;
}

[[noreturn]] void fail(const std::string& what) {
    throw FatalError(what + ": " + last_error_message());
}

git_repository* open_repository(const fs::path& start) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, start.string().c_str(), 0, nullptr) != 0)
        fail("not a git repository (or any parent up to /): " + start.string());
    if (git_repository_is_bare(raw)) {
        git_repository_free(raw);
        throw FatalError("repository at " + start.string() + " has no working tree");
    }
    return raw;
}

// Resolve symlinks in the directory part only; the last component may be a
// symlink or a file that no longer exists.
fs::path normalize_location(const fs::path& p) {
    fs::path abs = fs::absolute(p).lexically_normal();
    if (!abs.has_filename())
        abs = abs.parent_path();
    std::error_code ec;
    fs::path dir = fs::weakly_canonical(abs.parent_path(), ec);
    if (ec)
        dir = abs.parent_path();
    return abs.filename() == "." ? dir : dir / abs.filename();
}

std::string oid_to_short_hex(const git_oid& oid) {
    char buf[8];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return std::string(buf);
}

CommitOutput failed_commit(const std::string& what) {
    CommitOutput out;
    out.exit_code = 1;
    out.output.push_back(what.empty() ? last_error_message() : what + ": " + last_error_message());
    return out;
}

} // namespace

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

std::string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

Libgit2Engine::Libgit2Engine(const fs::path& start) : repo_(open_repository(start)) {
    const char* wd = git_repository_workdir(repo_.get());
    std::error_code ec;
    workdir_ = fs::weakly_canonical(fs::path(wd), ec);
    if (ec)
        workdir_ = fs::path(wd).lexically_normal();
    if (!workdir_.has_filename())
        workdir_ = workdir_.parent_path();
    log_debug("Opened repository", workdir_.string());
}

std::string Libgit2Engine::to_repo_path(const std::string& path) const {
    fs::path rel = normalize_location(path).lexically_relative(workdir_);
    if (rel.empty() || *rel.begin() == "..")
        throw FatalError("path is outside the repository: " + path);
    std::string out = rel.generic_string();
    while (out.size() > 1 && out.back() == '/')
        out.pop_back();
    return out;
}

git_index* Libgit2Engine::open_index() const {
    git_index* raw = nullptr;
    if (git_repository_index(&raw, repo_.get()) != 0)
        fail("cannot open the index");
    // Pick up changes written by other processes since the last call.
    if (git_index_read(raw, 0) != 0) {
        git_index_free(raw);
        fail("cannot read the index");
    }
    return raw;
}

bool Libgit2Engine::head_unborn() const {
    int rc = git_repository_head_unborn(repo_.get());
    if (rc < 0)
        fail("cannot read HEAD");
    return rc == 1;
}

git_tree* Libgit2Engine::lookup_tree(const std::string& ref) const {
    git_object* raw = nullptr;
    int rc = git_revparse_single(&raw, repo_.get(), ref.c_str());
    if (rc == GIT_ENOTFOUND || rc == GIT_EUNBORNBRANCH)
        return nullptr;
    if (rc != 0)
        fail("cannot resolve " + ref);
    object_ptr obj(raw);
    git_object* peeled = nullptr;
    if (git_object_peel(&peeled, obj.get(), GIT_OBJECT_TREE) != 0)
        fail(ref + " does not name a commit");
    return reinterpret_cast<git_tree*>(peeled);
}

bool Libgit2Engine::path_in_index(const std::string& path) {
    std::string rel = to_repo_path(path);
    index_ptr idx(open_index());
    return tracked(idx.get(), rel);
}

bool Libgit2Engine::blob_in_commit(const std::string& ref, const std::string& path) {
    std::string rel = to_repo_path(path);
    tree_ptr tree(lookup_tree(ref));
    if (!tree.get())
        return false;
    git_tree_entry* raw = nullptr;
    int rc = git_tree_entry_bypath(&raw, tree.get(), rel.c_str());
    tree_entry_ptr entry(raw);
    if (rc == GIT_ENOTFOUND)
        return false;
    if (rc != 0)
        fail("cannot look up " + path + " in " + ref);
    return true;
}

void Libgit2Engine::reset_index(const std::string& ref) {
    index_ptr idx(open_index());
    tree_ptr tree(lookup_tree(ref));
    if (tree.get()) {
        if (git_index_read_tree(idx.get(), tree.get()) != 0)
            fail("cannot reset the index to " + ref);
    } else if (head_unborn()) {
        if (git_index_clear(idx.get()) != 0)
            fail("cannot clear the index");
    } else {
        throw FatalError("cannot reset the index: " + ref + " not found");
    }
    if (git_index_write(idx.get()) != 0)
        fail("cannot write the index");
}

bool Libgit2Engine::tracked(git_index* idx, const std::string& rel) const {
    if (rel == ".")
        return git_index_entrycount(idx) > 0;
    if (git_index_get_bypath(idx, rel.c_str(), 0) != nullptr)
        return true;
    size_t pos = 0;
    return git_index_find_prefix(&pos, idx, (rel + "/").c_str()) == 0;
}

void Libgit2Engine::stage_paths(const std::vector<std::string>& paths) {
    std::vector<std::string> rel;
    rel.reserve(paths.size());
    for (const auto& p : paths)
        rel.push_back(to_repo_path(p));
    PathSpec spec(std::move(rel));
    index_ptr idx(open_index());
    // add_all silently skips ignored files; git add refuses them, and so do we.
    for (size_t i = 0; i < paths.size(); ++i) {
        const std::string& r = spec.paths[i];
        if (r == "." || tracked(idx.get(), r))
            continue;
        int ignored = 0;
        if (git_ignore_path_is_ignored(&ignored, repo_.get(), r.c_str()) != 0)
            fail("cannot check ignore rules for " + paths[i]);
        if (ignored)
            throw FatalError("cannot stage files: " + paths[i] + " is ignored by .gitignore");
    }
    if (git_index_add_all(idx.get(), &spec.array, GIT_INDEX_ADD_DEFAULT, literal_match,
                          &spec) != 0)
        fail("cannot stage files");
    // add_all skips files that vanished from disk; update_all records those deletions.
    if (git_index_update_all(idx.get(), &spec.array, literal_match, &spec) != 0)
        fail("cannot stage deletions");
    if (git_index_write(idx.get()) != 0)
        fail("cannot write the index");
}

bool Libgit2Engine::staged_diff_empty(const std::vector<std::string>& paths) {
    std::vector<std::string> rel;
    rel.reserve(paths.size());
    for (const auto& p : paths)
        rel.push_back(to_repo_path(p));
    PathSpec spec(std::move(rel));
    index_ptr idx(open_index());
    tree_ptr tree(lookup_tree("HEAD"));
    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    opts.pathspec = spec.array;
    git_diff* raw = nullptr;
    if (git_diff_tree_to_index(&raw, repo_.get(), tree.get(), idx.get(), &opts) != 0)
        fail("cannot diff the index against HEAD");
    diff_ptr diff(raw);
    // The pathspec is a glob; only deltas on the literal paths count.
    const size_t n = git_diff_num_deltas(diff.get());
    for (size_t i = 0; i < n; ++i) {
        const git_diff_delta* delta = git_diff_get_delta(diff.get(), i);
        if (spec.covers(delta->old_file.path) || spec.covers(delta->new_file.path))
            return false;
    }
    return true;
}

CommitOutput Libgit2Engine::commit(const std::string& message,
                                   const std::vector<std::string>& paths) {
    git_buf buf = GIT_BUF_INIT;
    if (git_message_prettify(&buf, message.c_str(), 0, '#') != 0)
        return failed_commit("invalid commit message");
    std::string msg = buf.ptr ? buf.ptr : "";
    git_buf_dispose(&buf);
    if (msg.empty()) {
        CommitOutput out;
        out.exit_code = 1;
        out.output.push_back("Aborting commit due to empty commit message.");
        return out;
    }

    git_index* raw_idx = nullptr;
    if (git_repository_index(&raw_idx, repo_.get()) != 0)
        return failed_commit("cannot open the index");
    index_ptr idx(raw_idx);
    git_oid tree_oid;
    if (git_index_write_tree(&tree_oid, idx.get()) != 0)
        return failed_commit("");
    git_tree* raw_tree = nullptr;
    if (git_tree_lookup(&raw_tree, repo_.get(), &tree_oid) != 0)
        return failed_commit("");
    tree_ptr tree(raw_tree);

    git_signature* raw_sig = nullptr;
    if (git_signature_default(&raw_sig, repo_.get()) != 0)
        return failed_commit("cannot determine committer identity (set user.name and user.email)");
    signature_ptr sig(raw_sig);

    git_commit* raw_parent = nullptr;
    int unborn = git_repository_head_unborn(repo_.get());
    if (unborn < 0)
        return failed_commit("");
    if (unborn == 0) {
        git_oid parent_oid;
        if (git_reference_name_to_id(&parent_oid, repo_.get(), "HEAD") != 0 ||
            git_commit_lookup(&raw_parent, repo_.get(), &parent_oid) != 0)
            return failed_commit("");
    }
    commit_ptr parent(raw_parent);
    const size_t parent_count = parent.get() ? 1 : 0;

    // Updating HEAD locks the branch ref; a stale lock fails here and is quoted in the error.
    git_oid commit_oid;
    if (git_commit_create_v(&commit_oid, repo_.get(), "HEAD", sig.get(), sig.get(), nullptr,
                            msg.c_str(), tree.get(), parent_count,
                            static_cast<const git_commit*>(parent.get())) != 0)
        return failed_commit("");

    std::string branch = "HEAD";
    git_reference* raw_head = nullptr;
    if (git_repository_head(&raw_head, repo_.get()) == 0) {
        reference_ptr head(raw_head);
        if (const char* name = git_reference_shorthand(head.get()))
            branch = name;
    }
    std::string subject = msg.substr(0, msg.find('\n'));
    CommitOutput out;
    out.exit_code = 0;
    out.output.push_back("[" + branch + (parent_count ? " " : " (root-commit) ") +
                         oid_to_short_hex(commit_oid) + "] " + subject);
    log_debug("libgit2 commit created", {{"paths", std::to_string(paths.size())},
                                          {"commit", oid_to_short_hex(commit_oid)}});
    return out;
}

} // namespace git
