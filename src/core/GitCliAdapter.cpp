#include "core/GitCliAdapter.hpp"

#include <initializer_list>
#include <sstream>
#include <utility>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitsync {

namespace {

bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (text.find(n) != std::string::npos) return true;
    }
    return false;
}

bool looksLikeNetworkFailure(const ProcessResult& r) {
    if (r.timedOut) return true;
    return containsAny(r.output, {
        "Could not read from remote repository",
        "unable to access",
        "Could not resolve host",
        "does not appear to be a git repository",
        "Connection refused",
        "Connection timed out",
        "Network is unreachable",
        "unable to connect",
        "The remote end hung up",
        "early EOF",
        "Authentication failed",
    });
}

bool looksLikeRejection(const ProcessResult& r) {
    return containsAny(r.output, {
        "[rejected]",
        "[remote rejected]",
        "non-fast-forward",
        "fetch first",
        "Updates were rejected",
    });
}

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
    size_t start = 0;
    while (start < s.size() && (s[start] == ' ' || s[start] == '\t')) ++start;
    return s.substr(start);
}

Error failure(ErrorCode code, const std::string& op, const ProcessResult& r) {
    std::string msg = op + " failed";
    if (r.timedOut) {
        msg += " (timed out)";
    } else {
        msg += " (exit " + std::to_string(r.exitCode) + ")";
    }
    std::string out = trim(r.output);
    if (!out.empty()) msg += ": " + out;
    return Error{code, msg};
}

}

GitCliAdapter::GitCliAdapter(fs::path root, std::string gitExecutable, std::chrono::seconds networkTimeout)
    : root_(std::move(root)), gitExe_(std::move(gitExecutable)), networkTimeout_(networkTimeout) {}

Expected<ProcessResult> GitCliAdapter::git(const std::vector<std::string>& args, bool network) {
    std::vector<std::string> argv{gitExe_, "-C", root_.string()};
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions opts;
    opts.env = {{"LC_ALL", "C"}, {"GIT_TERMINAL_PROMPT", "0"}};
    if (network) {
        opts.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(networkTimeout_);
    }

    std::ostringstream cmd;
    for (size_t i = 3; i < argv.size(); ++i) cmd << (i > 3 ? " " : "") << argv[i];
    Logger::instance().debug("vcs", "git " + cmd.str());

    auto res = runProcess(argv, opts);
    if (!res) return res.error();
    if (res.value().exitCode == 127 && res.value().output.find("exec failed") != std::string::npos) {
        return Error{ErrorCode::ConfigurationError, "cannot execute '" + gitExe_ + "'"};
    }
    return res;
}

Expected<fs::path> GitCliAdapter::topLevel() {
    auto r = git({"rev-parse", "--show-toplevel"});
    if (!r) return r.error();
    if (r.value().exitCode != 0) {
        return failure(ErrorCode::ConfigurationError, "rev-parse --show-toplevel", r.value());
    }
    return fs::path(trim(r.value().output));
}

Expected<fs::path> GitCliAdapter::metadataPath(const std::string& name) {
    auto r = git({"rev-parse", "--git-path", name});
    if (!r) return r.error();
    if (r.value().exitCode != 0) {
        return failure(ErrorCode::VcsFailure, "rev-parse --git-path", r.value());
    }
    fs::path p = trim(r.value().output);
    if (p.is_relative()) p = root_ / p;
    return p.lexically_normal();
}

Expected<void> GitCliAdapter::stageAll() {
    auto r = git({"add", "-A"});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return failure(ErrorCode::VcsFailure, "add -A", r.value());
    return {};
}

Expected<bool> GitCliAdapter::hasStagedChanges() {
    auto r = git({"diff", "--cached", "--quiet"});
    if (!r) return r.error();
    if (r.value().exitCode == 0) return false;
    if (r.value().exitCode == 1) return true;
    return failure(ErrorCode::VcsFailure, "diff --cached", r.value());
}

Expected<bool> GitCliAdapter::isWorkingTreeDirty() {
    auto r = git({"status", "--porcelain", "--untracked-files=no"});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return failure(ErrorCode::VcsFailure, "status", r.value());
    return !trim(r.value().output).empty();
}

Expected<void> GitCliAdapter::commit(const std::string& message) {
    auto r = git({"commit", "-q", "-m", message});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return failure(ErrorCode::VcsFailure, "commit", r.value());
    return {};
}

Expected<std::string> GitCliAdapter::currentBranch() {
    auto r = git({"symbolic-ref", "--short", "-q", "HEAD"});
    if (!r) return r.error();
    if (r.value().exitCode != 0) {
        return Error{ErrorCode::VcsFailure, "HEAD is detached, no branch to synchronize"};
    }
    return trim(r.value().output);
}

Expected<std::string> GitCliAdapter::headCommit() {
    auto r = git({"rev-parse", "-q", "--verify", "HEAD"});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return std::string();
    return trim(r.value().output);
}

Expected<void> GitCliAdapter::push(const std::string& remote, const std::string& localBranch,
                                   const std::string& remoteBranch) {
    std::string refspec = "refs/heads/" + localBranch + ":refs/heads/" + remoteBranch;
    auto r = git({"push", remote, refspec}, true);
    if (!r) return r.error();
    const auto& pr = r.value();
    if (pr.exitCode == 0) return {};
    if (looksLikeNetworkFailure(pr)) return failure(ErrorCode::NetworkError, "push", pr);
    if (looksLikeRejection(pr)) return failure(ErrorCode::RejectedError, "push", pr);
    return failure(ErrorCode::VcsFailure, "push", pr);
}

Expected<void> GitCliAdapter::fetch(const std::string& remote) {
    auto r = git({"fetch", "--prune", "-q", remote}, true);
    if (!r) return r.error();
    const auto& pr = r.value();
    if (pr.exitCode == 0) return {};
    if (looksLikeNetworkFailure(pr)) return failure(ErrorCode::NetworkError, "fetch", pr);
    return failure(ErrorCode::VcsFailure, "fetch", pr);
}

Expected<bool> GitCliAdapter::refExists(const std::string& ref) {
    auto r = git({"rev-parse", "-q", "--verify", ref + "^{commit}"});
    if (!r) return r.error();
    return r.value().exitCode == 0;
}

Expected<Divergence> GitCliAdapter::aheadBehind(const std::string& ref) {
    auto r = git({"rev-list", "--left-right", "--count", "HEAD..." + ref});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return failure(ErrorCode::VcsFailure, "rev-list --left-right", r.value());
    std::istringstream in(r.value().output);
    Divergence d;
    if (!(in >> d.ahead >> d.behind)) {
        return Error{ErrorCode::VcsFailure, "unexpected rev-list output: " + trim(r.value().output)};
    }
    return d;
}

Expected<size_t> GitCliAdapter::countCommits(const std::string& ref) {
    auto r = git({"rev-list", "--count", ref});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return failure(ErrorCode::VcsFailure, "rev-list --count", r.value());
    std::istringstream in(r.value().output);
    size_t n = 0;
    if (!(in >> n)) {
        return Error{ErrorCode::VcsFailure, "unexpected rev-list output: " + trim(r.value().output)};
    }
    return n;
}

Expected<void> GitCliAdapter::fastForward(const std::string& ref) {
    auto r = git({"merge", "--ff-only", "-q", ref});
    if (!r) return r.error();
    const auto& pr = r.value();
    if (pr.exitCode == 0) return {};
    if (pr.output.find("ot possible to fast-forward") != std::string::npos) {
        return failure(ErrorCode::DivergedHistoryError, "merge --ff-only", pr);
    }
    return failure(ErrorCode::VcsFailure, "merge --ff-only", pr);
}

Expected<StashRecord> GitCliAdapter::stashPush(const std::string& label) {
    auto before = git({"rev-parse", "-q", "--verify", "refs/stash"});
    if (!before) return before.error();
    std::string prevTop = before.value().exitCode == 0 ? trim(before.value().output) : std::string();

    StashRecord rec;
    rec.label = label;
    rec.createdAt = std::chrono::system_clock::now();

    auto r = git({"stash", "push", "-q", "-m", label});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return failure(ErrorCode::VcsFailure, "stash push", r.value());

    auto after = git({"rev-parse", "-q", "--verify", "refs/stash"});
    if (!after) return after.error();
    std::string top = after.value().exitCode == 0 ? trim(after.value().output) : std::string();
    if (!top.empty() && top != prevTop) rec.commitId = top;
    return rec;
}

Expected<std::string> GitCliAdapter::stashSelector(const std::string& commitId) {
    auto r = git({"stash", "list", "--format=%gd %H"});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return failure(ErrorCode::VcsFailure, "stash list", r.value());
    std::istringstream in(r.value().output);
    std::string selector;
    std::string hash;
    while (in >> selector >> hash) {
        if (hash == commitId) return selector;
    }
    return Error{ErrorCode::IoError, "stash " + commitId + " is no longer in the stash list"};
}

Expected<void> GitCliAdapter::stashApply(const StashRecord& record) {
    auto r = git({"stash", "apply", "-q", record.commitId});
    if (!r) return r.error();
    if (r.value().exitCode != 0) {
        return failure(ErrorCode::RestoreConflictError, "stash apply " + record.commitId, r.value());
    }
    return {};
}

Expected<void> GitCliAdapter::stashDrop(const StashRecord& record) {
    auto sel = stashSelector(record.commitId);
    if (!sel) return sel.error();
    auto r = git({"stash", "drop", "-q", sel.value()});
    if (!r) return r.error();
    if (r.value().exitCode != 0) return failure(ErrorCode::VcsFailure, "stash drop", r.value());
    return {};
}

}
