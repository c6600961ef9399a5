#pragma once
// Commit sources: where context intelligence reads version-control history
//
// GitCliSource shells out to git:
//   git -C <repo> log --since=YYYY-MM-DD --date=short
//       --pretty=format:@@%H|%ad|%an --numstat
// and parse_numstat() turns that into CommitRecords.

#include "../status.hpp"
#include "../types.hpp"
#include "types.hpp"
#include <cstdio>
#include <mutex>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <vector>

namespace cortex {

class CommitSource {
public:
    virtual ~CommitSource() = default;

    // Commits on or after since_day, any order
    virtual Result<std::vector<CommitRecord>> commits_since(DayNumber since_day) const = 0;

    // Name used as the collection scope
    virtual std::string scope() const = 0;
};

// Header lines start with "@@", file lines are "added\tremoved\tpath".
// Binary files report "-" and count as zero lines.
inline Result<std::vector<CommitRecord>> parse_numstat(const std::string& text) {
    std::vector<CommitRecord> commits;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        if (line.compare(0, 2, "@@") == 0) {
            std::string header = line.substr(2);
            size_t a = header.find('|');
            size_t b = a == std::string::npos ? a : header.find('|', a + 1);
            if (b == std::string::npos) {
                return Status::validation("numstat line " + std::to_string(line_no) + ": bad commit header");
            }
            CommitRecord c;
            c.hash = header.substr(0, a);
            if (!parse_day(header.substr(a + 1, b - a - 1), c.day)) {
                return Status::validation("numstat line " + std::to_string(line_no) + ": bad date");
            }
            c.author = header.substr(b + 1);
            commits.push_back(std::move(c));
            continue;
        }

        if (commits.empty()) {
            return Status::validation("numstat line " + std::to_string(line_no) + ": file stat before any commit");
        }

        size_t t1 = line.find('\t');
        size_t t2 = t1 == std::string::npos ? t1 : line.find('\t', t1 + 1);
        if (t2 == std::string::npos) {
            return Status::validation("numstat line " + std::to_string(line_no) + ": expected 3 fields");
        }

        FileChange f;
        std::string added = line.substr(0, t1);
        std::string removed = line.substr(t1 + 1, t2 - t1 - 1);
        f.path = line.substr(t2 + 1);
        try {
            f.added = added == "-" ? 0 : std::stoll(added);
            f.removed = removed == "-" ? 0 : std::stoll(removed);
        } catch (const std::exception&) {
            return Status::validation("numstat line " + std::to_string(line_no) + ": bad line counts");
        }
        commits.back().files.push_back(std::move(f));
    }
    return commits;
}

class GitCliSource : public CommitSource {
public:
    explicit GitCliSource(std::string repo_path) : repo_path_(std::move(repo_path)) {}

    Result<std::vector<CommitRecord>> commits_since(DayNumber since_day) const override {
        std::string cmd = "git -C " + shell_quote(repo_path_) + " log --since=" + format_day(since_day) +
                          " --date=short --pretty=format:@@%H\\|%ad\\|%an --numstat 2>/dev/null";
        FILE* pipe = popen(cmd.c_str(), "r");
        if (!pipe) return Status::io("cannot run git in " + repo_path_);

        std::string output;
        char buffer[4096];
        size_t n;
        while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
            output.append(buffer, n);
        }
        int rc = pclose(pipe);
        if (rc == -1 || !WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
            return Status::io("git log failed in " + repo_path_ + " (not a repository?)");
        }
        return parse_numstat(output);
    }

    std::string scope() const override { return "git:" + repo_path_; }

private:
    static std::string shell_quote(const std::string& s) {
        std::string out = "'";
        for (char c : s) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        return out + "'";
    }

    std::string repo_path_;
};

// Fixed history, for tests and replay
class InMemoryCommitSource : public CommitSource {
public:
    explicit InMemoryCommitSource(std::string scope = "memory") : scope_(std::move(scope)) {}

    void add(CommitRecord commit) {
        std::lock_guard<std::mutex> lock(mutex_);
        commits_.push_back(std::move(commit));
    }

    Result<std::vector<CommitRecord>> commits_since(DayNumber since_day) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<CommitRecord> out;
        for (const auto& c : commits_) {
            if (c.day >= since_day) out.push_back(c);
        }
        return out;
    }

    std::string scope() const override { return scope_; }

private:
    std::string scope_;
    mutable std::mutex mutex_;
    std::vector<CommitRecord> commits_;
};

} // namespace cortex
