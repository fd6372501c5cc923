#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace cronrepo {

class SyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The user's crontab as a whole text blob. Owned outside cronrepo; other
// tools may change it between read() and write().
class CrontabStore {
public:
    virtual ~CrontabStore() = default;
    virtual std::string read() = 0;
    virtual void write(const std::string& text) = 0;
};

// `crontab -l` / `crontab -`
class SystemCrontab : public CrontabStore {
public:
    std::string read() override;
    void write(const std::string& text) override;
};

struct BlockMarkers {
    std::string begin;
    std::string end;
};

BlockMarkers markers_for(const std::string& target);

// Header line naming the directory a block was generated from
std::string source_header(const std::string& dir);

// Remove the target's block, leaving every other line untouched. Text
// without the block is returned as is. Throws SyncError when the begin
// marker has no matching end marker.
std::string strip_block(const std::string& crontab, const std::string& target);

// Replace the target's block in place, or append it when absent.
// `block` is complete block text ending with a newline.
std::string put_block(const std::string& crontab, const std::string& target,
                      const std::string& block);

// Targets of all blocks in `crontab` whose source header names `dir`
std::vector<std::string> targets_from_directory(const std::string& crontab,
                                                const std::string& dir);

} // namespace cronrepo
