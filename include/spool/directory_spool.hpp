#pragma once

#include "spool/spool.hpp"

#include <memory>
#include <string>

namespace marquise {

enum class SpoolKind {
    POINTS,
    CONTENTS,
};

const char* spool_kind_name(SpoolKind kind);

// Directory-backed spool: <root>/<namespace>/<kind>/{new,cur}.
// Writers drop complete files into new/. A batch is claimed by renaming it
// into cur/, sealed by unlinking it, and released back to new/ otherwise.
class DirectorySpool : public Spool {
public:
    DirectorySpool(const char* root, const char* name, SpoolKind kind);

    DirectorySpool(const DirectorySpool&) = delete;
    DirectorySpool& operator=(const DirectorySpool&) = delete;

    // Create the directory tree and move batches left in cur/ by a previous
    // run back to new/. Returns false if the directories cannot be created.
    bool open();

    std::unique_ptr<Batch> next_batch() override;

    const std::string& new_dir() const { return new_dir_; }
    const std::string& cur_dir() const { return cur_dir_; }

private:
    SpoolKind kind_;
    std::string base_dir_;
    std::string new_dir_;
    std::string cur_dir_;
    bool open_;
};

} // namespace marquise
