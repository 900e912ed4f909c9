#include "spool/directory_spool.hpp"

#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace marquise {

const char* spool_kind_name(SpoolKind kind) {
    return kind == SpoolKind::POINTS ? "points" : "contents";
}

namespace {

bool make_dir(const std::string& path) {
    if (::mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) {
        struct stat st{};
        return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
    }
    return false;
}

// mkdir -p
bool make_dirs(const std::string& path) {
    for (size_t pos = 1; pos < path.size(); ++pos) {
        if (path[pos] == '/') {
            if (!make_dir(path.substr(0, pos))) return false;
        }
    }
    return make_dir(path);
}

// Regular, non-hidden entries of dir
bool list_files(const std::string& dir, std::vector<std::string>& names) {
    DIR* d = ::opendir(dir.c_str());
    if (!d) return false;

    while (struct dirent* ent = ::readdir(d)) {
        if (ent->d_name[0] == '.') continue;
        std::string path = dir + "/" + ent->d_name;
        struct stat st{};
        if (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
            names.push_back(ent->d_name);
        }
    }
    ::closedir(d);
    return true;
}

bool read_all(const std::string& path, std::vector<uint8_t>& out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;

    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        out.reserve(static_cast<size_t>(st.st_size));
    }

    uint8_t buf[65536];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            return false;
        }
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }
    ::close(fd);
    return true;
}

class DirectoryBatch : public Batch {
public:
    DirectoryBatch(std::string cur_path, std::string new_path,
                   std::vector<uint8_t> bytes)
        : cur_path_(std::move(cur_path))
        , new_path_(std::move(new_path))
        , bytes_(std::move(bytes))
        , sealed_(false)
    {
    }

    ~DirectoryBatch() override {
        if (sealed_) return;
        // Unsealed: hand the batch back so it is fetched again
        if (::rename(cur_path_.c_str(), new_path_.c_str()) < 0) {
            std::fprintf(stderr, "  [SPOOL] Failed to release %s: %s\n",
                         cur_path_.c_str(), strerror(errno));
        }
    }

    const uint8_t* data() const override { return bytes_.data(); }
    size_t size() const override { return bytes_.size(); }

    bool seal() override {
        if (sealed_) return false;
        if (::unlink(cur_path_.c_str()) < 0) {
            std::fprintf(stderr, "  [SPOOL] Failed to seal %s: %s\n",
                         cur_path_.c_str(), strerror(errno));
            return false;
        }
        sealed_ = true;
        return true;
    }

private:
    std::string cur_path_;
    std::string new_path_;
    std::vector<uint8_t> bytes_;
    bool sealed_;
};

} // namespace

DirectorySpool::DirectorySpool(const char* root, const char* name, SpoolKind kind)
    : kind_(kind)
    , open_(false)
{
    base_dir_ = std::string(root) + "/" + name + "/" + spool_kind_name(kind);
    new_dir_ = base_dir_ + "/new";
    cur_dir_ = base_dir_ + "/cur";
}

bool DirectorySpool::open() {
    if (!make_dirs(new_dir_) || !make_dirs(cur_dir_)) {
        std::fprintf(stderr, "  [SPOOL] Cannot create spool directories under %s: %s\n",
                     base_dir_.c_str(), strerror(errno));
        return false;
    }

    // Batches claimed by a process that died before sealing them
    std::vector<std::string> stale;
    if (!list_files(cur_dir_, stale)) {
        std::fprintf(stderr, "  [SPOOL] Cannot list %s: %s\n",
                     cur_dir_.c_str(), strerror(errno));
        return false;
    }
    for (const auto& n : stale) {
        std::string from = cur_dir_ + "/" + n;
        std::string to = new_dir_ + "/" + n;
        if (::rename(from.c_str(), to.c_str()) < 0) {
            std::fprintf(stderr, "  [SPOOL] Failed to recover %s: %s\n",
                         from.c_str(), strerror(errno));
            return false;
        }
    }
    if (!stale.empty()) {
        std::printf("  [SPOOL] Recovered %zu unsealed %s batches\n",
                    stale.size(), spool_kind_name(kind_));
    }

    open_ = true;
    return true;
}

std::unique_ptr<Batch> DirectorySpool::next_batch() {
    if (!open_) return nullptr;

    std::vector<std::string> names;
    if (!list_files(new_dir_, names) || names.empty()) {
        return nullptr;
    }

    // Oldest first: writers name batches so they sort by creation
    std::string name = names[0];
    for (const auto& n : names) {
        if (n < name) name = n;
    }

    std::string new_path = new_dir_ + "/" + name;
    std::string cur_path = cur_dir_ + "/" + name;
    if (::rename(new_path.c_str(), cur_path.c_str()) < 0) {
        // Lost a race with another reader; try again next poll
        return nullptr;
    }

    std::vector<uint8_t> bytes;
    if (!read_all(cur_path, bytes)) {
        std::fprintf(stderr, "  [SPOOL] Failed to read %s: %s\n",
                     cur_path.c_str(), strerror(errno));
        if (::rename(cur_path.c_str(), new_path.c_str()) < 0) {
            std::fprintf(stderr, "  [SPOOL] Failed to release %s: %s\n",
                         cur_path.c_str(), strerror(errno));
        }
        return nullptr;
    }

    return std::make_unique<DirectoryBatch>(std::move(cur_path), std::move(new_path),
                                            std::move(bytes));
}

} // namespace marquise
