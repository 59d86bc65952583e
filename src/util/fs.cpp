#include <penv/fs.hpp>
#include <penv/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace penv {

static PenvError errno_error(const std::string& what, const fs::path& path) {
    return PenvError{PenvError::IO,
        what + " '" + path.string() + "': " + strerror(errno)};
}

static void fsync_dir(const fs::path& dir) {
    int fd = open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return;
    fsync(fd);
    close(fd);
}

std::string random_hex(size_t n) {
    static const char digits[] = "0123456789abcdef";
    std::string bytes((n + 1) / 2, '\0');

    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom.is_open() ||
        !urandom.read(&bytes[0], static_cast<std::streamsize>(bytes.size()))) {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        for (auto& b : bytes) b = static_cast<char>(gen() & 0xff);
    }

    std::string out;
    out.reserve(n);
    for (char c : bytes) {
        auto b = static_cast<uint8_t>(c);
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    out.resize(n);
    return out;
}

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Status write_file_atomic(const fs::path& path, const std::string& content) {
    fs::path dir = path.parent_path();
    if (!dir.empty()) PENV_TRY(ensure_dir(dir));

    fs::path tmp = path;
    tmp += ".tmp." + random_hex(8);

    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return errno_error("cannot create", tmp);

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = errno_error("cannot write", tmp);
            close(fd);
            unlink(tmp.c_str());
            return err;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) {
        auto err = errno_error("cannot fsync", tmp);
        close(fd);
        unlink(tmp.c_str());
        return err;
    }
    close(fd);

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        auto err = errno_error("cannot rename into", path);
        unlink(tmp.c_str());
        return err;
    }
    fsync_dir(dir);
    return ok_status();
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return PenvError{PenvError::IO, "cannot open '" + path.string() + "'"};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Status replace_symlink(const fs::path& link, const fs::path& target) {
    fs::path tmp = link;
    tmp += ".tmp." + random_hex(8);

    if (symlink(target.c_str(), tmp.c_str()) != 0) {
        return errno_error("cannot create symlink", tmp);
    }
    if (rename(tmp.c_str(), link.c_str()) != 0) {
        auto err = errno_error("cannot repoint symlink", link);
        unlink(tmp.c_str());
        return err;
    }
    fsync_dir(link.parent_path());
    return ok_status();
}

Status ensure_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return PenvError{PenvError::IO,
            "cannot create directory '" + dir.string() + "': " + ec.message()};
    }
    return ok_status();
}

Status remove_tree(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return PenvError{PenvError::IO,
            "cannot remove '" + path.string() + "': " + ec.message()};
    }
    return ok_status();
}

Result<fs::path> make_unique_dir(const fs::path& parent, const std::string& prefix) {
    PENV_TRY(ensure_dir(parent));
    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path dir = parent / (prefix + "-" + std::to_string(getpid()) + "-" + random_hex(8));
        std::error_code ec;
        if (fs::create_directory(dir, ec)) {
            return Result<fs::path>::ok(std::move(dir));
        }
        if (ec) {
            return PenvError{PenvError::IO,
                "cannot create directory '" + dir.string() + "': " + ec.message()};
        }
    }
    return PenvError{PenvError::IO,
        "cannot allocate a unique directory under '" + parent.string() + "'"};
}

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

Result<FileLock> FileLock::acquire(const fs::path& path) {
    if (!path.parent_path().empty()) PENV_TRY(ensure_dir(path.parent_path()));

    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        auto err = errno_error("cannot open lock file", path);
        err.code = PenvError::Lock;
        return err;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK) {
            auto err = errno_error("cannot lock", path);
            err.code = PenvError::Lock;
            close(fd);
            return err;
        }
        log::info("waiting for lock %s", path.c_str());
        while (flock(fd, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            auto err = errno_error("cannot lock", path);
            err.code = PenvError::Lock;
            close(fd);
            return err;
        }
    }

    log::trace("locked %s", path.c_str());
    return Result<FileLock>::ok(FileLock(fd, path));
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

FileLock::~FileLock() {
    release();
}

void FileLock::release() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }
}

} // namespace penv
