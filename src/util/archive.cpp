#include <penv/archive.hpp>
#include <penv/log.hpp>

#include <archive.h>
#include <archive_entry.h>

namespace penv {

namespace {

// Owns one libarchive reader and one disk writer
class ArchivePair {
public:
    ArchivePair() : reader_(archive_read_new()), writer_(archive_write_disk_new()) {}
    ~ArchivePair() {
        if (reader_) {
            archive_read_close(reader_);
            archive_read_free(reader_);
        }
        if (writer_) {
            archive_write_close(writer_);
            archive_write_free(writer_);
        }
    }

    ArchivePair(const ArchivePair&) = delete;
    ArchivePair& operator=(const ArchivePair&) = delete;

    struct archive* reader() { return reader_; }
    struct archive* writer() { return writer_; }
    explicit operator bool() const { return reader_ && writer_; }

private:
    struct archive* reader_;
    struct archive* writer_;
};

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

int copy_data(struct archive* in, struct archive* out) {
    const void* buf;
    size_t size;
    la_int64_t offset;
    for (;;) {
        int r = archive_read_data_block(in, &buf, &size, &offset);
        if (r == ARCHIVE_EOF) return ARCHIVE_OK;
        if (r < ARCHIVE_OK) return r;
        if (archive_write_data_block(out, buf, size, offset) < ARCHIVE_OK) {
            return ARCHIVE_FATAL;
        }
    }
}

} // namespace

Status extract_archive(const std::filesystem::path& archive,
                       const std::filesystem::path& dest_dir) {
    ArchivePair pair;
    if (!pair) {
        return PenvError{PenvError::IO, "failed to initialize libarchive"};
    }

    const int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                      ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                      ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                      ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS;

    archive_read_support_filter_all(pair.reader());
    archive_read_support_format_all(pair.reader());
    archive_write_disk_set_options(pair.writer(), flags);
    archive_write_disk_set_standard_lookup(pair.writer());

    const std::string name = archive.filename().string();
    if (archive_read_open_filename(pair.reader(), archive.c_str(), 32768) != ARCHIVE_OK) {
        return PenvError{PenvError::IO,
            "cannot open " + name + ": " + archive_message(pair.reader())};
    }

    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(pair.reader(), &entry)) == ARCHIVE_OK) {
        std::string entry_path = archive_entry_pathname(entry);
        if (!entry_path.empty() && entry_path.front() == '/') {
            return PenvError{PenvError::IO,
                name + " contains an absolute path: " + entry_path};
        }
        const auto full = dest_dir / entry_path;
        archive_entry_set_pathname(entry, full.c_str());

        if (const char* link = archive_entry_hardlink(entry)) {
            archive_entry_set_hardlink(entry, (dest_dir / link).c_str());
        }

        r = archive_write_header(pair.writer(), entry);
        if (r < ARCHIVE_WARN) {
            return PenvError{PenvError::IO,
                "cannot extract " + entry_path + " from " + name + ": " +
                archive_message(pair.writer())};
        }
        if (r == ARCHIVE_WARN) {
            log::warn("%s: %s", entry_path.c_str(), archive_message(pair.writer()).c_str());
        }

        if (archive_entry_size(entry) > 0) {
            if (copy_data(pair.reader(), pair.writer()) < ARCHIVE_WARN) {
                return PenvError{PenvError::IO,
                    "cannot extract " + entry_path + " from " + name + ": " +
                    archive_message(pair.reader())};
            }
        }

        if (archive_write_finish_entry(pair.writer()) < ARCHIVE_WARN) {
            return PenvError{PenvError::IO,
                "cannot finish " + entry_path + " from " + name + ": " +
                archive_message(pair.writer())};
        }
        log::trace("extracted %s", entry_path.c_str());
    }

    if (r != ARCHIVE_EOF) {
        return PenvError{PenvError::IO,
            "cannot read " + name + ": " + archive_message(pair.reader())};
    }
    return ok_status();
}

} // namespace penv
