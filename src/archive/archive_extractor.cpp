#include "archive/archive_extractor.hpp"

#include "archive/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace sysupdate {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown archive error";
}

} // namespace

Result ArchiveExtractor::ExtractFile(const std::string& archive_path, const std::string& dst_dir) const {
    namespace fs = std::filesystem;

    const std::string failed = "Unable to extract " + archive_path + ": ";
    const fs::path base_dir(dst_dir);

    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        return Result::Fail(ErrorCode::ExtractionFailed,
                            failed + "cannot create " + dst_dir + " (" + ec.message() + ")");
    }
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ErrorCode::ExtractionFailed, failed + "destination is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorCode::ExtractionFailed, failed + "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        return Result::Fail(ErrorCode::ExtractionFailed, failed + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(ErrorCode::ExtractionFailed, failed + "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    std::uint64_t entries = 0;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) return Result::Fail(ErrorCode::ExtractionFailed, failed + ArchiveErr(ar.get()));

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return Result::Fail(ErrorCode::ExtractionFailed, failed + path_res.msg);
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return Result::Fail(ErrorCode::ExtractionFailed, failed + hl_res.msg);
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("extract: %s", target_path.c_str());

        if (archive_write_header(aw.get(), entry) != ARCHIVE_OK) {
            return Result::Fail(ErrorCode::ExtractionFailed, failed + ArchiveErr(aw.get()));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Result::Fail(ErrorCode::ExtractionFailed, failed + ArchiveErr(ar.get()));

            if (archive_write_data_block(aw.get(), buff, size, offset) != ARCHIVE_OK) {
                return Result::Fail(ErrorCode::ExtractionFailed, failed + ArchiveErr(aw.get()));
            }
        }

        if (archive_write_finish_entry(aw.get()) != ARCHIVE_OK) {
            return Result::Fail(ErrorCode::ExtractionFailed, failed + ArchiveErr(aw.get()));
        }
        ++entries;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorCode::ExtractionFailed, failed + ArchiveErr(aw.get()));
    }

    LogInfo("Extracted %llu entries from %s into %s",
            (unsigned long long)entries, archive_path.c_str(), dst_dir.c_str());
    return Result::Ok();
}

} // namespace sysupdate
