/*
 * ScriptCell C++ - Source Loader Implementation
 */
#include <scriptcell/core/source_loader.hpp>
#include <scriptcell/core/logger.hpp>
#include <scriptcell/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace scriptcell {

const char* source_error_name(SourceError error) {
    switch (error) {
        case SourceError::NOT_FOUND: return "not_found";
        case SourceError::TOO_LARGE: return "too_large";
        case SourceError::UNREADABLE: return "unreadable";
        default: return "none";
    }
}

// ============================================================================
// LocalFileStore
// ============================================================================

LocalFileStore::LocalFileStore(const std::string& root_dir) {
    if (!root_dir.empty()) {
        char resolved[PATH_MAX];
        root_dir_ = realpath(root_dir.c_str(), resolved) ? std::string(resolved) : root_dir;
    }
}

std::string LocalFileStore::resolve(const std::string& path) const {
    if (root_dir_.empty() || path.empty() || path[0] == '/') {
        return path;
    }
    return join_path(root_dir_, path);
}

SourceLoadResult LocalFileStore::fetch(const std::string& path, int64_t max_bytes) const {
    if (path.empty()) {
        return SourceLoadResult::fail(SourceError::NOT_FOUND, "Script file not found: (empty path)");
    }

    std::string full = resolve(path);

    if (!root_dir_.empty()) {
        char resolved[PATH_MAX];
        if (!realpath(full.c_str(), resolved)) {
            if (errno == ENOENT || errno == ENOTDIR) {
                return SourceLoadResult::fail(SourceError::NOT_FOUND, "Script file not found: " + path);
            }
            return SourceLoadResult::fail(SourceError::UNREADABLE,
                "Cannot read script file " + path + ": " + strerror(errno));
        }
        std::string abs(resolved);
        bool inside = abs.size() > root_dir_.size() &&
                      abs.compare(0, root_dir_.size(), root_dir_) == 0 &&
                      abs[root_dir_.size()] == '/';
        if (!inside) {
            LOG_WARN("[SourceLoader] Refusing path outside sources root: %s", path.c_str());
            return SourceLoadResult::fail(SourceError::UNREADABLE,
                "Script file " + path + " is outside the sources directory");
        }
        full = abs;
    }

    int fd = open(full.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return SourceLoadResult::fail(SourceError::NOT_FOUND, "Script file not found: " + path);
        }
        return SourceLoadResult::fail(SourceError::UNREADABLE,
            "Cannot read script file " + path + ": " + strerror(errno));
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        int err = errno;
        close(fd);
        return SourceLoadResult::fail(SourceError::UNREADABLE,
            "Cannot stat script file " + path + ": " + strerror(err));
    }
    if (!S_ISREG(st.st_mode)) {
        close(fd);
        return SourceLoadResult::fail(SourceError::UNREADABLE,
            "Script file " + path + " is not a regular file");
    }
    if (static_cast<int64_t>(st.st_size) > max_bytes) {
        close(fd);
        return SourceLoadResult::fail(SourceError::TOO_LARGE, SourceLoader::too_large_message(max_bytes));
    }

    // Read at most max_bytes + 1 so a file that grew after fstat is still caught
    std::string content;
    content.reserve(static_cast<size_t>(st.st_size));
    char buffer[65536];
    while (static_cast<int64_t>(content.size()) <= max_bytes) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            return SourceLoadResult::fail(SourceError::UNREADABLE,
                "Cannot read script file " + path + ": " + strerror(err));
        }
        if (n == 0) break;
        content.append(buffer, static_cast<size_t>(n));
    }
    close(fd);

    if (static_cast<int64_t>(content.size()) > max_bytes) {
        return SourceLoadResult::fail(SourceError::TOO_LARGE, SourceLoader::too_large_message(max_bytes));
    }

    return SourceLoadResult::success(content, full);
}

// ============================================================================
// SourceLoader
// ============================================================================

SourceLoader::SourceLoader(const SourceStore& store, int64_t max_source_bytes)
    : store_(store)
    , max_source_bytes_(max_source_bytes) {}

std::string SourceLoader::too_large_message(int64_t max_bytes) {
    return "Script exceeds maximum size of " + std::to_string(max_bytes) + " bytes";
}

SourceLoadResult SourceLoader::load(const ExecutionRequest& request) const {
    if (request.is_file) {
        SourceLoadResult r = store_.fetch(request.source, max_source_bytes_);
        if (!r.ok) {
            LOG_INFO("[SourceLoader] Rejected file %s: %s", request.source.c_str(), r.message.c_str());
        }
        return r;
    }

    if (static_cast<int64_t>(request.source.size()) > max_source_bytes_) {
        LOG_INFO("[SourceLoader] Rejected inline source of %zu bytes", request.source.size());
        return SourceLoadResult::fail(SourceError::TOO_LARGE, too_large_message(max_source_bytes_));
    }
    return SourceLoadResult::success(request.source, "<inline>");
}

} // namespace scriptcell
