/*
 * ScriptCell C++ - Source Loader
 *
 * Resolves the script body from inline text or a named file and enforces
 * the source-size ceiling. Pure I/O and validation; nothing runs here.
 */
#ifndef scriptcell_CORE_SOURCE_LOADER_HPP
#define scriptcell_CORE_SOURCE_LOADER_HPP

#include "outcome.hpp"
#include <string>
#include <cstdint>

namespace scriptcell {

enum class SourceError {
    NONE,
    NOT_FOUND,
    TOO_LARGE,
    UNREADABLE
};

const char* source_error_name(SourceError error);

struct SourceLoadResult {
    bool ok;
    SourceError error;
    std::string message;
    std::string text;       // Resolved source
    std::string origin;     // "<inline>" or the resolved path

    SourceLoadResult() : ok(false), error(SourceError::NONE) {}

    static SourceLoadResult success(const std::string& text, const std::string& origin) {
        SourceLoadResult r;
        r.ok = true;
        r.text = text;
        r.origin = origin;
        return r;
    }

    static SourceLoadResult fail(SourceError error, const std::string& message) {
        SourceLoadResult r;
        r.error = error;
        r.message = message;
        return r;
    }
};

// File-storage collaborator used when a request names a file
class SourceStore {
public:
    virtual ~SourceStore() {}

    // Fetch at most max_bytes. Content larger than that must fail with
    // TOO_LARGE without being read in full.
    virtual SourceLoadResult fetch(const std::string& path, int64_t max_bytes) const = 0;
};

// Local filesystem. With a root directory, relative paths resolve inside it
// and paths escaping it are refused.
class LocalFileStore : public SourceStore {
public:
    explicit LocalFileStore(const std::string& root_dir = "");

    SourceLoadResult fetch(const std::string& path, int64_t max_bytes) const override;

    const std::string& root_dir() const { return root_dir_; }

private:
    std::string resolve(const std::string& path) const;

    std::string root_dir_;
};

class SourceLoader {
public:
    SourceLoader(const SourceStore& store, int64_t max_source_bytes);

    SourceLoadResult load(const ExecutionRequest& request) const;

    int64_t max_source_bytes() const { return max_source_bytes_; }

    static std::string too_large_message(int64_t max_bytes);

private:
    const SourceStore& store_;
    int64_t max_source_bytes_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_SOURCE_LOADER_HPP
