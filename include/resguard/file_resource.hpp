#ifndef RESGUARD_FILE_RESOURCE_HPP
#define RESGUARD_FILE_RESOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "resguard/clock.hpp"
#include "resguard/error.hpp"
#include "resguard/event.hpp"
#include "resguard/instance_registry.hpp"

// FileResource - a file handle owned by exactly one object
//
// Guarantees:
// - The file is opened in the constructor and closed exactly once, either by
//   release() or by the destructor, whichever runs first
// - Writable modes get a header marker on open and a closing marker on close
// - Every operation on a closed or failed resource is a reported no-op
// - Move only; a moved-from FileResource is closed and uncounted

// @safe
namespace resguard {

enum class FileMode {
    Write,   // truncate
    Read,
    Append,
};

const char* to_string(FileMode mode);

inline bool is_writable(FileMode mode) { return mode != FileMode::Read; }
inline bool is_readable(FileMode mode) { return mode == FileMode::Read; }

struct FileSnapshot {
    std::uint64_t instance_id;
    std::string path;
    FileMode mode;
    TimePoint created_at;
    bool open;
    std::size_t lines_written;
};

class FileResource {
private:
    Registration registration_;
    EventSink* sink_;
    const Clock* clock_;

    std::string path_;
    FileMode mode_;
    TimePoint created_at_;

    std::FILE* handle_;
    bool released_;
    Status acquisition_;
    Status release_outcome_;

    std::vector<std::string> written_;

    void emit(EventType type, std::string detail);
    Status reject(Error error);
    void close_now();

public:
    FileResource(InstanceRegistry& registry, std::string path, FileMode mode, EventSink& sink,
                 const Clock& clock);

    FileResource(const FileResource&) = delete;
    FileResource& operator=(const FileResource&) = delete;

    FileResource(FileResource&& other) noexcept;
    FileResource& operator=(FileResource&& other) noexcept;

    ~FileResource();

    // Ok if the constructor managed to open the file
    // @lifetime: (&'a) -> &'a
    const Status& status() const { return acquisition_; }

    bool is_open() const { return handle_ != nullptr; }
    bool is_released() const { return released_; }

    std::uint64_t id() const { return registration_.id(); }
    // @lifetime: (&'a) -> &'a
    const std::string& path() const { return path_; }
    FileMode mode() const { return mode_; }

    // Appends "HH:MM:SS - text" as one line
    Status write_line(const std::string& text);

    // Whole file from the start; Read mode only
    Outcome<std::string> read_all();

    FileSnapshot describe() const;

    // Lines this instance wrote, header marker included, without newlines
    // @lifetime: (&'a) -> &'a
    const std::vector<std::string>& written_lines() const { return written_; }

    // Idempotent. The first call closes and returns how the close went;
    // later calls return Ok and do nothing.
    Status release();
};

std::string header_marker(TimePoint tp);
std::string closing_marker(TimePoint tp);

} // namespace resguard

#endif // RESGUARD_FILE_RESOURCE_HPP
