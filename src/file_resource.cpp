#include "resguard/file_resource.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

namespace resguard {

namespace {

const char* fopen_mode(FileMode mode) {
    switch (mode) {
    case FileMode::Write:
        return "w";
    case FileMode::Read:
        return "r";
    case FileMode::Append:
        return "a";
    }
    return "r";
}

std::string errno_text(int err) {
    return std::strerror(err);
}

} // namespace

const char* to_string(FileMode mode) {
    switch (mode) {
    case FileMode::Write:
        return "write";
    case FileMode::Read:
        return "read";
    case FileMode::Append:
        return "append";
    }
    return "unknown";
}

std::string header_marker(TimePoint tp) {
    return "=== File created at " + format_datetime(tp) + " ===";
}

std::string closing_marker(TimePoint tp) {
    return "=== File closed at " + format_datetime(tp) + " ===";
}

FileResource::FileResource(InstanceRegistry& registry, std::string path, FileMode mode,
                           EventSink& sink, const Clock& clock)
    : registration_(registry.enroll(ResourceKind::File)),
      sink_(&sink),
      clock_(&clock),
      path_(std::move(path)),
      mode_(mode),
      created_at_(clock.now()),
      handle_(nullptr),
      released_(false),
      acquisition_(Status::Ok()),
      release_outcome_(Status::Ok()) {
    handle_ = std::fopen(path_.c_str(), fopen_mode(mode_));
    if (handle_ == nullptr) {
        int err = errno;
        acquisition_ = Status::Err(acquisition_failure("cannot open '" + path_ + "' for " +
                                                       to_string(mode_) + ": " + errno_text(err)));
        emit(EventType::AcquisitionFailed, acquisition_.error().message);
        return;
    }

    if (is_writable(mode_)) {
        std::string header = header_marker(created_at_);
        if (std::fprintf(handle_, "%s\n", header.c_str()) < 0) {
            int err = errno;
            std::fclose(handle_);
            handle_ = nullptr;
            acquisition_ = Status::Err(acquisition_failure("cannot write header to '" + path_ +
                                                           "': " + errno_text(err)));
            emit(EventType::AcquisitionFailed, acquisition_.error().message);
            return;
        }
        written_.push_back(std::move(header));
    }

    emit(EventType::Created, std::string("opened in ") + to_string(mode_) + " mode at " +
                                 format_datetime(created_at_));
}

FileResource::FileResource(FileResource&& other) noexcept
    : registration_(std::move(other.registration_)),
      sink_(other.sink_),
      clock_(other.clock_),
      path_(std::move(other.path_)),
      mode_(other.mode_),
      created_at_(other.created_at_),
      handle_(other.handle_),
      released_(other.released_),
      acquisition_(std::move(other.acquisition_)),
      release_outcome_(std::move(other.release_outcome_)),
      written_(std::move(other.written_)) {
    other.handle_ = nullptr;
    other.released_ = true;
}

FileResource& FileResource::operator=(FileResource&& other) noexcept {
    if (this != &other) {
        close_now();
        registration_ = std::move(other.registration_);
        sink_ = other.sink_;
        clock_ = other.clock_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        created_at_ = other.created_at_;
        handle_ = other.handle_;
        released_ = other.released_;
        acquisition_ = std::move(other.acquisition_);
        release_outcome_ = std::move(other.release_outcome_);
        written_ = std::move(other.written_);
        other.handle_ = nullptr;
        other.released_ = true;
    }
    return *this;
}

FileResource::~FileResource() {
    close_now();
}

void FileResource::emit(EventType type, std::string detail) {
    LifecycleEvent event;
    event.type = type;
    event.kind = ResourceKind::File;
    event.instance_id = registration_.id();
    event.target = path_;
    event.detail = std::move(detail);
    event.live_count = registration_.live_count();
    if (sink_ != nullptr) {
        sink_->on_event(event);
    }
}

Status FileResource::reject(Error error) {
    emit(EventType::OperationRejected, error.describe());
    return Status::Err(std::move(error));
}

Status FileResource::write_line(const std::string& text) {
    if (handle_ == nullptr) {
        return reject(invalid_operation("cannot write to '" + path_ + "': file is not open"));
    }
    if (!is_writable(mode_)) {
        return reject(invalid_operation("cannot write to '" + path_ + "': opened in " +
                                        to_string(mode_) + " mode"));
    }

    std::string line = format_time_of_day(clock_->now()) + " - " + text;
    if (std::fprintf(handle_, "%s\n", line.c_str()) < 0) {
        return reject(invalid_operation("write to '" + path_ + "' failed: " + errno_text(errno)));
    }
    written_.push_back(line);
    emit(EventType::Operation, "wrote: " + text);
    return Status::Ok();
}

Outcome<std::string> FileResource::read_all() {
    if (handle_ == nullptr || !is_readable(mode_)) {
        Error error = invalid_operation("cannot read '" + path_ + "': " +
                                        (handle_ == nullptr ? std::string("file is not open")
                                                            : std::string("opened in ") +
                                                                  to_string(mode_) + " mode"));
        emit(EventType::OperationRejected, error.describe());
        return Outcome<std::string>::Err(std::move(error));
    }

    if (std::fseek(handle_, 0, SEEK_SET) != 0) {
        Error error = invalid_operation("cannot rewind '" + path_ + "': " + errno_text(errno));
        emit(EventType::OperationRejected, error.describe());
        return Outcome<std::string>::Err(std::move(error));
    }

    std::string contents;
    char buffer[4096];
    std::size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), handle_)) > 0) {
        contents.append(buffer, n);
    }
    if (std::ferror(handle_)) {
        std::clearerr(handle_);
        Error error = invalid_operation("read from '" + path_ + "' failed");
        emit(EventType::OperationRejected, error.describe());
        return Outcome<std::string>::Err(std::move(error));
    }

    emit(EventType::Operation, "read " + std::to_string(contents.size()) + " bytes");
    return Outcome<std::string>::Ok(std::move(contents));
}

FileSnapshot FileResource::describe() const {
    FileSnapshot snap;
    snap.instance_id = registration_.id();
    snap.path = path_;
    snap.mode = mode_;
    snap.created_at = created_at_;
    snap.open = handle_ != nullptr;
    snap.lines_written = written_.size();
    return snap;
}

Status FileResource::release() {
    if (released_) {
        return Status::Ok();
    }
    close_now();
    return release_outcome_;
}

void FileResource::close_now() {
    if (released_) {
        return;
    }
    released_ = true;

    std::string problem;
    if (handle_ != nullptr) {
        if (is_writable(mode_)) {
            std::string marker = closing_marker(clock_->now());
            if (std::fprintf(handle_, "%s\n", marker.c_str()) < 0) {
                problem = "cannot write closing marker: " + errno_text(errno);
            }
            if (std::fflush(handle_) != 0 && problem.empty()) {
                problem = "flush failed: " + errno_text(errno);
            }
        }
        if (std::fclose(handle_) != 0 && problem.empty()) {
            problem = "close failed: " + errno_text(errno);
        }
        handle_ = nullptr;
    }

    registration_.release();
    std::string summary = std::to_string(written_.size()) + " lines written";
    if (problem.empty()) {
        release_outcome_ = Status::Ok();
        emit(EventType::Released, summary);
    } else {
        Error error = release_failure("'" + path_ + "' " + problem);
        emit(EventType::ReleaseFailed, error.describe() + "; " + summary);
        release_outcome_ = Status::Err(std::move(error));
    }
}

} // namespace resguard
